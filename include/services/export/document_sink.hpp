// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file document_sink.hpp
 * @brief Export collaborator for the fixed-scale template document
 * @details A sink opens one page of a given physical size, hands out a
 *          DrawingSurface whose units are millimeters on that page, and
 *          turns the finished page into downloadable bytes. The renderer
 *          never writes files itself.
 */

#pragma once

#include "services/geometry/geometry_types.hpp"
#include "services/render/drawing_surface.hpp"
#include "services/render/template_scene.hpp"
#include "services/template_error.hpp"

#include <QByteArray>

#include <expected>
#include <string>
#include <vector>

namespace graft_template::services {

/**
 * @brief Physical page size
 */
struct PageSpec {
    std::string name;
    double widthMm = 0.0;
    double heightMm = 0.0;

    [[nodiscard]] bool isLandscape() const noexcept { return widthMm > heightMm; }
};

/**
 * @brief Finished document returned to the export collaborator
 */
struct TemplateArtifact {
    QByteArray data;
    std::string mimeType;
    std::string suggestedFileName;
    PageSpec page;

    /// True when the template was generated without fenestrations
    bool layoutEmpty = false;

    /// Template mm to page mm (unit scale, origin offset only)
    SurfaceTransform templateTransform;

    /// Fenestrations as placed on the page, in registry order
    std::vector<FenestrationPlacement> placements;
};

class DocumentSink {
public:
    virtual ~DocumentSink() = default;

    /**
     * @brief Start a single-page document
     * @param page Physical page size
     * @return Surface in page millimeters (origin top-left), owned by the sink
     *         and valid until finalize()
     */
    [[nodiscard]] virtual std::expected<DrawingSurface*, TemplateError>
    beginDocument(const PageSpec& page) = 0;

    /**
     * @brief Close the document and return its bytes
     */
    [[nodiscard]] virtual std::expected<QByteArray, TemplateError> finalize() = 0;

    [[nodiscard]] virtual std::string mimeType() const = 0;
};

}  // namespace graft_template::services
