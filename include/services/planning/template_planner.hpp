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
 * @file template_planner.hpp
 * @brief Command surface for planning and exporting a fenestration template
 * @details TemplatePlanner turns user requests (device label, vessel key,
 *          position, size) into validated model mutations on a caller-owned
 *          PlanningSession, and runs the preview and document renderers
 *          over it. Every mutating command either succeeds completely or
 *          leaves the session untouched.
 *
 * ## Thread Safety
 * - Stateless apart from the device catalog; a session must only be used
 *   from one thread at a time
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/catalog/device_catalog.hpp"
#include "services/export/document_renderer.hpp"
#include "services/export/document_sink.hpp"
#include "services/export/pdf_document_sink.hpp"
#include "services/planning/planning_session.hpp"
#include "services/render/drawing_surface.hpp"
#include "services/render/preview_renderer.hpp"
#include "services/template_error.hpp"

#include <cstddef>
#include <expected>
#include <string>

namespace graft_template::services {

/**
 * @brief Fenestration as entered by the user
 */
struct FenestrationRequest {
    /// Vessel short label or display name, e.g. "SMA"
    std::string vesselKey;
    double distanceFromProximalMm = 0.0;
    int clockHour = 12;
    double diameterMm = 6.0;
};

class TemplatePlanner {
public:
    explicit TemplatePlanner(DeviceCatalog catalog = DeviceCatalog::builtin(),
                             DocumentOptions documentOptions = {},
                             PdfSinkOptions pdfOptions = {});

    /**
     * @brief Open a session on a catalog device
     * @return Session with an empty layout, or InvalidParameter for an unknown label
     */
    [[nodiscard]] std::expected<PlanningSession, TemplateError>
    startSession(const std::string& deviceLabel) const;

    /**
     * @brief Switch the session to another device
     *
     * Planned fenestrations are discarded because their positions were
     * validated against the old geometry.
     */
    [[nodiscard]] std::expected<void, TemplateError>
    selectDevice(PlanningSession& session, const std::string& deviceLabel) const;

    /**
     * @brief Validate and append a fenestration
     * @return Index of the new entry; InvalidParameter or SpacingConflict otherwise
     */
    [[nodiscard]] std::expected<std::size_t, TemplateError>
    addFenestration(PlanningSession& session, const FenestrationRequest& request) const;

    [[nodiscard]] std::expected<std::size_t, TemplateError>
    addFenestration(PlanningSession& session, const Fenestration& fenestration) const;

    /**
     * @brief Remove the entry at @p index
     * @return The removed fenestration, or IndexOutOfRange
     */
    [[nodiscard]] std::expected<Fenestration, TemplateError>
    removeFenestration(PlanningSession& session, std::size_t index) const;

    /**
     * @brief Remove every planned fenestration
     * @return Number of removed entries
     */
    std::size_t clearFenestrations(PlanningSession& session) const;

    /**
     * @brief Draw the current layout into a preview surface
     */
    [[nodiscard]] PreviewResult renderPreview(const PlanningSession& session,
                                              DrawingSurface& surface,
                                              const PreviewViewport& viewport) const;

    /**
     * @brief Produce the printable PDF template
     */
    [[nodiscard]] std::expected<TemplateArtifact, TemplateError>
    exportDocument(const PlanningSession& session) const;

    /**
     * @brief Produce the template through a caller-supplied sink
     */
    [[nodiscard]] std::expected<TemplateArtifact, TemplateError>
    exportDocument(const PlanningSession& session, DocumentSink& sink) const;

    [[nodiscard]] const DeviceCatalog& catalog() const noexcept { return catalog_; }
    void setCatalog(DeviceCatalog catalog);

    [[nodiscard]] const DocumentRenderer& documentRenderer() const noexcept {
        return documentRenderer_;
    }

private:
    [[nodiscard]] std::expected<GraftSpecification, TemplateError>
    resolveDevice(const std::string& deviceLabel) const;

    DeviceCatalog catalog_;
    PreviewRenderer previewRenderer_;
    DocumentRenderer documentRenderer_;
    PdfSinkOptions pdfOptions_;
};

}  // namespace graft_template::services
