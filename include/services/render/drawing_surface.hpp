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
 * @file drawing_surface.hpp
 * @brief Drawing-primitive interface the template renderers issue calls to
 * @details Implementations: PainterSurface (QPainter on a widget or a PDF
 *          writer) and RecordingSurface (keeps the calls for inspection).
 *          Coordinates and sizes are in the surface's own units; the
 *          renderer chooses them through a SurfaceTransform.
 */

#pragma once

#include "services/geometry/geometry_types.hpp"
#include "services/render/render_types.hpp"

#include <string>

namespace graft_template::services {

class DrawingSurface {
public:
    virtual ~DrawingSurface() = default;

    virtual void drawLine(const SurfacePoint& from, const SurfacePoint& to,
                          const LineStyle& style) = 0;

    virtual void drawCircle(const SurfacePoint& center, double radius,
                            const ShapeStyle& style) = 0;

    /**
     * @param origin Top-left corner
     */
    virtual void drawRect(const SurfacePoint& origin, double width, double height,
                          const ShapeStyle& style) = 0;

    /**
     * @param text UTF-8 text
     */
    virtual void drawText(const SurfacePoint& position, const std::string& text,
                          const TextStyle& style) = 0;
};

}  // namespace graft_template::services
