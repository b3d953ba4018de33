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
 * @file painter_surface.hpp
 * @brief DrawingSurface implemented on QPainter
 * @details Works on any QPaintDevice the painter is active on: the preview
 *          widget, an offscreen QImage, or a QPdfWriter page. The painter's
 *          current transform defines the surface units; the PDF sink scales
 *          it so one unit is one millimeter.
 *
 * ## Thread Safety
 * - Same rules as the wrapped QPainter
 */

#pragma once

#include "services/render/drawing_surface.hpp"

#include <QColor>

class QPainter;

namespace graft_template::services {

/**
 * @brief Convert a RgbColor to QColor
 */
[[nodiscard]] QColor toQColor(const RgbColor& color);

class PainterSurface : public DrawingSurface {
public:
    /**
     * @param painter Active painter; must outlive the surface
     */
    explicit PainterSurface(QPainter& painter);
    ~PainterSurface() override;

    PainterSurface(const PainterSurface&) = delete;
    PainterSurface& operator=(const PainterSurface&) = delete;

    void drawLine(const SurfacePoint& from, const SurfacePoint& to,
                  const LineStyle& style) override;
    void drawCircle(const SurfacePoint& center, double radius,
                    const ShapeStyle& style) override;
    void drawRect(const SurfacePoint& origin, double width, double height,
                  const ShapeStyle& style) override;
    void drawText(const SurfacePoint& position, const std::string& text,
                  const TextStyle& style) override;

private:
    void applyShapeStyle(const ShapeStyle& style);

    QPainter& painter_;
};

}  // namespace graft_template::services
