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

#include "services/render/painter_surface.hpp"

#include <QFont>
#include <QFontMetricsF>
#include <QPainter>
#include <QPen>

namespace graft_template::services {

namespace {

// Fonts are laid out at this pixel size and then scaled to the requested
// height, so text size does not depend on the device resolution.
constexpr int kReferencePixelSize = 100;
constexpr const char* kFontFamily = "Arial";

QPen makePen(const LineStyle& style) {
    QPen pen(toQColor(style.color));
    pen.setWidthF(style.width);
    // Flat caps keep stroked lengths exact (a 10 mm bar stays 10 mm)
    pen.setCapStyle(Qt::FlatCap);
    pen.setJoinStyle(Qt::MiterJoin);
    pen.setStyle(style.dashed ? Qt::DashLine : Qt::SolidLine);
    return pen;
}

}  // anonymous namespace

QColor toQColor(const RgbColor& color) {
    return QColor(color.r, color.g, color.b, color.a);
}

PainterSurface::PainterSurface(QPainter& painter)
    : painter_(painter)
{
}

PainterSurface::~PainterSurface() = default;

void PainterSurface::applyShapeStyle(const ShapeStyle& style) {
    painter_.setPen(makePen(style.stroke));
    if (style.fill) {
        painter_.setBrush(toQColor(*style.fill));
    } else {
        painter_.setBrush(Qt::NoBrush);
    }
}

void PainterSurface::drawLine(const SurfacePoint& from, const SurfacePoint& to,
                              const LineStyle& style) {
    painter_.setPen(makePen(style));
    painter_.drawLine(QPointF(from.x, from.y), QPointF(to.x, to.y));
}

void PainterSurface::drawCircle(const SurfacePoint& center, double radius,
                                const ShapeStyle& style) {
    applyShapeStyle(style);
    painter_.drawEllipse(QPointF(center.x, center.y), radius, radius);
}

void PainterSurface::drawRect(const SurfacePoint& origin, double width, double height,
                              const ShapeStyle& style) {
    applyShapeStyle(style);
    painter_.drawRect(QRectF(origin.x, origin.y, width, height));
}

void PainterSurface::drawText(const SurfacePoint& position, const std::string& text,
                              const TextStyle& style) {
    QFont font(kFontFamily);
    font.setPixelSize(kReferencePixelSize);
    font.setBold(style.bold);

    const QString label = QString::fromStdString(text);
    const QFontMetricsF metrics(font, painter_.device());
    if (metrics.height() <= 0.0) {
        return;
    }
    const double scale = style.height / metrics.height();
    const double width = metrics.horizontalAdvance(label);

    double x = 0.0;
    switch (style.align) {
        case TextAlign::Left: x = 0.0; break;
        case TextAlign::Center: x = -width / 2.0; break;
        case TextAlign::Right: x = -width; break;
    }
    // Baseline that centers the ascent/descent box on the anchor
    const double baseline = (metrics.ascent() - metrics.descent()) / 2.0;

    painter_.save();
    painter_.translate(position.x, position.y);
    painter_.scale(scale, scale);
    painter_.setFont(font);
    painter_.setPen(toQColor(style.color));
    painter_.drawText(QPointF(x, baseline), label);
    painter_.restore();
}

}  // namespace graft_template::services
