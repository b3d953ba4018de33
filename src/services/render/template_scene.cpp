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

#include "services/render/template_scene.hpp"

#include "services/geometry/cylinder_unwrap_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace graft_template::services {

namespace {

constexpr double kLabelGapMm = 1.5;
constexpr int kSeamArcSegments = 24;

/**
 * @brief Dashed outline of the part of a circle inside 0 <= x <= C
 *
 * The circle center lies on or beyond one edge; the visible part is the
 * arc on the inner side of that edge, closed by a chord along the edge.
 */
void drawSeamMarker(DrawingSurface& surface, const SurfaceTransform& transform,
                    const PlanarPoint& center, double radiusMm, double circumferenceMm,
                    const LineStyle& style) {
    const bool beyondRight = center.xMm > circumferenceMm / 2.0;
    const double edge = beyondRight ? circumferenceMm : 0.0;
    // Points on the circle at the edge satisfy cos(angle) == reach
    const double reach = std::clamp((edge - center.xMm) / radiusMm, -1.0, 1.0);
    const double edgeAngle = std::acos(reach);

    // Inside part: cos(angle) <= reach beyond the right edge, >= reach beyond the left
    const double start = beyondRight ? edgeAngle : -edgeAngle;
    const double span = beyondRight ? 2.0 * (std::numbers::pi - edgeAngle) : 2.0 * edgeAngle;

    auto pointAt = [&](double angle) {
        return PlanarPoint(center.xMm + radiusMm * std::cos(angle),
                           center.yMm + radiusMm * std::sin(angle));
    };

    PlanarPoint previous = pointAt(start);
    const PlanarPoint first = previous;
    for (int i = 1; i <= kSeamArcSegments; ++i) {
        const PlanarPoint next = pointAt(start + span * i / kSeamArcSegments);
        surface.drawLine(transform.apply(previous), transform.apply(next), style);
        previous = next;
    }
    surface.drawLine(transform.apply(previous), transform.apply(first), style);
}

}  // anonymous namespace

TemplateScene::TemplateScene(const GraftSpecification& graft,
                             const FenestrationRegistry& registry)
    : graft_(graft)
    , registry_(registry)
    , markers_(CalibrationMarkerSet::generate(graft))
{
}

std::vector<FenestrationPlacement>
TemplateScene::placements(const SurfaceTransform& transform) const {
    std::vector<FenestrationPlacement> result;
    result.reserve(registry_.size());

    for (std::size_t i = 0; i < registry_.size(); ++i) {
        const auto& fenestration = registry_.at(i);
        FenestrationPlacement placement;
        placement.index = i;
        placement.fenestration = fenestration;
        placement.centerMm = CylinderUnwrapMapper::map(graft_, fenestration);
        placement.radiusMm = fenestration.radiusMm();
        placement.center = transform.apply(placement.centerMm);
        placement.radius = transform.length(placement.radiusMm);

        const double circumference = graft_.circumferenceMm();
        if (placement.centerMm.xMm - placement.radiusMm < 0.0) {
            placement.seamCenterMm = PlanarPoint(placement.centerMm.xMm + circumference,
                                                 placement.centerMm.yMm);
        } else if (placement.centerMm.xMm + placement.radiusMm > circumference) {
            placement.seamCenterMm = PlanarPoint(placement.centerMm.xMm - circumference,
                                                 placement.centerMm.yMm);
        }
        placement.labelOnLeft = placement.centerMm.xMm > circumference / 2.0;
        result.push_back(placement);
    }
    return result;
}

void TemplateScene::drawOutline(DrawingSurface& surface, const SurfaceTransform& transform,
                                const SceneStyle& style) const {
    ShapeStyle outline;
    outline.stroke = LineStyle{colors::Black, transform.length(style.outlineWidthMm), false};
    outline.fill = style.outlineFill;

    surface.drawRect(transform.apply(PlanarPoint(0.0, 0.0)),
                     transform.length(graft_.circumferenceMm()),
                     transform.length(graft_.lengthMm()),
                     outline);
}

void TemplateScene::drawCalibration(DrawingSurface& surface, const SurfaceTransform& transform,
                                    const SceneStyle& style) const {
    const double circumference = graft_.circumferenceMm();
    const double length = graft_.lengthMm();

    TextStyle smallText;
    smallText.height = transform.length(style.smallTextHeightMm);

    // Longitudinal grid
    const LineStyle gridStyle{colors::Grid, transform.length(style.gridWidthMm), false};
    for (const auto& line : markers_.gridLines) {
        surface.drawLine(transform.apply(PlanarPoint(0.0, line.yMm)),
                         transform.apply(PlanarPoint(circumference, line.yMm)),
                         gridStyle);
        TextStyle labelStyle = smallText;
        labelStyle.align = TextAlign::Right;
        surface.drawText(transform.apply(line.labelPosition), line.label, labelStyle);
    }

    // Device landmarks
    const LineStyle alignmentStyle{colors::Gold, transform.length(style.alignmentWidthMm), false};
    for (double y : markers_.alignmentLinesMm) {
        surface.drawLine(transform.apply(PlanarPoint(0.0, y)),
                         transform.apply(PlanarPoint(circumference, y)),
                         alignmentStyle);
    }

    // Clock guides
    const LineStyle guideStyle{colors::ClockGuide, transform.length(style.guideWidthMm), true};
    for (const auto& guide : markers_.clockGuides) {
        surface.drawLine(transform.apply(PlanarPoint(guide.xMm, 0.0)),
                         transform.apply(PlanarPoint(guide.xMm, length)),
                         guideStyle);
        TextStyle labelStyle = smallText;
        labelStyle.color = colors::ClockGuide;
        labelStyle.align = TextAlign::Center;
        surface.drawText(transform.apply(guide.labelPosition),
                         std::format("{}", guide.hour), labelStyle);
    }

    // 10 mm verification bars with end ticks
    const LineStyle barStyle{colors::Black, transform.length(style.referenceBarWidthMm), false};
    const double tickMm = 1.0;
    for (const auto& bar : markers_.referenceBars) {
        surface.drawLine(transform.apply(bar.start), transform.apply(bar.end), barStyle);
        for (const auto& end : {bar.start, bar.end}) {
            if (bar.horizontal) {
                surface.drawLine(transform.apply(PlanarPoint(end.xMm, end.yMm - tickMm)),
                                 transform.apply(PlanarPoint(end.xMm, end.yMm + tickMm)),
                                 barStyle);
            } else {
                surface.drawLine(transform.apply(PlanarPoint(end.xMm - tickMm, end.yMm)),
                                 transform.apply(PlanarPoint(end.xMm + tickMm, end.yMm)),
                                 barStyle);
            }
        }
        TextStyle labelStyle = smallText;
        labelStyle.align = bar.horizontal ? TextAlign::Center : TextAlign::Left;
        surface.drawText(transform.apply(bar.labelPosition), bar.label, labelStyle);
    }

    // End labels
    TextStyle endStyle;
    endStyle.height = transform.length(style.textHeightMm);
    endStyle.bold = true;
    surface.drawText(transform.apply(markers_.proximalLabel.position),
                     markers_.proximalLabel.text, endStyle);
    surface.drawText(transform.apply(markers_.distalLabel.position),
                     markers_.distalLabel.text, endStyle);
}

std::vector<FenestrationPlacement>
TemplateScene::drawFenestrations(DrawingSurface& surface, const SurfaceTransform& transform,
                                 const SceneStyle& style) const {
    auto drawn = placements(transform);

    for (const auto& placement : drawn) {
        const auto info = vesselInfo(placement.fenestration.vessel);

        ShapeStyle disc;
        disc.stroke = LineStyle{colors::Black, transform.length(style.fenestrationStrokeMm), false};
        disc.fill = info.color.withAlpha(style.fenestrationAlpha);
        surface.drawCircle(placement.center, placement.radius, disc);

        if (placement.seamCenterMm) {
            const LineStyle seamStyle{info.color, transform.length(style.fenestrationStrokeMm * 2.0),
                                      true};
            drawSeamMarker(surface, transform, *placement.seamCenterMm, placement.radiusMm,
                           graft_.circumferenceMm(), seamStyle);
        }

        // Right-half labels point inward so they stay clear of the bar column
        const double textX = placement.labelOnLeft
            ? placement.centerMm.xMm - placement.radiusMm - kLabelGapMm
            : placement.centerMm.xMm + placement.radiusMm + kLabelGapMm;
        const TextAlign align = placement.labelOnLeft ? TextAlign::Right : TextAlign::Left;

        // Keep the label below the clock labels above the outline
        const double labelY = std::max(placement.centerMm.yMm - style.textHeightMm * 0.55,
                                       style.textHeightMm * 0.5);
        const double annotationY = labelY + style.textHeightMm * 0.55
                                   + style.smallTextHeightMm * 0.7;

        TextStyle labelStyle;
        labelStyle.height = transform.length(style.textHeightMm);
        labelStyle.bold = true;
        labelStyle.color = info.color;
        labelStyle.align = align;
        surface.drawText(transform.apply(PlanarPoint(textX, labelY)),
                         std::format("F{} {}", placement.index + 1, info.shortLabel),
                         labelStyle);

        TextStyle annotationStyle;
        annotationStyle.height = transform.length(style.smallTextHeightMm);
        annotationStyle.align = align;
        surface.drawText(transform.apply(PlanarPoint(textX, annotationY)),
                         formatAnnotation(placement.fenestration),
                         annotationStyle);
    }

    return drawn;
}

}  // namespace graft_template::services
