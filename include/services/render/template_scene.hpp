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
 * @file template_scene.hpp
 * @brief Template content shared by the preview and the printable document
 * @details Draws the unwrapped outline, the calibration markers and the
 *          fenestrations of one graft through a SurfaceTransform. Both
 *          renderers go through this class, so any geometric difference
 *          between preview and print can only come from the transform.
 *          Stroke widths and text heights are specified in millimeters for
 *          the same reason.
 */

#pragma once

#include "services/geometry/calibration_marker_set.hpp"
#include "services/geometry/geometry_types.hpp"
#include "services/planning/fenestration_registry.hpp"
#include "services/planning/graft_specification.hpp"
#include "services/render/drawing_surface.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace graft_template::services {

/**
 * @brief Stroke widths, text heights (mm) and fills of the template content
 */
struct SceneStyle {
    double outlineWidthMm = 0.4;
    double gridWidthMm = 0.15;
    double alignmentWidthMm = 0.6;
    double guideWidthMm = 0.2;
    double referenceBarWidthMm = 0.5;
    double fenestrationStrokeMm = 0.2;
    double textHeightMm = 3.0;
    double smallTextHeightMm = 2.2;

    /// Fill of the outline rectangle (none on paper)
    std::optional<RgbColor> outlineFill;

    /// Fill opacity of fenestration discs
    std::uint8_t fenestrationAlpha = 200;
};

/**
 * @brief Where one fenestration ended up
 */
struct FenestrationPlacement {
    std::size_t index = 0;
    Fenestration fenestration;

    /// Mapper output (template mm)
    PlanarPoint centerMm;
    double radiusMm = 0.0;

    /// centerMm / radiusMm after the surface transform
    SurfacePoint center;
    double radius = 0.0;

    /// Center of the same hole seen across the 12 o'clock seam (centerMm.x +/- C),
    /// set when the disc crosses x = 0 or x = C
    std::optional<PlanarPoint> seamCenterMm;

    /// Labels sit left of the disc (discs in the right half of the outline)
    bool labelOnLeft = false;
};

class TemplateScene {
public:
    /**
     * @param graft Graft geometry; must outlive the scene
     * @param registry Planned fenestrations; must outlive the scene
     */
    TemplateScene(const GraftSpecification& graft, const FenestrationRegistry& registry);

    [[nodiscard]] const CalibrationMarkers& markers() const noexcept { return markers_; }

    /// Extent of the full drawing in template mm
    [[nodiscard]] const PlanarRect& bounds() const noexcept { return markers_.bounds; }

    /**
     * @brief Mapper positions of all fenestrations, in registry order
     */
    [[nodiscard]] std::vector<FenestrationPlacement>
    placements(const SurfaceTransform& transform) const;

    /**
     * @brief circumference x length rectangle, origin at the proximal 12 o'clock corner
     */
    void drawOutline(DrawingSurface& surface, const SurfaceTransform& transform,
                     const SceneStyle& style) const;

    void drawCalibration(DrawingSurface& surface, const SurfaceTransform& transform,
                         const SceneStyle& style) const;

    /**
     * @brief One filled circle per fenestration plus its labels
     *
     * A disc crossing the seam also gets a dashed outline of its wrapped
     * part at the opposite edge, drawn with line segments only.
     *
     * @return The placements that were drawn
     */
    std::vector<FenestrationPlacement>
    drawFenestrations(DrawingSurface& surface, const SurfaceTransform& transform,
                      const SceneStyle& style) const;

private:
    const GraftSpecification& graft_;
    const FenestrationRegistry& registry_;
    CalibrationMarkers markers_;
};

}  // namespace graft_template::services
