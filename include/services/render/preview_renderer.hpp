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
 * @file preview_renderer.hpp
 * @brief Interactive on-screen rendering of the unwrapped template
 * @details Fits the whole template (outline plus calibration annotations)
 *          into a pixel viewport with one uniform scale, proximal end at
 *          the top. An empty layout is reported as NoData and nothing is
 *          drawn, so the caller can show its own placeholder.
 *
 * ## Thread Safety
 * - render() is const and does not touch the model; surfaces follow their
 *   own rules (QPainter: UI thread only)
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/geometry/geometry_types.hpp"
#include "services/planning/fenestration_registry.hpp"
#include "services/planning/graft_specification.hpp"
#include "services/render/drawing_surface.hpp"
#include "services/render/template_scene.hpp"

#include <vector>

namespace graft_template::services {

enum class PreviewStatus {
    Rendered,  ///< Template and fenestrations were drawn
    NoData     ///< Registry is empty; nothing was drawn
};

/**
 * @brief Pixel area available to the preview
 */
struct PreviewViewport {
    double widthPx = 0.0;
    double heightPx = 0.0;
    double marginPx = 12.0;
};

struct PreviewResult {
    PreviewStatus status = PreviewStatus::NoData;

    /// Template mm to viewport pixels (valid for Rendered)
    SurfaceTransform transform;

    std::vector<FenestrationPlacement> placements;

    [[nodiscard]] bool hasData() const noexcept {
        return status == PreviewStatus::Rendered;
    }
};

class PreviewRenderer {
public:
    PreviewRenderer();
    explicit PreviewRenderer(SceneStyle style);

    /**
     * @brief Uniform scale and offset that center @p bounds in the viewport
     *
     * Returns a zero-scale transform when the viewport has no room left
     * after the margins.
     */
    [[nodiscard]] static SurfaceTransform fitTransform(const PlanarRect& bounds,
                                                       const PreviewViewport& viewport);

    /**
     * @brief Draw the template for the current layout
     * @return NoData for an empty registry, Rendered otherwise
     */
    [[nodiscard]] PreviewResult render(const GraftSpecification& graft,
                                       const FenestrationRegistry& registry,
                                       DrawingSurface& surface,
                                       const PreviewViewport& viewport) const;

    [[nodiscard]] const SceneStyle& style() const noexcept { return style_; }

    /// Scene style the preview uses by default (gray template background)
    [[nodiscard]] static SceneStyle defaultStyle();

private:
    SceneStyle style_;
};

}  // namespace graft_template::services
