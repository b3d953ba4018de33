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

#include "services/render/preview_renderer.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <utility>

namespace graft_template::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("PreviewRenderer");
    return logger;
}

}  // anonymous namespace

PreviewRenderer::PreviewRenderer()
    : style_(defaultStyle())
{
}

PreviewRenderer::PreviewRenderer(SceneStyle style)
    : style_(std::move(style))
{
}

SceneStyle PreviewRenderer::defaultStyle() {
    SceneStyle style;
    style.outlineFill = colors::Canvas;
    style.fenestrationAlpha = 180;
    return style;
}

SurfaceTransform PreviewRenderer::fitTransform(const PlanarRect& bounds,
                                               const PreviewViewport& viewport) {
    const double availableWidth = viewport.widthPx - 2.0 * viewport.marginPx;
    const double availableHeight = viewport.heightPx - 2.0 * viewport.marginPx;

    SurfaceTransform transform;
    if (availableWidth <= 0.0 || availableHeight <= 0.0 ||
        bounds.widthMm() <= 0.0 || bounds.heightMm() <= 0.0) {
        transform.unitsPerMm = 0.0;
        return transform;
    }

    const double scale = std::min(availableWidth / bounds.widthMm(),
                                  availableHeight / bounds.heightMm());

    transform.unitsPerMm = scale;
    transform.originX = viewport.marginPx
                        + (availableWidth - bounds.widthMm() * scale) / 2.0
                        - bounds.minXMm * scale;
    transform.originY = viewport.marginPx
                        + (availableHeight - bounds.heightMm() * scale) / 2.0
                        - bounds.minYMm * scale;
    return transform;
}

PreviewResult PreviewRenderer::render(const GraftSpecification& graft,
                                      const FenestrationRegistry& registry,
                                      DrawingSurface& surface,
                                      const PreviewViewport& viewport) const {
    PreviewResult result;
    if (registry.empty()) {
        result.status = PreviewStatus::NoData;
        return result;
    }

    TemplateScene scene(graft, registry);
    result.transform = fitTransform(scene.bounds(), viewport);
    if (result.transform.unitsPerMm <= 0.0) {
        // Viewport collapsed; positions are still reported for hit testing
        result.status = PreviewStatus::Rendered;
        result.placements = scene.placements(result.transform);
        return result;
    }

    scene.drawOutline(surface, result.transform, style_);
    scene.drawCalibration(surface, result.transform, style_);
    result.placements = scene.drawFenestrations(surface, result.transform, style_);
    result.status = PreviewStatus::Rendered;

    getLogger()->trace("Preview rendered: {} fenestrations at {:.3f} px/mm",
                       result.placements.size(), result.transform.unitsPerMm);
    return result;
}

}  // namespace graft_template::services
