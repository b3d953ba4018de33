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

#include "services/export/document_renderer.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace graft_template::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DocumentRenderer");
    return logger;
}

constexpr double kTitleHeightMm = 5.0;
constexpr double kSubtitleHeightMm = 3.0;
constexpr double kInstructionHeightMm = 2.8;
constexpr double kNoticeHeightMm = 4.0;
constexpr double kBlockGapMm = 4.0;

}  // anonymous namespace

DocumentRenderer::DocumentRenderer()
    : style_(defaultStyle())
{
}

DocumentRenderer::DocumentRenderer(DocumentOptions options, SceneStyle style)
    : options_(std::move(options))
    , style_(std::move(style))
{
}

SceneStyle DocumentRenderer::defaultStyle() {
    SceneStyle style;
    style.outlineFill.reset();
    style.fenestrationAlpha = 200;
    return style;
}

std::vector<PageSpec> DocumentRenderer::standardPages() {
    return {
        {"A4", 210.0, 297.0},
        {"A4", 297.0, 210.0},
        {"A3", 297.0, 420.0},
        {"A3", 420.0, 297.0},
    };
}

PageSpec DocumentRenderer::choosePage(double widthMm, double heightMm) {
    for (const auto& page : standardPages()) {
        if (widthMm <= page.widthMm && heightMm <= page.heightMm) {
            return page;
        }
    }
    return {"Custom", std::ceil(widthMm), std::ceil(heightMm)};
}

std::string DocumentRenderer::suggestedFileName(const GraftSpecification& graft) {
    return std::format("graft_template_{:g}mm_{:g}mm.pdf",
                       graft.diameterMm(), graft.lengthMm());
}

std::vector<std::string>
DocumentRenderer::instructionLines(const GraftSpecification& graft) const {
    return {
        "INSTRUCTIONS",
        "1. Print at 100 % scale with page scaling disabled.",
        "2. Measure both 10 mm bars. If either is not exactly 10 mm, discard and reprint.",
        std::format("3. Cut along the solid outline: {:.1f} mm (circumference) x {:g} mm (length).",
                    graft.circumferenceMm(), graft.lengthMm()),
        "4. Place the 12 o'clock edge on the anterior midline, PROXIMAL end toward the proximal graft end.",
        "5. Wrap the template around the graft so both edges meet at 12 o'clock.",
        std::format("6. The wrapped template must fit a graft of {:g} mm diameter without overlap.",
                    graft.diameterMm()),
        "7. Mark each fenestration through the template, then remove the template.",
        "8. Sterilize the template per institutional protocol before use in the sterile field.",
    };
}

double DocumentRenderer::instructionBlockHeightMm(const GraftSpecification& graft) const {
    if (!options_.includeInstructions) {
        return 0.0;
    }
    // Instruction lines, a spacer line and the disclaimer
    const auto lines = instructionLines(graft).size() + 2;
    return kBlockGapMm + static_cast<double>(lines) * kInstructionLineMm;
}

PageSpec DocumentRenderer::pageFor(const GraftSpecification& graft) const {
    const auto bounds = CalibrationMarkerSet::generate(graft).bounds;
    const double width = bounds.widthMm() + 2.0 * options_.marginMm;
    const double height = 2.0 * options_.marginMm + kTitleBlockMm
                          + bounds.heightMm() + instructionBlockHeightMm(graft);
    return choosePage(width, height);
}

std::expected<TemplateArtifact, TemplateError>
DocumentRenderer::render(const GraftSpecification& graft,
                         const FenestrationRegistry& registry,
                         DocumentSink& sink) const {
    TemplateScene scene(graft, registry);
    const PlanarRect& bounds = scene.bounds();
    const PageSpec page = pageFor(graft);

    getLogger()->info("Rendering template for {} on {} ({:g} x {:g} mm), {} fenestrations",
                      graft.name(), page.name, page.widthMm, page.heightMm, registry.size());

    auto surfaceResult = sink.beginDocument(page);
    if (!surfaceResult) {
        getLogger()->error("Document sink failed to start: {}",
                           surfaceResult.error().toString());
        return std::unexpected(surfaceResult.error());
    }
    DrawingSurface& surface = **surfaceResult;

    const double left = options_.marginMm;
    const double top = options_.marginMm;

    // Title block
    TextStyle titleStyle;
    titleStyle.height = kTitleHeightMm;
    titleStyle.bold = true;
    surface.drawText(SurfacePoint(left, top + kTitleHeightMm / 2.0),
                     std::format("Fenestration template - {}", graft.name()), titleStyle);

    TextStyle subtitleStyle;
    subtitleStyle.height = kSubtitleHeightMm;
    surface.drawText(
        SurfacePoint(left, top + kTitleHeightMm + 2.0 + kSubtitleHeightMm / 2.0),
        std::format("Graft Ø{:g} mm x {:g} mm, circumference {:.2f} mm",
                    graft.diameterMm(), graft.lengthMm(), graft.circumferenceMm()),
        subtitleStyle);

    // Template in true millimeters: unit scale, shifted below the title
    SurfaceTransform transform;
    transform.unitsPerMm = 1.0;
    transform.originX = left - bounds.minXMm;
    transform.originY = top + kTitleBlockMm - bounds.minYMm;

    scene.drawOutline(surface, transform, style_);
    scene.drawCalibration(surface, transform, style_);

    TemplateArtifact artifact;
    artifact.page = page;
    artifact.templateTransform = transform;
    artifact.layoutEmpty = registry.empty();

    if (artifact.layoutEmpty) {
        TextStyle noticeStyle;
        noticeStyle.height = kNoticeHeightMm;
        noticeStyle.bold = true;
        noticeStyle.color = colors::Notice;
        noticeStyle.align = TextAlign::Center;
        surface.drawText(
            transform.apply(PlanarPoint(graft.circumferenceMm() / 2.0, graft.lengthMm() / 2.0)),
            kEmptyLayoutNotice, noticeStyle);
    } else {
        artifact.placements = scene.drawFenestrations(surface, transform, style_);
    }

    if (options_.includeInstructions) {
        TextStyle lineStyle;
        lineStyle.height = kInstructionHeightMm;

        double y = transform.originY + bounds.maxYMm + kBlockGapMm;
        bool heading = true;
        for (const auto& line : instructionLines(graft)) {
            TextStyle style = lineStyle;
            style.bold = heading;
            heading = false;
            surface.drawText(SurfacePoint(left, y), line, style);
            y += kInstructionLineMm;
        }

        TextStyle disclaimerStyle = lineStyle;
        disclaimerStyle.color = colors::Notice;
        surface.drawText(SurfacePoint(left, y + kInstructionLineMm), kDisclaimer,
                         disclaimerStyle);
    }

    auto bytes = sink.finalize();
    if (!bytes) {
        getLogger()->error("Document sink failed to finalize: {}", bytes.error().toString());
        return std::unexpected(bytes.error());
    }

    artifact.data = std::move(*bytes);
    artifact.mimeType = sink.mimeType();
    artifact.suggestedFileName = suggestedFileName(graft);

    getLogger()->info("Template document ready: {} ({} bytes{})",
                      artifact.suggestedFileName, artifact.data.size(),
                      artifact.layoutEmpty ? ", empty layout" : "");
    return artifact;
}

}  // namespace graft_template::services
