#include "services/export/document_renderer.hpp"

#include "services/export/pdf_document_sink.hpp"
#include "services/geometry/cylinder_unwrap_mapper.hpp"
#include "services/render/preview_renderer.hpp"
#include "test_utils/recording_document_sink.hpp"

#include <gtest/gtest.h>

#include <QApplication>

#include <algorithm>
#include <cmath>

namespace graft_template::services {
namespace {

// PDF text layout needs a GUI application for font access
int argc = 0;
char* argv[] = {nullptr};
QApplication app(argc, argv);

using test_utils::makeFenestration;
using test_utils::makeGraft;
using test_utils::RecordingDocumentSink;

class DocumentRendererTest : public ::testing::Test {
protected:
    void addScenarioLayout() {
        ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_));
        ASSERT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 54.0, 3, 5.0), graft_));
        ASSERT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 25.0, 12, 8.0), graft_));
        ASSERT_TRUE(registry_.add(makeFenestration(Vessel::LeftRenal, 60.0, 9, 5.0), graft_));
    }

    GraftSpecification graft_ = makeGraft(24.0, 145.0, "TUBE-24-145");
    FenestrationRegistry registry_;
    RecordingDocumentSink sink_;
    DocumentRenderer renderer_;
};

// =============================================================================
// Geometry on the page
// =============================================================================

TEST_F(DocumentRendererTest, ExactlyOneCirclePerFenestration) {
    addScenarioLayout();
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value()) << artifact.error().toString();
    EXPECT_EQ(sink_.surface.circles().size(), registry_.size());
    EXPECT_EQ(artifact->placements.size(), registry_.size());
}

TEST_F(DocumentRendererTest, CirclesAtMapperPositionsInMillimeters) {
    addScenarioLayout();
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    const auto& transform = artifact->templateTransform;
    EXPECT_DOUBLE_EQ(transform.unitsPerMm, 1.0);

    const auto circles = sink_.surface.circles();
    for (std::size_t i = 0; i < registry_.size(); ++i) {
        const auto mm = CylinderUnwrapMapper::map(graft_, registry_.at(i));
        EXPECT_NEAR(circles[i].center.x - transform.originX, mm.xMm, 1e-9);
        EXPECT_NEAR(circles[i].center.y - transform.originY, mm.yMm, 1e-9);
        EXPECT_NEAR(circles[i].radius, registry_.at(i).diameterMm / 2.0, 1e-12);
    }
}

TEST_F(DocumentRendererTest, OutlineIsTrueSize) {
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    const auto rects = sink_.surface.rects();
    ASSERT_EQ(rects.size(), 1u);
    EXPECT_NEAR(rects[0].width, graft_.circumferenceMm(), 1e-9);
    EXPECT_DOUBLE_EQ(rects[0].height, 145.0);
}

TEST_F(DocumentRendererTest, TemplateInsideMargins) {
    addScenarioLayout();
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    const auto& page = artifact->page;
    const double margin = renderer_.options().marginMm;
    for (const auto& circle : sink_.surface.circles()) {
        EXPECT_GE(circle.center.x - circle.radius, margin);
        EXPECT_LE(circle.center.x + circle.radius, page.widthMm - margin);
        EXPECT_GE(circle.center.y - circle.radius, margin);
        EXPECT_LE(circle.center.y + circle.radius, page.heightMm - margin);
    }
}

TEST_F(DocumentRendererTest, SameRelativePlacementAsPreview) {
    addScenarioLayout();
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    services::RecordingSurface previewSurface;
    PreviewRenderer preview;
    auto previewResult = preview.render(graft_, registry_, previewSurface, {500.0, 700.0, 12.0});

    const auto docCircles = sink_.surface.circles();
    const auto previewCircles = previewSurface.circles();
    ASSERT_EQ(docCircles.size(), previewCircles.size());
    for (std::size_t i = 0; i < docCircles.size(); ++i) {
        auto docMm = artifact->templateTransform.invert(docCircles[i].center);
        auto previewMm = previewResult.transform.invert(previewCircles[i].center);
        EXPECT_NEAR(docMm.xMm / graft_.circumferenceMm(),
                    previewMm.xMm / graft_.circumferenceMm(), 1e-9);
        EXPECT_NEAR(docMm.yMm / graft_.lengthMm(), previewMm.yMm / graft_.lengthMm(), 1e-9);
    }
}

std::vector<LineCommand> seamLines(const RecordingSurface& surface, Vessel vessel) {
    std::vector<LineCommand> result;
    for (const auto& line : surface.lines()) {
        if (line.style.dashed && line.style.color == vesselInfo(vessel).color) {
            result.push_back(line);
        }
    }
    return result;
}

TEST_F(DocumentRendererTest, TwelveOClockDiscMarkedAtBothEdges) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_));
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    // Still one circle per fenestration
    ASSERT_EQ(sink_.surface.circles().size(), 1u);
    ASSERT_EQ(artifact->placements.size(), 1u);
    ASSERT_TRUE(artifact->placements[0].seamCenterMm.has_value());
    EXPECT_NEAR(artifact->placements[0].seamCenterMm->xMm, graft_.circumferenceMm(), 1e-9);

    const auto& transform = artifact->templateTransform;
    const double c = graft_.circumferenceMm();
    const auto lines = seamLines(sink_.surface, Vessel::SuperiorMesenteric);
    ASSERT_FALSE(lines.empty());

    bool chordOnEdge = false;
    for (const auto& line : lines) {
        for (const auto& point : {line.from, line.to}) {
            const auto mm = transform.invert(point);
            EXPECT_GE(mm.xMm, c - 3.0 - 1e-6);
            EXPECT_LE(mm.xMm, c + 1e-6);
            EXPECT_LE(std::abs(mm.yMm - 50.0), 3.0 + 1e-6);
        }
        const auto from = transform.invert(line.from);
        const auto to = transform.invert(line.to);
        if (std::abs(from.xMm - c) < 1e-6 && std::abs(to.xMm - c) < 1e-6) {
            chordOnEdge = chordOnEdge || std::abs(std::abs(from.yMm - to.yMm) - 6.0) < 1e-6;
        }
    }
    EXPECT_TRUE(chordOnEdge);
}

TEST_F(DocumentRendererTest, DiscPastRightEdgeMarkedAtLeftEdge) {
    const auto narrow = makeGraft(20.0, 120.0);
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::LeftRenal, 40.0, 11, 12.0), narrow));
    auto artifact = renderer_.render(narrow, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    const double c = narrow.circumferenceMm();
    const double overhang = c * 11.0 / 12.0 + 6.0 - c;
    ASSERT_GT(overhang, 0.0);

    const auto& transform = artifact->templateTransform;
    const auto lines = seamLines(sink_.surface, Vessel::LeftRenal);
    ASSERT_FALSE(lines.empty());
    double maxX = 0.0;
    for (const auto& line : lines) {
        for (const auto& point : {line.from, line.to}) {
            const auto mm = transform.invert(point);
            EXPECT_GE(mm.xMm, -1e-6);
            maxX = std::max(maxX, mm.xMm);
        }
    }
    EXPECT_NEAR(maxX, overhang, 1e-6);
}

TEST_F(DocumentRendererTest, InteriorDiscHasNoSeamMarker) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 54.0, 3, 5.0), graft_));
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_FALSE(artifact->placements[0].seamCenterMm.has_value());
    EXPECT_TRUE(seamLines(sink_.surface, Vessel::RightRenal).empty());
}

TEST_F(DocumentRendererTest, LabelsStayInsideOutline) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::LeftRenal, 20.0, 10, 6.0), graft_));
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 0.0, 3, 6.0), graft_));
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());
    const auto& transform = artifact->templateTransform;

    // 10 o'clock: label drawn leftwards, away from the reference bar column
    auto left = sink_.surface.textsContaining("F1 LRA");
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].style.align, TextAlign::Right);
    EXPECT_LT(transform.invert(left[0].position).xMm, artifact->placements[0].centerMm.xMm);

    // Proximal edge: label kept below the clock labels
    auto top = sink_.surface.textsContaining("F2 RRA");
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].style.align, TextAlign::Left);
    EXPECT_GE(transform.invert(top[0].position).yMm - top[0].style.height / 2.0, -1e-9);
}

TEST_F(DocumentRendererTest, ReferenceBarsMeasureTenMillimeters) {
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    int tenMmBars = 0;
    for (const auto& line : sink_.surface.lines()) {
        const double length = std::hypot(line.to.x - line.from.x, line.to.y - line.from.y);
        if (std::abs(length - 10.0) < 1e-9) {
            ++tenMmBars;
        }
    }
    EXPECT_EQ(tenMmBars, 2);
    EXPECT_EQ(sink_.surface.textsContaining("10 mm").size(), 2u);
}

// =============================================================================
// Document content
// =============================================================================

TEST_F(DocumentRendererTest, TitleAndInstructions) {
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    EXPECT_EQ(sink_.surface.textsContaining("TUBE-24-145").size(), 1u);
    EXPECT_FALSE(sink_.surface.textsContaining("100 %").empty());
    EXPECT_FALSE(sink_.surface.textsContaining("Cut along the solid outline").empty());
    EXPECT_FALSE(sink_.surface.textsContaining("24 mm diameter").empty());
    EXPECT_FALSE(sink_.surface.textsContaining("Planning aid only").empty());
}

TEST_F(DocumentRendererTest, InstructionsCanBeOmitted) {
    DocumentOptions options;
    options.includeInstructions = false;
    DocumentRenderer renderer(options);

    auto artifact = renderer.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_TRUE(sink_.surface.textsContaining("INSTRUCTIONS").empty());
    EXPECT_TRUE(sink_.surface.textsContaining("Planning aid only").empty());
}

TEST_F(DocumentRendererTest, EmptyLayoutStillProducesTemplate) {
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());

    EXPECT_TRUE(artifact->layoutEmpty);
    EXPECT_TRUE(artifact->placements.empty());
    EXPECT_TRUE(sink_.surface.circles().empty());
    EXPECT_EQ(sink_.surface.textsContaining(DocumentRenderer::kEmptyLayoutNotice).size(), 1u);
    EXPECT_EQ(sink_.surface.rects().size(), 1u);
    EXPECT_FALSE(artifact->data.isEmpty());
}

TEST_F(DocumentRendererTest, NonEmptyLayoutHasNoNotice) {
    addScenarioLayout();
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_FALSE(artifact->layoutEmpty);
    EXPECT_TRUE(sink_.surface.textsContaining(DocumentRenderer::kEmptyLayoutNotice).empty());
}

TEST_F(DocumentRendererTest, ArtifactMetadata) {
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->suggestedFileName, "graft_template_24mm_145mm.pdf");
    EXPECT_EQ(artifact->mimeType, "application/x-recording");
    EXPECT_EQ(artifact->data, QByteArray("recorded"));
    ASSERT_TRUE(sink_.openedPage.has_value());
    EXPECT_EQ(sink_.openedPage->name, artifact->page.name);
}

TEST_F(DocumentRendererTest, SuggestedFileNameKeepsFractions) {
    EXPECT_EQ(DocumentRenderer::suggestedFileName(makeGraft(25.5, 150.0)),
              "graft_template_25.5mm_150mm.pdf");
}

// =============================================================================
// Page selection
// =============================================================================

TEST_F(DocumentRendererTest, SmallGraftFitsA4Portrait) {
    auto page = renderer_.pageFor(graft_);
    EXPECT_EQ(page.name, "A4");
    EXPECT_DOUBLE_EQ(page.widthMm, 210.0);
    EXPECT_DOUBLE_EQ(page.heightMm, 297.0);
}

TEST_F(DocumentRendererTest, LongGraftMovesToA3) {
    auto page = renderer_.pageFor(makeGraft(36.0, 200.0));
    EXPECT_EQ(page.name, "A3");
}

TEST_F(DocumentRendererTest, ChoosePageSmallestFit) {
    EXPECT_EQ(DocumentRenderer::choosePage(200.0, 280.0).name, "A4");
    EXPECT_FALSE(DocumentRenderer::choosePage(200.0, 280.0).isLandscape());

    auto landscape = DocumentRenderer::choosePage(280.0, 200.0);
    EXPECT_EQ(landscape.name, "A4");
    EXPECT_TRUE(landscape.isLandscape());

    EXPECT_EQ(DocumentRenderer::choosePage(250.0, 400.0).name, "A3");
}

TEST_F(DocumentRendererTest, ChoosePageCustomWhenTooLarge) {
    auto page = DocumentRenderer::choosePage(500.5, 300.0);
    EXPECT_EQ(page.name, "Custom");
    EXPECT_DOUBLE_EQ(page.widthMm, 501.0);
    EXPECT_DOUBLE_EQ(page.heightMm, 300.0);
}

// =============================================================================
// Sink failures
// =============================================================================

TEST_F(DocumentRendererTest, BeginFailurePropagates) {
    sink_.beginError = TemplateError{TemplateError::Code::RenderingFailed, "no painter"};
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_FALSE(artifact.has_value());
    EXPECT_EQ(artifact.error().code, TemplateError::Code::RenderingFailed);
    EXPECT_EQ(sink_.finalizeCount, 0);
}

TEST_F(DocumentRendererTest, FinalizeFailurePropagates) {
    sink_.finalizeError = TemplateError{TemplateError::Code::FileCreationFailed, "buffer"};
    auto artifact = renderer_.render(graft_, registry_, sink_);
    ASSERT_FALSE(artifact.has_value());
    EXPECT_EQ(artifact.error().code, TemplateError::Code::FileCreationFailed);
}

// =============================================================================
// Real PDF output
// =============================================================================

TEST_F(DocumentRendererTest, ProducesPdfDocument) {
    addScenarioLayout();
    PdfDocumentSink pdfSink(PdfSinkOptions{300});

    auto artifact = renderer_.render(graft_, registry_, pdfSink);
    ASSERT_TRUE(artifact.has_value()) << artifact.error().toString();
    EXPECT_TRUE(artifact->data.startsWith("%PDF"));
    EXPECT_EQ(artifact->mimeType, "application/pdf");
    EXPECT_EQ(artifact->placements.size(), 4u);
}

}  // anonymous namespace
}  // namespace graft_template::services
