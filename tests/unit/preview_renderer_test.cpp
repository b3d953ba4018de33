#include "services/render/preview_renderer.hpp"

#include "services/geometry/cylinder_unwrap_mapper.hpp"
#include "services/render/recording_surface.hpp"
#include "test_utils/recording_document_sink.hpp"

#include <gtest/gtest.h>

namespace graft_template::services {
namespace {

using test_utils::makeFenestration;
using test_utils::makeGraft;

class PreviewRendererTest : public ::testing::Test {
protected:
    void addDefaultLayout() {
        ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_));
        ASSERT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 54.0, 3, 5.0), graft_));
        ASSERT_TRUE(registry_.add(makeFenestration(Vessel::LeftRenal, 62.0, 9, 5.0), graft_));
    }

    GraftSpecification graft_ = makeGraft(24.0, 145.0);
    FenestrationRegistry registry_;
    RecordingSurface surface_;
    PreviewViewport viewport_{400.0, 600.0, 12.0};
    PreviewRenderer renderer_;
};

TEST_F(PreviewRendererTest, EmptyLayoutIsNoData) {
    auto result = renderer_.render(graft_, registry_, surface_, viewport_);
    EXPECT_EQ(result.status, PreviewStatus::NoData);
    EXPECT_FALSE(result.hasData());
    EXPECT_TRUE(surface_.empty());
}

TEST_F(PreviewRendererTest, OneCirclePerFenestration) {
    addDefaultLayout();
    auto result = renderer_.render(graft_, registry_, surface_, viewport_);
    ASSERT_EQ(result.status, PreviewStatus::Rendered);
    EXPECT_EQ(surface_.circles().size(), 3u);
    EXPECT_EQ(result.placements.size(), 3u);
}

TEST_F(PreviewRendererTest, CirclesAtMapperPositions) {
    addDefaultLayout();
    auto result = renderer_.render(graft_, registry_, surface_, viewport_);
    const auto circles = surface_.circles();
    ASSERT_EQ(circles.size(), registry_.size());

    for (std::size_t i = 0; i < registry_.size(); ++i) {
        const auto mm = CylinderUnwrapMapper::map(graft_, registry_.at(i));
        const auto expected = result.transform.apply(mm);
        EXPECT_NEAR(circles[i].center.x, expected.x, 1e-9);
        EXPECT_NEAR(circles[i].center.y, expected.y, 1e-9);
        EXPECT_NEAR(circles[i].radius,
                    result.transform.length(registry_.at(i).diameterMm / 2.0), 1e-9);
    }
}

TEST_F(PreviewRendererTest, CirclesUseVesselColor) {
    addDefaultLayout();
    (void)renderer_.render(graft_, registry_, surface_, viewport_);
    const auto circles = surface_.circles();
    ASSERT_EQ(circles.size(), 3u);
    ASSERT_TRUE(circles[0].style.fill.has_value());
    const auto sma = vesselInfo(Vessel::SuperiorMesenteric).color;
    EXPECT_EQ(circles[0].style.fill->r, sma.r);
    EXPECT_EQ(circles[0].style.fill->g, sma.g);
    EXPECT_EQ(circles[0].style.fill->b, sma.b);
}

TEST_F(PreviewRendererTest, LabelsAndAnnotations) {
    addDefaultLayout();
    (void)renderer_.render(graft_, registry_, surface_, viewport_);
    EXPECT_EQ(surface_.textsContaining("F1 SMA").size(), 1u);
    EXPECT_EQ(surface_.textsContaining("F2 RRA").size(), 1u);
    EXPECT_EQ(surface_.textsContaining("Ø6 @ 50 / 12 o'clock").size(), 1u);
    EXPECT_EQ(surface_.textsContaining("Ø5 @ 54 / 3 o'clock").size(), 1u);
}

TEST_F(PreviewRendererTest, DrawsCalibrationMarkers) {
    addDefaultLayout();
    (void)renderer_.render(graft_, registry_, surface_, viewport_);
    EXPECT_EQ(surface_.textsContaining("10 mm").size(), 2u);
    EXPECT_EQ(surface_.textsContaining("PROXIMAL").size(), 1u);
    EXPECT_EQ(surface_.textsContaining("DISTAL").size(), 1u);
    EXPECT_EQ(surface_.rects().size(), 1u);
}

TEST_F(PreviewRendererTest, OutlineIsUnwrappedRectangle) {
    addDefaultLayout();
    auto result = renderer_.render(graft_, registry_, surface_, viewport_);
    const auto rects = surface_.rects();
    ASSERT_EQ(rects.size(), 1u);
    EXPECT_NEAR(rects[0].width, result.transform.length(graft_.circumferenceMm()), 1e-9);
    EXPECT_NEAR(rects[0].height, result.transform.length(graft_.lengthMm()), 1e-9);
    EXPECT_NEAR(rects[0].origin.x, result.transform.originX, 1e-9);
    EXPECT_NEAR(rects[0].origin.y, result.transform.originY, 1e-9);
}

TEST_F(PreviewRendererTest, RenderDoesNotChangeModel) {
    addDefaultLayout();
    const auto before = registry_.entries();
    (void)renderer_.render(graft_, registry_, surface_, viewport_);
    EXPECT_EQ(registry_.entries(), before);
}

TEST_F(PreviewRendererTest, RepeatedRenderIsIdentical) {
    addDefaultLayout();
    RecordingSurface second;
    (void)renderer_.render(graft_, registry_, surface_, viewport_);
    (void)renderer_.render(graft_, registry_, second, viewport_);
    ASSERT_EQ(surface_.circles().size(), second.circles().size());
    for (std::size_t i = 0; i < second.circles().size(); ++i) {
        EXPECT_EQ(surface_.circles()[i].center, second.circles()[i].center);
    }
}

// =============================================================================
// Fit transform
// =============================================================================

TEST(PreviewFitTransformTest, UniformScaleFitsViewport) {
    PlanarRect bounds{-10.0, -10.0, 90.0, 190.0};  // 100 x 200 mm
    PreviewViewport viewport{424.0, 424.0, 12.0};   // 400 x 400 px available

    auto transform = PreviewRenderer::fitTransform(bounds, viewport);
    EXPECT_DOUBLE_EQ(transform.unitsPerMm, 2.0);

    auto topLeft = transform.apply(PlanarPoint(bounds.minXMm, bounds.minYMm));
    auto bottomRight = transform.apply(PlanarPoint(bounds.maxXMm, bounds.maxYMm));
    EXPECT_NEAR(topLeft.y, 12.0, 1e-9);
    EXPECT_NEAR(bottomRight.y, 412.0, 1e-9);
    // Horizontally centered
    EXPECT_NEAR(topLeft.x, 112.0, 1e-9);
    EXPECT_NEAR(bottomRight.x, 312.0, 1e-9);
}

TEST(PreviewFitTransformTest, CollapsedViewport) {
    PlanarRect bounds{0.0, 0.0, 100.0, 100.0};
    PreviewViewport viewport{20.0, 20.0, 12.0};
    EXPECT_DOUBLE_EQ(PreviewRenderer::fitTransform(bounds, viewport).unitsPerMm, 0.0);
}

TEST(PreviewFitTransformTest, RelativePlacementIndependentOfViewport) {
    auto graft = makeGraft(28.0, 160.0);
    FenestrationRegistry registry;
    ASSERT_TRUE(registry.add(makeFenestration(Vessel::RightRenal, 70.0, 4, 6.0), graft));

    PreviewRenderer renderer;
    RecordingSurface small;
    RecordingSurface large;
    auto a = renderer.render(graft, registry, small, {300.0, 400.0, 12.0});
    auto b = renderer.render(graft, registry, large, {1200.0, 900.0, 20.0});

    auto relative = [](const PreviewResult& r, const SurfacePoint& p) {
        return r.transform.invert(p);
    };
    auto ma = relative(a, small.circles().at(0).center);
    auto mb = relative(b, large.circles().at(0).center);
    EXPECT_NEAR(ma.xMm, mb.xMm, 1e-9);
    EXPECT_NEAR(ma.yMm, mb.yMm, 1e-9);
}

}  // anonymous namespace
}  // namespace graft_template::services
