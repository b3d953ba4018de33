#include "services/planning/template_planner.hpp"

#include "services/render/recording_surface.hpp"
#include "test_utils/recording_document_sink.hpp"

#include <gtest/gtest.h>

#include <QApplication>

namespace graft_template::services {
namespace {

int argc = 0;
char* argv[] = {nullptr};
QApplication app(argc, argv);

constexpr const char* kDevice24 = "Tube 24 x 145 mm";
constexpr const char* kDevice28 = "Tube 28 x 160 mm";

FenestrationRequest request(const std::string& vessel, double distance, int hour, double diameter) {
    FenestrationRequest r;
    r.vesselKey = vessel;
    r.distanceFromProximalMm = distance;
    r.clockHour = hour;
    r.diameterMm = diameter;
    return r;
}

class TemplatePlannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto session = planner_.startSession(kDevice24);
        ASSERT_TRUE(session.has_value()) << session.error().toString();
        session_.emplace(std::move(*session));
    }

    PlanningSession& session() { return *session_; }

    TemplatePlanner planner_;
    std::optional<PlanningSession> session_;
};

// =============================================================================
// Session and device selection
// =============================================================================

TEST_F(TemplatePlannerTest, SessionStartsEmptyOnDevice) {
    EXPECT_DOUBLE_EQ(session().graft.diameterMm(), 24.0);
    EXPECT_DOUBLE_EQ(session().graft.lengthMm(), 145.0);
    EXPECT_NEAR(session().graft.circumferenceMm(), 75.4, 0.01);
    EXPECT_TRUE(session().registry.empty());
}

TEST_F(TemplatePlannerTest, UnknownDeviceRejected) {
    auto session = planner_.startSession("Tube 99 x 999 mm");
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().code, TemplateError::Code::InvalidParameter);
}

TEST_F(TemplatePlannerTest, SelectDeviceClearsLayout) {
    ASSERT_TRUE(planner_.addFenestration(session(), request("SMA", 50.0, 12, 6.0)));
    ASSERT_TRUE(planner_.selectDevice(session(), kDevice28));
    EXPECT_DOUBLE_EQ(session().graft.diameterMm(), 28.0);
    EXPECT_TRUE(session().registry.empty());
}

TEST_F(TemplatePlannerTest, SelectUnknownDeviceKeepsSession) {
    ASSERT_TRUE(planner_.addFenestration(session(), request("SMA", 50.0, 12, 6.0)));
    auto result = planner_.selectDevice(session(), "nope");
    ASSERT_FALSE(result.has_value());
    EXPECT_DOUBLE_EQ(session().graft.diameterMm(), 24.0);
    EXPECT_EQ(session().registry.size(), 1u);
}

TEST_F(TemplatePlannerTest, SessionsAreIndependent) {
    auto other = planner_.startSession(kDevice24);
    ASSERT_TRUE(other.has_value());
    ASSERT_TRUE(planner_.addFenestration(session(), request("SMA", 50.0, 12, 6.0)));
    EXPECT_TRUE(other->registry.empty());
}

// =============================================================================
// Planning scenario: 24 x 145 mm graft
// =============================================================================

TEST_F(TemplatePlannerTest, ScenarioSmaRenalSpacing) {
    auto sma = planner_.addFenestration(session(), request("SMA", 50.0, 12, 6.0));
    ASSERT_TRUE(sma.has_value());

    auto tooClose = planner_.addFenestration(session(), request("RRA", 53.0, 3, 5.0));
    ASSERT_FALSE(tooClose.has_value());
    EXPECT_EQ(tooClose.error().code, TemplateError::Code::SpacingConflict);
    ASSERT_TRUE(tooClose.error().conflict.has_value());
    EXPECT_EQ(tooClose.error().conflict->index, 0u);
    EXPECT_EQ(session().registry.size(), 1u);

    auto renal = planner_.addFenestration(session(), request("RRA", 54.0, 3, 5.0));
    ASSERT_TRUE(renal.has_value());
    EXPECT_EQ(*renal, 1u);
    EXPECT_DOUBLE_EQ(session().registry.at(1).clockAngleDegrees(), 90.0);

    RecordingSurface surface;
    auto preview = planner_.renderPreview(session(), surface, {400.0, 600.0, 12.0});
    ASSERT_EQ(preview.placements.size(), 2u);
    EXPECT_NEAR(preview.placements[0].centerMm.xMm, 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(preview.placements[0].centerMm.yMm, 50.0);
    EXPECT_NEAR(preview.placements[1].centerMm.xMm, 18.85, 0.01);
    EXPECT_DOUBLE_EQ(preview.placements[1].centerMm.yMm, 54.0);
}

TEST_F(TemplatePlannerTest, BoundaryValues) {
    EXPECT_TRUE(planner_.addFenestration(session(), request("CT", 0.0, 12, 4.0)));
    EXPECT_TRUE(planner_.addFenestration(session(), request("IMA", 145.0, 12, 12.0)));

    auto small = planner_.addFenestration(session(), request("SMA", 50.0, 12, 3.9));
    ASSERT_FALSE(small.has_value());
    EXPECT_EQ(small.error().code, TemplateError::Code::InvalidParameter);

    auto large = planner_.addFenestration(session(), request("SMA", 50.0, 12, 12.1));
    ASSERT_FALSE(large.has_value());
    EXPECT_EQ(large.error().code, TemplateError::Code::InvalidParameter);

    auto beyond = planner_.addFenestration(session(), request("SMA", 145.5, 12, 6.0));
    ASSERT_FALSE(beyond.has_value());
    EXPECT_EQ(beyond.error().code, TemplateError::Code::InvalidParameter);

    EXPECT_EQ(session().registry.size(), 2u);
}

TEST_F(TemplatePlannerTest, UnknownVesselRejected) {
    auto result = planner_.addFenestration(session(), request("Aorta", 50.0, 12, 6.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TemplateError::Code::InvalidParameter);
    EXPECT_TRUE(session().registry.empty());
}

TEST_F(TemplatePlannerTest, VesselByDisplayName) {
    auto result = planner_.addFenestration(session(),
        request("Superior mesenteric artery", 50.0, 12, 6.0));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(session().registry.at(0).vessel, Vessel::SuperiorMesenteric);
}

TEST_F(TemplatePlannerTest, RemoveAndClear) {
    ASSERT_TRUE(planner_.addFenestration(session(), request("CT", 20.0, 12, 8.0)));
    ASSERT_TRUE(planner_.addFenestration(session(), request("SMA", 40.0, 12, 6.0)));
    ASSERT_TRUE(planner_.addFenestration(session(), request("RRA", 60.0, 3, 5.0)));

    auto removed = planner_.removeFenestration(session(), 0);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->vessel, Vessel::CeliacTrunk);
    EXPECT_EQ(session().registry.at(0).vessel, Vessel::SuperiorMesenteric);

    auto missing = planner_.removeFenestration(session(), 5);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, TemplateError::Code::IndexOutOfRange);

    EXPECT_EQ(planner_.clearFenestrations(session()), 2u);
    EXPECT_TRUE(session().registry.empty());
}

// =============================================================================
// Rendering
// =============================================================================

TEST_F(TemplatePlannerTest, PreviewEmptyLayout) {
    RecordingSurface surface;
    auto preview = planner_.renderPreview(session(), surface, {400.0, 600.0, 12.0});
    EXPECT_EQ(preview.status, PreviewStatus::NoData);
    EXPECT_TRUE(surface.empty());
}

TEST_F(TemplatePlannerTest, ExportThroughSink) {
    ASSERT_TRUE(planner_.addFenestration(session(), request("SMA", 50.0, 12, 6.0)));
    ASSERT_TRUE(planner_.addFenestration(session(), request("RRA", 54.0, 3, 5.0)));

    test_utils::RecordingDocumentSink sink;
    auto artifact = planner_.exportDocument(session(), sink);
    ASSERT_TRUE(artifact.has_value()) << artifact.error().toString();
    EXPECT_EQ(sink.surface.circles().size(), 2u);
    EXPECT_FALSE(artifact->layoutEmpty);
}

TEST_F(TemplatePlannerTest, ExportPdf) {
    ASSERT_TRUE(planner_.addFenestration(session(), request("SMA", 50.0, 12, 6.0)));

    auto artifact = planner_.exportDocument(session());
    ASSERT_TRUE(artifact.has_value()) << artifact.error().toString();
    EXPECT_TRUE(artifact->data.startsWith("%PDF"));
    EXPECT_EQ(artifact->mimeType, "application/pdf");
    EXPECT_EQ(artifact->suggestedFileName, "graft_template_24mm_145mm.pdf");
}

TEST_F(TemplatePlannerTest, ExportEmptyLayout) {
    auto artifact = planner_.exportDocument(session());
    ASSERT_TRUE(artifact.has_value());
    EXPECT_TRUE(artifact->layoutEmpty);
    EXPECT_TRUE(artifact->data.startsWith("%PDF"));
}

TEST_F(TemplatePlannerTest, ReplaceCatalog) {
    DeviceCatalog catalog;
    ASSERT_TRUE(catalog.addDevice({"Only", "ONLY-30", 30.0, 150.0}));
    planner_.setCatalog(std::move(catalog));

    EXPECT_FALSE(planner_.startSession(kDevice24).has_value());
    auto session = planner_.startSession("Only");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->graft.name(), "ONLY-30");
}

}  // anonymous namespace
}  // namespace graft_template::services
