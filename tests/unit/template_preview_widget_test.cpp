#include <gtest/gtest.h>

#include <QApplication>
#include <QMouseEvent>
#include <QSignalSpy>

#include "ui/widgets/template_preview_widget.hpp"

using namespace graft_template;
using namespace graft_template::ui;

namespace {

int argc = 0;
char* argv[] = {nullptr};
QApplication app(argc, argv);

class TemplatePreviewWidgetTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto session = planner_.startSession("Tube 24 x 145 mm");
        ASSERT_TRUE(session.has_value());
        session_.emplace(std::move(*session));
        widget_.resize(400, 600);
    }

    void add(const std::string& vessel, double distance, int hour, double diameter) {
        services::FenestrationRequest request;
        request.vesselKey = vessel;
        request.distanceFromProximalMm = distance;
        request.clockHour = hour;
        request.diameterMm = diameter;
        ASSERT_TRUE(planner_.addFenestration(*session_, request).has_value());
    }

    services::TemplatePlanner planner_;
    std::optional<services::PlanningSession> session_;
    TemplatePreviewWidget widget_;
};

} // anonymous namespace

TEST_F(TemplatePreviewWidgetTest, NoSessionShowsPlaceholder) {
    auto image = widget_.previewImage();
    EXPECT_EQ(image.size(), QSize(400, 600));
    EXPECT_FALSE(widget_.lastResult().has_value());
    EXPECT_FALSE(widget_.placeholderText().isEmpty());
    EXPECT_EQ(widget_.fenestrationAt(QPointF(200, 300)), -1);
}

TEST_F(TemplatePreviewWidgetTest, EmptyLayoutReportsNoData) {
    widget_.setSession(&planner_, &*session_);
    (void)widget_.previewImage();

    auto result = widget_.lastResult();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, services::PreviewStatus::NoData);
    EXPECT_FALSE(result->hasData());
}

TEST_F(TemplatePreviewWidgetTest, RendersPlannedLayout) {
    add("SMA", 20.0, 12, 8.0);
    add("RRA", 45.0, 9, 6.0);
    widget_.setSession(&planner_, &*session_);
    auto image = widget_.previewImage();

    auto result = widget_.lastResult();
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->status, services::PreviewStatus::Rendered);
    ASSERT_EQ(result->placements.size(), 2u);

    // Template fits inside the widget with a uniform scale
    EXPECT_GT(result->transform.unitsPerMm, 0.0);
    for (const auto& placement : result->placements) {
        EXPECT_GT(placement.center.x, 0.0);
        EXPECT_LT(placement.center.x, 400.0);
        EXPECT_GT(placement.center.y, 0.0);
        EXPECT_LT(placement.center.y, 600.0);
    }

    // Something other than white was painted at a disc center
    const auto& sma = result->placements[0];
    const QColor pixel = image.pixelColor(static_cast<int>(sma.center.x),
                                          static_cast<int>(sma.center.y));
    EXPECT_NE(pixel, QColor(Qt::white));
}

TEST_F(TemplatePreviewWidgetTest, FenestrationAtFindsDisc) {
    add("SMA", 20.0, 12, 8.0);
    add("LRA", 60.0, 3, 6.0);
    widget_.setSession(&planner_, &*session_);
    (void)widget_.previewImage();

    auto result = widget_.lastResult();
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->placements.size(), 2u);

    const auto& lra = result->placements[1];
    EXPECT_EQ(widget_.fenestrationAt(QPointF(lra.center.x, lra.center.y)), 1);
    EXPECT_EQ(widget_.fenestrationAt(QPointF(lra.center.x + lra.radius * 0.5,
                                             lra.center.y)), 1);
    EXPECT_EQ(widget_.fenestrationAt(QPointF(lra.center.x + lra.radius * 3.0,
                                             lra.center.y)), -1);
}

TEST_F(TemplatePreviewWidgetTest, ClickEmitsFenestrationIndex) {
    add("SMA", 20.0, 12, 8.0);
    widget_.setSession(&planner_, &*session_);
    (void)widget_.previewImage();

    auto result = widget_.lastResult();
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->placements.size(), 1u);
    const QPointF center(result->placements[0].center.x, result->placements[0].center.y);

    QSignalSpy spy(&widget_, &TemplatePreviewWidget::fenestrationClicked);
    QMouseEvent press(QEvent::MouseButtonPress, center, center,
                      Qt::LeftButton, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&widget_, &press);

    ASSERT_EQ(spy.count(), 1);
    EXPECT_EQ(spy.at(0).at(0).toInt(), 0);
}

TEST_F(TemplatePreviewWidgetTest, PositionLabelReportsClockAndDistance) {
    add("RRA", 54.0, 3, 5.0);
    widget_.setSession(&planner_, &*session_);
    (void)widget_.previewImage();

    auto result = widget_.lastResult();
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->placements.size(), 1u);
    const auto& rra = result->placements[0];

    EXPECT_EQ(widget_.positionLabel(QPointF(rra.center.x, rra.center.y)),
              "3 o'clock, 54.0 mm");
    // Far outside the unwrapped outline
    EXPECT_TRUE(widget_.positionLabel(QPointF(-50.0, -50.0)).isEmpty());
}

TEST_F(TemplatePreviewWidgetTest, DetachingSessionClearsResult) {
    add("SMA", 20.0, 12, 8.0);
    widget_.setSession(&planner_, &*session_);
    (void)widget_.previewImage();
    ASSERT_TRUE(widget_.lastResult().has_value());

    widget_.setSession(nullptr, nullptr);
    EXPECT_FALSE(widget_.lastResult().has_value());
}

TEST_F(TemplatePreviewWidgetTest, CustomPlaceholderText) {
    widget_.setPlaceholderText("Nothing yet");
    EXPECT_EQ(widget_.placeholderText(), "Nothing yet");
}
