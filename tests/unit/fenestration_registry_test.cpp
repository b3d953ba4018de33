#include "services/planning/fenestration_registry.hpp"

#include "test_utils/recording_document_sink.hpp"

#include <gtest/gtest.h>

namespace graft_template::services {
namespace {

using test_utils::makeFenestration;
using test_utils::makeGraft;

class FenestrationRegistryTest : public ::testing::Test {
protected:
    GraftSpecification graft_ = makeGraft(24.0, 145.0);
    FenestrationRegistry registry_;
};

// =============================================================================
// Parameter validation
// =============================================================================

TEST_F(FenestrationRegistryTest, AcceptsValidEntry) {
    auto index = registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(*index, 0u);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(FenestrationRegistryTest, DistanceBoundariesAreInclusive) {
    EXPECT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 0.0, 12, 6.0), graft_));
    EXPECT_TRUE(registry_.add(makeFenestration(Vessel::InferiorMesenteric, 145.0, 12, 6.0), graft_));
    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(FenestrationRegistryTest, RejectsDistanceOutsideGraft) {
    auto beforeStart = registry_.add(makeFenestration(Vessel::CeliacTrunk, -0.5, 12, 6.0), graft_);
    ASSERT_FALSE(beforeStart.has_value());
    EXPECT_EQ(beforeStart.error().code, TemplateError::Code::InvalidParameter);

    auto pastEnd = registry_.add(makeFenestration(Vessel::CeliacTrunk, 145.5, 12, 6.0), graft_);
    ASSERT_FALSE(pastEnd.has_value());
    EXPECT_EQ(pastEnd.error().code, TemplateError::Code::InvalidParameter);
    EXPECT_TRUE(registry_.empty());
}

TEST_F(FenestrationRegistryTest, DiameterBoundaries) {
    EXPECT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 20.0, 3, 4.0), graft_));
    EXPECT_TRUE(registry_.add(makeFenestration(Vessel::LeftRenal, 40.0, 9, 12.0), graft_));

    auto tooSmall = registry_.add(makeFenestration(Vessel::RightRenal, 60.0, 3, 3.9), graft_);
    ASSERT_FALSE(tooSmall.has_value());
    EXPECT_EQ(tooSmall.error().code, TemplateError::Code::InvalidParameter);

    auto tooLarge = registry_.add(makeFenestration(Vessel::RightRenal, 80.0, 3, 12.1), graft_);
    ASSERT_FALSE(tooLarge.has_value());
    EXPECT_EQ(tooLarge.error().code, TemplateError::Code::InvalidParameter);

    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(FenestrationRegistryTest, RejectsInvalidClockHour) {
    for (int hour : {0, 13, -1}) {
        auto result = registry_.add(makeFenestration(Vessel::RightRenal, 60.0, hour, 6.0), graft_);
        ASSERT_FALSE(result.has_value()) << "hour " << hour;
        EXPECT_EQ(result.error().code, TemplateError::Code::InvalidParameter);
    }
    EXPECT_TRUE(registry_.empty());
}

TEST_F(FenestrationRegistryTest, RejectsUnknownVessel) {
    auto result = registry_.add(makeFenestration(static_cast<Vessel>(42), 60.0, 3, 6.0), graft_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TemplateError::Code::InvalidParameter);
    EXPECT_TRUE(registry_.empty());
}

// =============================================================================
// Spacing rule
// =============================================================================

TEST_F(FenestrationRegistryTest, SpacingConflictIdentifiesEntry) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 20.0, 12, 8.0), graft_));
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_));
    const auto before = registry_.entries();

    auto result = registry_.add(makeFenestration(Vessel::RightRenal, 53.0, 3, 5.0), graft_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TemplateError::Code::SpacingConflict);
    ASSERT_TRUE(result.error().conflict.has_value());
    EXPECT_EQ(result.error().conflict->index, 1u);
    EXPECT_EQ(result.error().conflict->fenestration.vessel, Vessel::SuperiorMesenteric);
    EXPECT_NE(result.error().message.find("F2"), std::string::npos);

    EXPECT_EQ(registry_.entries(), before);
}

TEST_F(FenestrationRegistryTest, SpacingIgnoresClockPosition) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 50.0, 3, 5.0), graft_));
    auto opposite = registry_.add(makeFenestration(Vessel::LeftRenal, 51.0, 9, 5.0), graft_);
    ASSERT_FALSE(opposite.has_value());
    EXPECT_EQ(opposite.error().code, TemplateError::Code::SpacingConflict);
}

TEST_F(FenestrationRegistryTest, ExactlyMinimumSpacingIsAccepted) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_));
    EXPECT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 54.0, 3, 5.0), graft_));
    EXPECT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 46.0, 12, 6.0), graft_));
    EXPECT_EQ(registry_.size(), 3u);
}

TEST_F(FenestrationRegistryTest, MinimumSpacingAtTenthMillimeterInputs) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 2.1, 12, 6.0), graft_));
    auto second = registry_.add(makeFenestration(Vessel::RightRenal, 6.1, 3, 5.0), graft_);
    EXPECT_TRUE(second.has_value()) << second.error().toString();

    FenestrationRegistry other;
    ASSERT_TRUE(other.add(makeFenestration(Vessel::CeliacTrunk, 0.1, 12, 6.0), graft_));
    EXPECT_TRUE(other.add(makeFenestration(Vessel::LeftRenal, 4.1, 9, 5.0), graft_));
    EXPECT_TRUE(other.add(makeFenestration(Vessel::InferiorMesenteric, 8.2, 6, 5.0), graft_));

    // Genuinely closer than 4 mm is still rejected
    auto close = other.add(makeFenestration(Vessel::RightRenal, 12.1, 3, 5.0), graft_);
    ASSERT_FALSE(close.has_value());
    EXPECT_EQ(close.error().code, TemplateError::Code::SpacingConflict);
    EXPECT_EQ(other.size(), 3u);
}

TEST_F(FenestrationRegistryTest, TenthMillimeterBelowMinimumIsRejected) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 2.1, 12, 6.0), graft_));
    auto result = registry_.add(makeFenestration(Vessel::RightRenal, 6.0, 3, 5.0), graft_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TemplateError::Code::SpacingConflict);
    EXPECT_EQ(registry_.findSpacingConflict(2.1 + 3.9), 0u);
}

TEST_F(FenestrationRegistryTest, FindSpacingConflict) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_));
    EXPECT_EQ(registry_.findSpacingConflict(47.0), 0u);
    EXPECT_FALSE(registry_.findSpacingConflict(46.0).has_value());
    EXPECT_FALSE(registry_.findSpacingConflict(100.0).has_value());
}

// =============================================================================
// Ordering and removal
// =============================================================================

TEST_F(FenestrationRegistryTest, PreservesInsertionOrder) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 90.0, 3, 5.0), graft_));
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 10.0, 12, 8.0), graft_));
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 40.0, 12, 6.0), graft_));

    ASSERT_EQ(registry_.size(), 3u);
    EXPECT_EQ(registry_.at(0).vessel, Vessel::RightRenal);
    EXPECT_EQ(registry_.at(1).vessel, Vessel::CeliacTrunk);
    EXPECT_EQ(registry_.at(2).vessel, Vessel::SuperiorMesenteric);
}

TEST_F(FenestrationRegistryTest, RemoveShiftsLaterEntries) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 10.0, 12, 8.0), graft_));
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 40.0, 12, 6.0), graft_));
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 60.0, 3, 5.0), graft_));

    auto removed = registry_.remove(1);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->vessel, Vessel::SuperiorMesenteric);
    ASSERT_EQ(registry_.size(), 2u);
    EXPECT_EQ(registry_.at(0).vessel, Vessel::CeliacTrunk);
    EXPECT_EQ(registry_.at(1).vessel, Vessel::RightRenal);
}

TEST_F(FenestrationRegistryTest, RemoveOutOfRange) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 10.0, 12, 8.0), graft_));
    auto result = registry_.remove(1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, TemplateError::Code::IndexOutOfRange);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(FenestrationRegistryTest, RemovalFreesSpacing) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 50.0, 12, 6.0), graft_));
    ASSERT_FALSE(registry_.add(makeFenestration(Vessel::RightRenal, 52.0, 3, 5.0), graft_));
    ASSERT_TRUE(registry_.remove(0));
    EXPECT_TRUE(registry_.add(makeFenestration(Vessel::RightRenal, 52.0, 3, 5.0), graft_));
}

TEST_F(FenestrationRegistryTest, Clear) {
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::CeliacTrunk, 10.0, 12, 8.0), graft_));
    ASSERT_TRUE(registry_.add(makeFenestration(Vessel::SuperiorMesenteric, 40.0, 12, 6.0), graft_));
    registry_.clear();
    EXPECT_TRUE(registry_.empty());
}

}  // anonymous namespace
}  // namespace graft_template::services
