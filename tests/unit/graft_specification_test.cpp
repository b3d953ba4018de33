#include "services/planning/graft_specification.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>

using namespace graft_template::services;

TEST(GraftSpecificationTest, CreateValid) {
    auto graft = GraftSpecification::create(24.0, 145.0, "TUBE-24-145");
    ASSERT_TRUE(graft.has_value());
    EXPECT_DOUBLE_EQ(graft->diameterMm(), 24.0);
    EXPECT_DOUBLE_EQ(graft->lengthMm(), 145.0);
    EXPECT_EQ(graft->name(), "TUBE-24-145");
}

TEST(GraftSpecificationTest, CircumferenceIsPiTimesDiameter) {
    for (double diameter : {20.0, 24.0, 28.0, 32.0, 36.0, 0.5, 123.456}) {
        auto graft = GraftSpecification::create(diameter, 100.0, "G");
        ASSERT_TRUE(graft.has_value());
        EXPECT_NEAR(graft->circumferenceMm(), std::numbers::pi * diameter, 1e-9);
    }
}

TEST(GraftSpecificationTest, Circumference24mm) {
    auto graft = GraftSpecification::create(24.0, 145.0, "G");
    ASSERT_TRUE(graft.has_value());
    EXPECT_NEAR(graft->circumferenceMm(), 75.398, 1e-3);
}

TEST(GraftSpecificationTest, RejectsNonPositiveDimensions) {
    auto zeroDiameter = GraftSpecification::create(0.0, 100.0, "G");
    ASSERT_FALSE(zeroDiameter.has_value());
    EXPECT_EQ(zeroDiameter.error().code, TemplateError::Code::InvalidParameter);

    auto negativeLength = GraftSpecification::create(24.0, -1.0, "G");
    ASSERT_FALSE(negativeLength.has_value());
    EXPECT_EQ(negativeLength.error().code, TemplateError::Code::InvalidParameter);
}

TEST(GraftSpecificationTest, RejectsNonFiniteDimensions) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    constexpr double inf = std::numeric_limits<double>::infinity();

    EXPECT_FALSE(GraftSpecification::create(nan, 100.0, "G").has_value());
    EXPECT_FALSE(GraftSpecification::create(24.0, inf, "G").has_value());
}

TEST(GraftSpecificationTest, ContainsDistanceIsInclusive) {
    auto graft = GraftSpecification::create(24.0, 145.0, "G");
    ASSERT_TRUE(graft.has_value());
    EXPECT_TRUE(graft->containsDistance(0.0));
    EXPECT_TRUE(graft->containsDistance(145.0));
    EXPECT_TRUE(graft->containsDistance(72.5));
    EXPECT_FALSE(graft->containsDistance(-0.1));
    EXPECT_FALSE(graft->containsDistance(145.1));
    EXPECT_FALSE(graft->containsDistance(std::numeric_limits<double>::quiet_NaN()));
}

TEST(GraftSpecificationTest, ErrorToStringNamesCode) {
    auto graft = GraftSpecification::create(-5.0, 100.0, "G");
    ASSERT_FALSE(graft.has_value());
    EXPECT_EQ(graft.error().toString().rfind("Invalid parameter: ", 0), 0u);
    EXPECT_FALSE(graft.error().isSuccess());
}
