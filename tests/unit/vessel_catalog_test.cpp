#include "services/catalog/vessel_catalog.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace graft_template::services;

TEST(VesselCatalogTest, EveryVesselHasMetadata) {
    for (auto vessel : kAllVessels) {
        const auto info = vesselInfo(vessel);
        EXPECT_FALSE(info.shortLabel.empty());
        EXPECT_FALSE(info.displayName.empty());
        EXPECT_NE(info.shortLabel, "?");
    }
}

TEST(VesselCatalogTest, ShortLabelsAreUnique) {
    std::set<std::string> labels;
    for (auto vessel : kAllVessels) {
        labels.emplace(vesselInfo(vessel).shortLabel);
    }
    EXPECT_EQ(labels.size(), kAllVessels.size());
}

TEST(VesselCatalogTest, ColorsAreDistinct) {
    std::set<std::string> colors;
    for (auto vessel : kAllVessels) {
        colors.insert(vesselInfo(vessel).color.toHex());
    }
    EXPECT_EQ(colors.size(), kAllVessels.size());
}

TEST(VesselCatalogTest, CanonicalLabels) {
    EXPECT_EQ(vesselInfo(Vessel::SuperiorMesenteric).shortLabel, "SMA");
    EXPECT_EQ(vesselInfo(Vessel::CeliacTrunk).shortLabel, "CT");
    EXPECT_EQ(vesselInfo(Vessel::RightRenal).shortLabel, "RRA");
    EXPECT_EQ(vesselInfo(Vessel::LeftRenal).shortLabel, "LRA");
}

TEST(VesselCatalogTest, KeyLookupByShortLabel) {
    EXPECT_EQ(vesselFromKey("SMA"), Vessel::SuperiorMesenteric);
    EXPECT_EQ(vesselFromKey("rra"), Vessel::RightRenal);
    EXPECT_EQ(vesselFromKey("  LRA "), Vessel::LeftRenal);
}

TEST(VesselCatalogTest, KeyLookupByDisplayName) {
    EXPECT_EQ(vesselFromKey("Celiac trunk"), Vessel::CeliacTrunk);
    EXPECT_EQ(vesselFromKey("INFERIOR MESENTERIC ARTERY"), Vessel::InferiorMesenteric);
}

TEST(VesselCatalogTest, UnknownKey) {
    EXPECT_FALSE(vesselFromKey("").has_value());
    EXPECT_FALSE(vesselFromKey("XYZ").has_value());
    EXPECT_FALSE(vesselFromKey("Renal").has_value());
}

TEST(VesselCatalogTest, KnownVessels) {
    for (auto vessel : kAllVessels) {
        EXPECT_TRUE(isKnownVessel(vessel));
    }
    EXPECT_FALSE(isKnownVessel(static_cast<Vessel>(-1)));
    EXPECT_FALSE(isKnownVessel(static_cast<Vessel>(kAllVessels.size())));
}
