#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "accretion/core/body_class.hpp"
#include "accretion/core/settings.hpp"

TEST(SettingsTest, DefaultsAreValid) {
    SimSettings settings;
    EXPECT_TRUE(validateSettings(settings).empty());
}

TEST(SettingsTest, RejectsOutOfRangeValues) {
    {
        SimSettings s;
        s.theta = 0.0;
        EXPECT_FALSE(validateSettings(s).empty());
    }
    {
        SimSettings s;
        s.dt = -0.01;
        EXPECT_FALSE(validateSettings(s).empty());
    }
    {
        SimSettings s;
        s.softening = -1.0;
        EXPECT_FALSE(validateSettings(s).empty());
    }
    {
        SimSettings s;
        s.restitution = 1.5;
        EXPECT_FALSE(validateSettings(s).empty());
    }
    {
        SimSettings s;
        s.dt = std::numeric_limits<double>::quiet_NaN();
        EXPECT_FALSE(validateSettings(s).empty());
    }
    {
        SimSettings s;
        s.leafCapacity = 0;
        EXPECT_FALSE(validateSettings(s).empty());
    }
    {
        SimSettings s;
        s.adaptiveTheta = true;
        s.thetaMin = 1.2;
        s.thetaMax = 0.8;
        EXPECT_FALSE(validateSettings(s).empty());
    }
}

TEST(SettingsTest, BoundaryValuesAccepted) {
    SimSettings s;
    s.softening = 0.0;
    s.restitution = 1.0;
    s.maxHazards = 0;
    EXPECT_TRUE(validateSettings(s).empty());

    s.restitution = 0.0;
    EXPECT_TRUE(validateSettings(s).empty());
}

TEST(SettingsTest, CollisionModeNames) {
    EXPECT_EQ(collisionModeFromName("absorb"), CollisionMode::Absorb);
    EXPECT_EQ(collisionModeFromName("elastic"), CollisionMode::Elastic);
    EXPECT_FALSE(collisionModeFromName("sticky").has_value());
    EXPECT_EQ(collisionModeName(CollisionMode::Elastic), "elastic");
}

TEST(BodyClassTest, ClassFromMassThresholds) {
    EXPECT_EQ(BodyClasses::fromMass(10.0), BodyClass::Asteroid);
    EXPECT_EQ(BodyClasses::fromMass(499.0), BodyClass::Asteroid);
    EXPECT_EQ(BodyClasses::fromMass(500.0), BodyClass::Planet);
    EXPECT_EQ(BodyClasses::fromMass(20000.0), BodyClass::Star);
    EXPECT_EQ(BodyClasses::fromMass(1e6), BodyClass::BlackHole);
}

TEST(BodyClassTest, RadiusStaysInClassBand) {
    EXPECT_DOUBLE_EQ(BodyClasses::radiusForMass(1.0), 1.2);
    EXPECT_DOUBLE_EQ(BodyClasses::radiusForMass(100.0), 1.2);
    EXPECT_DOUBLE_EQ(BodyClasses::radiusForMass(2000.0), 6.0);
    EXPECT_DOUBLE_EQ(BodyClasses::radiusForMass(1e5), std::pow(1e5, 0.33) * 0.6);
    EXPECT_DOUBLE_EQ(BodyClasses::radiusForMass(2e6), std::pow(2e6, 0.25) * 0.9);
}

TEST(BodyClassTest, NamesRoundTrip) {
    for (auto c : {BodyClass::Asteroid, BodyClass::Planet, BodyClass::Star, BodyClass::BlackHole}) {
        EXPECT_EQ(BodyClasses::fromName(BodyClasses::name(c)), c);
    }
    EXPECT_FALSE(BodyClasses::fromName("comet").has_value());
    EXPECT_DOUBLE_EQ(BodyClasses::rarity(BodyClass::Star), 25.0);
}
