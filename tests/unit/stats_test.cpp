#include <gtest/gtest.h>

#include "accretion/systems/stats.hpp"

using Systems::reduceStats;

class StatsTest : public ::testing::Test {
protected:
    StatsConfig config;

    static SimEvent absorbed(double mass, double speed, BodyClass bodyClass, bool player = true) {
        SimEvent e;
        e.type = EventType::Absorbed;
        e.mass = mass;
        e.speed = speed;
        e.bodyClass = bodyClass;
        e.playerInvolved = player;
        return e;
    }

    static SimEvent other(EventType type, bool player) {
        SimEvent e;
        e.type = type;
        e.playerInvolved = player;
        return e;
    }

    static EventLog logOf(std::initializer_list<SimEvent> events, double dt = 0.0) {
        EventLog log;
        log.dt = dt;
        log.events = events;
        return log;
    }
};

TEST_F(StatsTest, AbsorbScoreUsesRarityAndMultiplier) {
    StatsAggregate stats;

    stats = reduceStats(stats, logOf({absorbed(10.0, 2.0, BodyClass::Asteroid)}), config);
    EXPECT_DOUBLE_EQ(stats.score, 20.0);
    EXPECT_EQ(stats.streak, 1u);
    EXPECT_DOUBLE_EQ(stats.multiplier, 1.25);

    // 1000 * 5 / 5 (planet) at x1.25
    stats = reduceStats(stats, logOf({absorbed(1000.0, 5.0, BodyClass::Planet)}), config);
    EXPECT_DOUBLE_EQ(stats.score, 20.0 + 1250.0);
    EXPECT_EQ(stats.streak, 2u);
    EXPECT_DOUBLE_EQ(stats.multiplier, 1.5);
    EXPECT_EQ(stats.playerAbsorbs, 2u);
}

TEST_F(StatsTest, OtherAbsorbsDoNotScore) {
    StatsAggregate stats = reduceStats(StatsAggregate{}, logOf({absorbed(10.0, 2.0, BodyClass::Asteroid, false)}), config);
    EXPECT_DOUBLE_EQ(stats.score, 0.0);
    EXPECT_EQ(stats.streak, 0u);
}

TEST_F(StatsTest, MultiplierIsCapped) {
    StatsAggregate stats;
    for (int i = 0; i < 40; ++i) {
        stats = reduceStats(stats, logOf({absorbed(1.0, 1.0, BodyClass::Asteroid)}), config);
    }
    EXPECT_DOUBLE_EQ(stats.multiplier, config.maxMultiplier);
    EXPECT_EQ(stats.bestStreak, 40u);
}

TEST_F(StatsTest, PlayerContactResetsStreak) {
    StatsAggregate stats;
    stats = reduceStats(stats, logOf({
        absorbed(1.0, 1.0, BodyClass::Asteroid),
        absorbed(1.0, 1.0, BodyClass::Asteroid),
        other(EventType::Collided, true),
    }), config);

    EXPECT_EQ(stats.streak, 0u);
    EXPECT_DOUBLE_EQ(stats.multiplier, 1.0);
    EXPECT_EQ(stats.bestStreak, 2u);
    EXPECT_EQ(stats.collisions, 1u);
}

TEST_F(StatsTest, UnrelatedContactKeepsStreak) {
    StatsAggregate stats;
    stats = reduceStats(stats, logOf({
        absorbed(1.0, 1.0, BodyClass::Asteroid),
        other(EventType::Collided, false),
        other(EventType::Died, false),
    }), config);

    EXPECT_EQ(stats.streak, 1u);
    EXPECT_EQ(stats.deaths, 1u);
}

TEST_F(StatsTest, SurvivalPoints) {
    StatsAggregate stats;
    stats = reduceStats(stats, logOf({}, 0.5), config);
    EXPECT_DOUBLE_EQ(stats.survivalTime, 0.5);
    EXPECT_DOUBLE_EQ(stats.score, 5.0);
}

TEST_F(StatsTest, NoSurvivalCreditWhenPlayerDies) {
    StatsAggregate stats;
    stats = reduceStats(stats, logOf({other(EventType::Died, true)}, 0.5), config);
    EXPECT_DOUBLE_EQ(stats.survivalTime, 0.0);
    EXPECT_DOUBLE_EQ(stats.score, 0.0);
}

TEST_F(StatsTest, SpawnCounters) {
    SimEvent hazard = other(EventType::Spawned, false);
    hazard.isHazard = true;

    StatsAggregate stats = reduceStats(StatsAggregate{}, logOf({
        other(EventType::Spawned, false),
        other(EventType::Spawned, false),
        hazard,
    }), config);

    EXPECT_EQ(stats.bodiesSpawned, 3u);
    EXPECT_EQ(stats.hazardsSpawned, 1u);
}
