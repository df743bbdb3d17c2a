/**
 * @file stats.hpp
 * @brief Score, streak and counters derived from event logs
 */

#pragma once

#include <cstdint>

#include "accretion/core/events.hpp"

/**
 * @struct StatsConfig
 * @brief Scoring constants
 */
struct StatsConfig {
    double survivalPointsPerSecond = 10.0;
    double streakBonus = 0.25;  ///< multiplier gained per streak step
    double maxMultiplier = 5.0;
};

/**
 * @struct StatsAggregate
 * @brief Running totals of a run
 */
struct StatsAggregate {
    double score = 0.0;
    double multiplier = 1.0;
    std::uint32_t streak = 0;
    std::uint32_t bestStreak = 0;
    double survivalTime = 0.0;

    std::uint64_t playerAbsorbs = 0;
    std::uint64_t collisions = 0;
    std::uint64_t bodiesSpawned = 0;
    std::uint64_t hazardsSpawned = 0;
    std::uint64_t deaths = 0;
};

namespace Systems {

/**
 * @brief Folds one tick's event log into the aggregate
 *
 * Player absorbs score loserMass * loserSpeed / rarity at the current
 * multiplier, then extend the streak. A contact involving the player
 * (Collided) or the player's death drops the streak and multiplier back to
 * baseline. Survival points are added after the events.
 */
StatsAggregate reduceStats(StatsAggregate stats, const EventLog& log, const StatsConfig& config);

} // namespace Systems
