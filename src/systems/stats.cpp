#include "accretion/systems/stats.hpp"

#include <algorithm>

namespace Systems {

namespace {

void resetStreak(StatsAggregate& stats) {
    stats.streak = 0;
    stats.multiplier = 1.0;
}

} // anonymous namespace

StatsAggregate reduceStats(StatsAggregate stats, const EventLog& log, const StatsConfig& config) {
    bool playerDied = false;

    for (const auto& e : log.events) {
        switch (e.type) {
            case EventType::Spawned:
                ++stats.bodiesSpawned;
                if (e.isHazard) {
                    ++stats.hazardsSpawned;
                }
                break;
            case EventType::Absorbed:
                if (e.playerInvolved) {
                    stats.score += e.mass * e.speed / BodyClasses::rarity(e.bodyClass) * stats.multiplier;
                    ++stats.playerAbsorbs;
                    ++stats.streak;
                    stats.bestStreak = std::max(stats.bestStreak, stats.streak);
                    stats.multiplier = std::min(config.maxMultiplier, 1.0 + config.streakBonus * stats.streak);
                }
                break;
            case EventType::Collided:
                ++stats.collisions;
                if (e.playerInvolved) {
                    resetStreak(stats);
                }
                break;
            case EventType::Died:
                ++stats.deaths;
                if (e.playerInvolved) {
                    resetStreak(stats);
                    playerDied = true;
                }
                break;
            case EventType::Evolved:
            case EventType::Reset:
                break;
        }
    }

    // No survival credit for the tick the player died in
    if (!playerDied) {
        stats.survivalTime += log.dt;
        stats.score += config.survivalPointsPerSecond * log.dt * stats.multiplier;
    }

    return stats;
}

} // namespace Systems
