/**
 * @file hazard_spawner.hpp
 * @brief Seeded hazard injection and burst spawning
 */

#pragma once

#include <cstddef>

#include "accretion/core/body_registry.hpp"
#include "accretion/core/deterministic_rng.hpp"
#include "accretion/core/events.hpp"
#include "accretion/systems/i_system.hpp"

namespace Systems {

/**
 * @struct SpawnParams
 * @brief Hazard rate, kind distribution and per-kind parameters of a scenario
 */
struct SpawnParams {
    double hazardRatePerSecond = 1.0 / 15.0;
    std::size_t maxAttemptsPerTick = 1;

    // Relative weights of the hazard kinds; need not sum to 1
    double rogueStarWeight = 1.0;
    double microBlackHoleWeight = 1.0;
    double debrisStormWeight = 1.0;

    double rogueStarMass = 100000.0;
    double rogueStarDistance = 2000.0;
    double rogueStarSpeed = 300.0;

    double microBlackHoleMass = 1500000.0;
    double microBlackHoleDistance = 1500.0;

    std::size_t debrisCount = 100;
    double debrisRadius = 200.0;
    double debrisBaseMass = 20.0;
    double debrisSpeed = 400.0;
    double debrisDistance = 3000.0;

    bool operator==(const SpawnParams& other) const;
};

/**
 * @class HazardSpawnSystem
 * @brief Makes up to maxAttemptsPerTick spawn attempts per tick
 *
 * Each attempt draws once to decide whether it fires (probability
 * hazardRatePerSecond * dt), even when the hazard cap is reached, so the
 * RNG stream only depends on the tick count. A firing attempt is dropped
 * when the live hazard count is at maxHazards, otherwise it picks a kind
 * and spawns it around the anchor (the player, or the origin).
 * Nothing spawns into an empty registry.
 */
class HazardSpawnSystem : public ConfigurableSystem<SpawnParams> {
public:
    HazardSpawnSystem() = default;
    ~HazardSpawnSystem() override = default;

    void update(BodyRegistry& bodies, TickContext& ctx) override;

    /**
     * @brief Spawns a ring-shaped burst described by a SpawnBurst intent
     *
     * Bodies orbit the burst center tangentially with a small random jitter.
     * The count is cut down so that at most maxBodies are alive.
     *
     * @return Number of bodies created
     */
    static std::size_t spawnBurst(BodyRegistry& bodies, DeterministicRng& rng, const IntentEvent& burst,
                                  std::size_t maxBodies, EventLog& log);

    /**
     * @brief Creates one body and records a Spawned event
     * @return The new id, or InvalidBodyId when the registry rejected it
     */
    static BodyId spawnBody(BodyRegistry& bodies, const BodyDesc& desc, EventLog& log);

private:
    bool pickKind(DeterministicRng& rng, HazardKind& kind) const;
    void spawnHazard(BodyRegistry& bodies, TickContext& ctx, HazardKind kind, const Position& anchor) const;
};

} // namespace Systems
