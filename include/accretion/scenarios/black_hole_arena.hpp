/**
 * @file black_hole_arena.hpp
 * @brief Declaration of the BlackHoleArenaScenario class
 */

#pragma once

#include "accretion/scenarios/i_scenario.hpp"

/**
 * @class BlackHoleArenaScenario
 *
 * A central black hole with belts and frequent hazards.
 */
class BlackHoleArenaScenario : public IScenario {
public:
    BlackHoleArenaScenario() = default;
    ~BlackHoleArenaScenario() override = default;

    ScenarioConfig getConfig() const override;
    SimSettings getSettings() const override;
    void createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                        const ScenarioConfig& config, const SimSettings& settings) const override;
};
