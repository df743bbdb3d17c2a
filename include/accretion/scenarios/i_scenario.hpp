/**
 * @file i_scenario.hpp
 * @brief Declaration of the IScenario interface
 */

#pragma once

#include "accretion/core/body_registry.hpp"
#include "accretion/core/deterministic_rng.hpp"
#include "accretion/core/scenario_config.hpp"
#include "accretion/core/settings.hpp"

/**
 * @brief Abstract base class for any layout preset
 *
 * Each scenario must provide:
 *  - getConfig() returning its default ScenarioConfig
 *  - getSettings() returning the settings bundle it is tuned for
 *  - createEntities() that spawns the initial bodies (the player is added by the simulator)
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    /**
     * @brief Returns the preset's default seed, layout, spawn, player and mission parameters
     */
    virtual ScenarioConfig getConfig() const = 0;

    /**
     * @brief Returns the settings bundle the preset is tuned for
     */
    virtual SimSettings getSettings() const = 0;

    /**
     * @brief Creates the initial bodies described by config.layout
     *
     * All randomness is drawn from rng, so the layout is a function of the seed.
     */
    virtual void createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                                const ScenarioConfig& config, const SimSettings& settings) const = 0;
};
