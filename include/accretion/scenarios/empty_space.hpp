/**
 * @file empty_space.hpp
 * @brief Declaration of the EmptyScenario class
 */

#pragma once

#include "accretion/scenarios/i_scenario.hpp"

/**
 * @class EmptyScenario
 *
 * No initial bodies; used for sandboxes and tools.
 */
class EmptyScenario : public IScenario {
public:
    EmptyScenario() = default;
    ~EmptyScenario() override = default;

    ScenarioConfig getConfig() const override;
    SimSettings getSettings() const override;
    void createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                        const ScenarioConfig& config, const SimSettings& settings) const override;
};
