/**
 * @file calm_belts.hpp
 * @brief Declaration of the CalmBeltsScenario class
 */

#pragma once

#include "accretion/scenarios/i_scenario.hpp"

/**
 * @class CalmBeltsScenario
 *
 * A single star with four asteroid belts on circular orbits.
 */
class CalmBeltsScenario : public IScenario {
public:
    CalmBeltsScenario() = default;
    ~CalmBeltsScenario() override = default;

    ScenarioConfig getConfig() const override;
    SimSettings getSettings() const override;
    void createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                        const ScenarioConfig& config, const SimSettings& settings) const override;
};
