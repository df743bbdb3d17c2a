/**
 * @file star_nursery.hpp
 * @brief Declaration of the StarNurseryScenario class
 */

#pragma once

#include "accretion/scenarios/i_scenario.hpp"

/**
 * @class StarNurseryScenario
 *
 * A cold cluster of heavy bodies collapsing from rest.
 */
class StarNurseryScenario : public IScenario {
public:
    StarNurseryScenario() = default;
    ~StarNurseryScenario() override = default;

    ScenarioConfig getConfig() const override;
    SimSettings getSettings() const override;
    void createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                        const ScenarioConfig& config, const SimSettings& settings) const override;
};
