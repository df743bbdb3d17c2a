/**
 * @file binary_mayhem.hpp
 * @brief Declaration of the BinaryMayhemScenario class
 */

#pragma once

#include "accretion/scenarios/i_scenario.hpp"

/**
 * @class BinaryMayhemScenario
 *
 * Two stars on a circular binary orbit inside a circumbinary belt.
 */
class BinaryMayhemScenario : public IScenario {
public:
    BinaryMayhemScenario() = default;
    ~BinaryMayhemScenario() override = default;

    ScenarioConfig getConfig() const override;
    SimSettings getSettings() const override;
    void createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                        const ScenarioConfig& config, const SimSettings& settings) const override;
};
