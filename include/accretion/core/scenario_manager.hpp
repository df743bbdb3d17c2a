/**
 * @fileoverview scenario_manager.hpp
 * @brief Creates scenario objects and their default parameter sets.
 */

#ifndef ACCRETION_SCENARIO_MANAGER_HPP
#define ACCRETION_SCENARIO_MANAGER_HPP

#include <cstdint>
#include <memory>

#include "accretion/core/scenario_config.hpp"
#include "accretion/scenarios/i_scenario.hpp"

/**
 * @class ScenarioManager
 * @brief Factory for the layout presets.
 */
class ScenarioManager {
 public:
  /**
   * @brief Creates a new scenario object of the specified preset.
   */
  static std::unique_ptr<IScenario> createScenario(ScenarioPreset preset);

  /**
   * @brief Default parameter set of a preset, with the given seed
   */
  static ScenarioConfig defaultConfig(ScenarioPreset preset, std::uint64_t seed = 42);

  /**
   * @brief Settings bundle a preset is tuned for
   */
  static SimSettings defaultSettings(ScenarioPreset preset);
};

#endif  // ACCRETION_SCENARIO_MANAGER_HPP
