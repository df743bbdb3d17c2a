/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include "accretion/core/scenario_manager.hpp"

#include "accretion/scenarios/binary_mayhem.hpp"
#include "accretion/scenarios/black_hole_arena.hpp"
#include "accretion/scenarios/calm_belts.hpp"
#include "accretion/scenarios/empty_space.hpp"
#include "accretion/scenarios/star_nursery.hpp"

std::unique_ptr<IScenario> ScenarioManager::createScenario(ScenarioPreset preset) {
  switch (preset) {
    case ScenarioPreset::CalmBelts:
      return std::make_unique<CalmBeltsScenario>();

    case ScenarioPreset::BinaryMayhem:
      return std::make_unique<BinaryMayhemScenario>();

    case ScenarioPreset::StarNursery:
      return std::make_unique<StarNurseryScenario>();

    case ScenarioPreset::BlackHoleArena:
      return std::make_unique<BlackHoleArenaScenario>();

    case ScenarioPreset::Empty:
      return std::make_unique<EmptyScenario>();
  }
  return std::make_unique<CalmBeltsScenario>();
}

ScenarioConfig ScenarioManager::defaultConfig(ScenarioPreset preset, std::uint64_t seed) {
  ScenarioConfig config = createScenario(preset)->getConfig();
  config.seed = seed;
  return config;
}

SimSettings ScenarioManager::defaultSettings(ScenarioPreset preset) {
  return createScenario(preset)->getSettings();
}
