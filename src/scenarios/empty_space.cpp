#include "accretion/scenarios/empty_space.hpp"

ScenarioConfig EmptyScenario::getConfig() const {
    ScenarioConfig config;
    config.preset = ScenarioPreset::Empty;
    config.player.enabled = false;
    config.spawn.hazardRatePerSecond = 0.0;
    config.mission = MissionSpec::survive(60.0);
    return config;
}

SimSettings EmptyScenario::getSettings() const {
    return SimSettings();
}

void EmptyScenario::createEntities(BodyRegistry& /*bodies*/, DeterministicRng& /*rng*/,
                                   const ScenarioConfig& /*config*/, const SimSettings& /*settings*/) const {
}
