#include "accretion/scenarios/star_nursery.hpp"

#include "accretion/scenarios/generators.hpp"

ScenarioConfig StarNurseryScenario::getConfig() const {
    ScenarioConfig config;
    config.preset = ScenarioPreset::StarNursery;

    config.layout.clusterCount = 50;
    config.layout.clusterRadius = 1000.0;
    config.layout.clusterMassMin = 1000.0;
    config.layout.clusterMassMax = 50000.0;

    config.spawn.hazardRatePerSecond = 1.0 / 20.0;
    config.spawn.maxAttemptsPerTick = 1;

    config.mission = MissionSpec::evolveTo(BodyClass::Star);
    return config;
}

SimSettings StarNurseryScenario::getSettings() const {
    SimSettings settings;
    settings.gravitationalConstant = 150.0;
    settings.dt = 0.01;
    settings.softening = 6.0;
    settings.maxSpeed = 2000.0;
    settings.theta = 0.7;
    settings.collisionMode = CollisionMode::Absorb;
    settings.restitution = 0.0;
    settings.adaptiveTheta = true;
    settings.thetaMin = 0.5;
    settings.thetaMax = 1.1;
    settings.adaptiveSoftening = true;
    settings.softeningMin = 3.0;
    settings.softeningMax = 12.0;
    settings.display.trailLifespan = 1.8;
    return settings;
}

void StarNurseryScenario::createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                                         const ScenarioConfig& config, const SimSettings& /*settings*/) const {
    Generators::createCluster(bodies, rng, config.layout);
}
