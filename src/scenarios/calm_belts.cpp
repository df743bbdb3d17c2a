#include "accretion/scenarios/calm_belts.hpp"

#include "accretion/scenarios/generators.hpp"

ScenarioConfig CalmBeltsScenario::getConfig() const {
    ScenarioConfig config;
    config.preset = ScenarioPreset::CalmBelts;

    config.layout.centralMass = 600000.0;
    config.layout.beltRadii = {260.0, 520.0, 980.0, 1600.0};
    config.layout.bodiesPerBelt = 500;
    config.layout.beltWidth = 40.0;
    config.layout.beltMassMin = 6.0;
    config.layout.beltMassMax = 60.0;

    config.spawn.hazardRatePerSecond = 1.0 / 15.0;
    config.spawn.maxAttemptsPerTick = 1;

    config.mission = MissionSpec::survive(60.0);
    return config;
}

SimSettings CalmBeltsScenario::getSettings() const {
    SimSettings settings;
    settings.gravitationalConstant = 120.0;
    settings.dt = 0.008;
    settings.softening = 4.0;
    settings.maxSpeed = 1800.0;
    settings.theta = 0.6;
    settings.collisionMode = CollisionMode::Absorb;
    settings.restitution = 0.0;
    settings.adaptiveTheta = true;
    settings.thetaMin = 0.4;
    settings.thetaMax = 1.0;
    settings.adaptiveSoftening = true;
    settings.softeningMin = 2.0;
    settings.softeningMax = 10.0;
    settings.display.trailLifespan = 1.5;
    return settings;
}

void CalmBeltsScenario::createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                                       const ScenarioConfig& config, const SimSettings& settings) const {
    const auto& layout = config.layout;
    double const G = settings.gravitationalConstant;

    if (layout.centralMass > 0.0) {
        Generators::createCentralBody(bodies, layout.centralMass);
    }
    Generators::createBelts(bodies, rng, layout, layout.centralMass, G);
}
