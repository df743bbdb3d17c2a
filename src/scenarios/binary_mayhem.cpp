#include "accretion/scenarios/binary_mayhem.hpp"

#include "accretion/scenarios/generators.hpp"

ScenarioConfig BinaryMayhemScenario::getConfig() const {
    ScenarioConfig config;
    config.preset = ScenarioPreset::BinaryMayhem;

    config.layout.centralMass = 400000.0;
    config.layout.companionMass = 200000.0;
    config.layout.binarySeparation = 600.0;
    config.layout.beltRadii = {1100.0, 1500.0};
    config.layout.bodiesPerBelt = 400;
    config.layout.beltWidth = 60.0;
    config.layout.beltMassMin = 6.0;
    config.layout.beltMassMax = 60.0;

    config.spawn.hazardRatePerSecond = 1.0 / 10.0;
    config.spawn.maxAttemptsPerTick = 1;

    // Outside the binary, inside the belt
    config.player.orbitRadius = 750.0;

    config.mission = MissionSpec::survive(90.0);
    return config;
}

SimSettings BinaryMayhemScenario::getSettings() const {
    SimSettings settings;
    settings.gravitationalConstant = 200.0;
    settings.dt = 0.005;
    settings.softening = 8.0;
    settings.maxSpeed = 2500.0;
    settings.theta = 0.8;
    settings.collisionMode = CollisionMode::Elastic;
    settings.restitution = 0.9;
    settings.adaptiveTheta = true;
    settings.thetaMin = 0.6;
    settings.thetaMax = 1.2;
    settings.adaptiveSoftening = true;
    settings.softeningMin = 5.0;
    settings.softeningMax = 15.0;
    settings.display.trailLifespan = 2.0;
    return settings;
}

void BinaryMayhemScenario::createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                                          const ScenarioConfig& config, const SimSettings& settings) const {
    const auto& layout = config.layout;
    double const G = settings.gravitationalConstant;

    if (layout.centralMass > 0.0 && layout.companionMass > 0.0 && layout.binarySeparation > 0.0) {
        Generators::createBinary(bodies, layout.centralMass, layout.companionMass, layout.binarySeparation, G);
    } else if (layout.centralMass > 0.0) {
        Generators::createCentralBody(bodies, layout.centralMass);
    }

    // The belt orbits the pair's combined mass
    Generators::createBelts(bodies, rng, layout, layout.centralMass + layout.companionMass, G);
}
