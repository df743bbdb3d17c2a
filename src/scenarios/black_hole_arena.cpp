#include "accretion/scenarios/black_hole_arena.hpp"

#include "accretion/scenarios/generators.hpp"

ScenarioConfig BlackHoleArenaScenario::getConfig() const {
    ScenarioConfig config;
    config.preset = ScenarioPreset::BlackHoleArena;

    config.layout.centralMass = 2000000.0;
    config.layout.beltRadii = {500.0, 900.0, 1400.0};
    config.layout.bodiesPerBelt = 400;
    config.layout.beltWidth = 50.0;
    config.layout.beltMassMin = 6.0;
    config.layout.beltMassMax = 80.0;

    config.spawn.hazardRatePerSecond = 1.0 / 8.0;
    config.spawn.maxAttemptsPerTick = 2;

    config.player.orbitRadius = 700.0;

    config.mission = MissionSpec::absorb(25);
    return config;
}

SimSettings BlackHoleArenaScenario::getSettings() const {
    SimSettings settings;
    settings.gravitationalConstant = 300.0;
    settings.dt = 0.003;
    settings.softening = 10.0;
    settings.maxSpeed = 3000.0;
    settings.theta = 0.9;
    settings.collisionMode = CollisionMode::Absorb;
    settings.restitution = 0.0;
    settings.maxHazards = 6;
    settings.adaptiveTheta = true;
    settings.thetaMin = 0.7;
    settings.thetaMax = 1.5;
    settings.adaptiveSoftening = true;
    settings.softeningMin = 8.0;
    settings.softeningMax = 20.0;
    settings.display.trailLifespan = 2.5;
    return settings;
}

void BlackHoleArenaScenario::createEntities(BodyRegistry& bodies, DeterministicRng& rng,
                                            const ScenarioConfig& config, const SimSettings& settings) const {
    const auto& layout = config.layout;
    double const G = settings.gravitationalConstant;

    if (layout.centralMass > 0.0) {
        Generators::createCentralBody(bodies, layout.centralMass);
    }
    Generators::createBelts(bodies, rng, layout, layout.centralMass, G);
}
