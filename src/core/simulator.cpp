/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "accretion/core/simulator.hpp"

#include <algorithm>
#include <iostream>

#include "accretion/core/constants.hpp"
#include "accretion/core/debug.hpp"
#include "accretion/core/diagnostics.hpp"
#include "accretion/core/profile.hpp"
#include "accretion/core/scenario_manager.hpp"
#include "accretion/scenarios/generators.hpp"
#include "accretion/systems/collision.hpp"

ECSSimulator::ECSSimulator() {
    createSystems();
    loadScenario(ScenarioManager::defaultConfig(ScenarioPreset::Empty));
}

ECSSimulator::ECSSimulator(const ScenarioConfig& scenario) {
    createSystems();
    loadScenario(scenario);
}

ECSSimulator::~ECSSimulator() = default;

void ECSSimulator::createSystems() {
    systems.clear();

    forceSolver = std::make_unique<Systems::BarnesHutSystem>();

    auto spawnSystem = std::make_unique<Systems::HazardSpawnSystem>();
    auto leapfrog = std::make_unique<Systems::LeapfrogSystem>(*forceSolver);
    spawner = spawnSystem.get();
    integrator = leapfrog.get();

    // Pipeline order
    systems.push_back(std::move(spawnSystem));
    systems.push_back(std::move(leapfrog));
    systems.push_back(std::make_unique<Systems::CollisionSystem>());

    configureSystems();
}

void ECSSimulator::configureSystems() {
    forceSolver->setSystemConfig(currentSettings);
    for (auto& system : systems) {
        system->setSystemConfig(currentSettings);
    }
    spawner->setSpecificConfig(scenarioConfig.spawn);
}

void ECSSimulator::loadScenario(const ScenarioConfig& scenario) {
    scenarioPtr = ScenarioManager::createScenario(scenario.preset);
    scenarioConfig = scenario;
    currentSettings = scenarioPtr->getSettings();
    configureSystems();
    reset();
}

bool ECSSimulator::loadScenario(const ScenarioConfig& scenario, const SimSettings& settings) {
    std::string const problem = validateSettings(settings);
    if (!problem.empty()) {
        std::cerr << "[Settings] Warning: rejected settings for scenario "
                  << presetName(scenario.preset) << ": " << problem << "\n";
        return false;
    }

    scenarioPtr = ScenarioManager::createScenario(scenario.preset);
    scenarioConfig = scenario;
    currentSettings = settings;
    configureSystems();
    reset();
    return true;
}

bool ECSSimulator::applySettings(const SimSettings& settings) {
    std::string const problem = validateSettings(settings);
    if (!problem.empty()) {
        std::cerr << "[Settings] Warning: rejected settings bundle: " << problem << "\n";
        return false;
    }
    // Live hazards are never culled, so the cap cannot drop below them
    if (settings.maxHazards < bodies.liveHazardCount()) {
        std::cerr << "[Settings] Warning: rejected settings bundle: maxHazards " << settings.maxHazards
                  << " is below the " << bodies.liveHazardCount() << " live hazards\n";
        return false;
    }

    currentSettings = settings;
    configureSystems();
    integrator->invalidateAccelerations();
    return true;
}

void ECSSimulator::queueIntent(const IntentEvent& intent) {
    pendingIntents.push_back(intent);
}

void ECSSimulator::reset() {
    bodies.clear();
    rng.reseed(scenarioConfig.seed);
    pendingIntents.clear();
    deferredIntents.clear();

    if (scenarioPtr) {
        scenarioPtr->createEntities(bodies, rng, scenarioConfig, currentSettings);
    }

    if (scenarioConfig.player.enabled) {
        double const centralMass = scenarioConfig.layout.centralMass + scenarioConfig.layout.companionMass;
        Generators::createPlayer(bodies, scenarioConfig.player, centralMass, currentSettings.gravitationalConstant);
    }

    spawner->setSpecificConfig(scenarioConfig.spawn);
    integrator->invalidateAccelerations();

    std::optional<BodyClass> playerClass;
    if (bodies.player() != entt::null) {
        playerClass = bodies.describe(bodies.player()).bodyClass;
    }
    missionState = Systems::startMission(scenarioConfig.mission, playerClass);
    statsAggregate = StatsAggregate();
    ticks = 0;
    elapsed = 0.0;
    lastLog = EventLog();

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Simulator] reset " << presetName(scenarioConfig.preset)
              << " seed " << scenarioConfig.seed << " with " << bodies.liveCount() << " bodies\n");
}

const EventLog& ECSSimulator::finishWithReset() {
    reset();
    SimEvent e;
    e.type = EventType::Reset;
    lastLog.push(e);
    return lastLog;
}

const EventLog& ECSSimulator::tick() {
    PROFILE_SCOPE("ECSSimulator::tick");

    // Engine-generated intents from the previous tick come first
    std::vector<IntentEvent> batch = std::move(deferredIntents);
    deferredIntents.clear();
    batch.insert(batch.end(), pendingIntents.begin(), pendingIntents.end());
    pendingIntents.clear();

    bool const resetRequested = std::any_of(batch.begin(), batch.end(), [](const IntentEvent& intent) {
        return intent.type == IntentType::Reset;
    });
    if (resetRequested) {
        return finishWithReset();
    }

    if (missionState.terminal()) {
        // Frozen until reset
        lastLog = EventLog();
        lastLog.tick = ticks;
        return lastLog;
    }

    EventLog log;
    log.tick = ticks;
    log.dt = currentSettings.dt;

    TickContext ctx(rng, log);

    {
        PROFILE_SCOPE("ECSSimulator::intents");
        for (const auto& intent : batch) {
            applyIntent(intent, ctx);
        }
    }
    if (ctx.registryMutated) {
        integrator->invalidateAccelerations();
        ctx.registryMutated = false;
    }

    for (auto& system : systems) {
        system->update(bodies, ctx);

        if (ctx.consistencyFailure) {
            std::cerr << "[Simulator] Error: internal consistency failure at tick " << ticks
                      << ", resetting run\n";
            return finishWithReset();
        }
        if (ctx.registryMutated) {
            integrator->invalidateAccelerations();
            ctx.registryMutated = false;
        }
    }

    missionState = Systems::reduceMission(missionState, log);
    statsAggregate = Systems::reduceStats(statsAggregate, log, statsConfig);

    bodies.purgeDead();

    deferredIntents = std::move(ctx.deferredIntents);
    ++ticks;
    elapsed += currentSettings.dt;

    lastLog = std::move(log);
    return lastLog;
}

void ECSSimulator::applyIntent(const IntentEvent& intent, TickContext& ctx) {
    switch (intent.type) {
        case IntentType::Reset:
            break;

        case IntentType::SpawnBurst:
            if (Systems::HazardSpawnSystem::spawnBurst(bodies, rng, intent, currentSettings.maxBodies, ctx.log) > 0) {
                ctx.registryMutated = true;
            }
            break;

        case IntentType::SpawnBody: {
            if (bodies.liveCount() >= currentSettings.maxBodies) {
                std::cerr << "[Simulator] Warning: body limit " << currentSettings.maxBodies
                          << " reached, spawn ignored\n";
                break;
            }
            BodyDesc desc;
            desc.position = intent.center;
            desc.velocity = intent.velocity;
            desc.mass = intent.baseMass;
            desc.radius = intent.bodyRadius;
            desc.player = intent.asPlayer;
            if (Systems::HazardSpawnSystem::spawnBody(bodies, desc, ctx.log) != InvalidBodyId) {
                ctx.registryMutated = true;
            }
            break;
        }

        case IntentType::PlayerThrust: {
            auto playerEntity = bodies.player();
            if (playerEntity == entt::null) {
                break;
            }
            auto& registry = bodies.raw();
            double const mass = registry.get<Components::Mass>(playerEntity).value;
            double const boost = intent.boost ? SimulatorConstants::PlayerBoostFactor : 1.0;
            Vector const dv = intent.direction.normalizedOrZero() *
                              (SimulatorConstants::PlayerThrustForce * boost / mass * currentSettings.dt);
            registry.get<Components::Velocity>(playerEntity) += dv;
            break;
        }
    }
}

std::optional<BodySnapshot> ECSSimulator::player() const {
    auto entity = bodies.player();
    if (entity == entt::null) {
        return std::nullopt;
    }
    return bodies.describe(entity);
}

double ECSSimulator::totalEnergy() const {
    return Diagnostics::totalEnergy(bodies, currentSettings.gravitationalConstant, currentSettings.softening);
}

Vector ECSSimulator::totalMomentum() const {
    return Diagnostics::totalMomentum(bodies);
}

double ECSSimulator::totalMass() const {
    return Diagnostics::totalMass(bodies);
}
