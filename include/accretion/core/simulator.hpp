/**
 * @file simulator.hpp
 * @brief Main simulator class that owns the body registry and the run lifecycle.
 *
 * One tick:
 *   1. intents queued since the last tick are applied (a Reset replaces the run)
 *   2. hazard spawner
 *   3. leapfrog integrator (drives the Barnes-Hut force solver)
 *   4. collision resolver
 *   5. mission and stats reducers consume the tick's event log
 *   6. dead bodies are purged
 *
 * Outside layers only read from the simulator and queue intents or settings.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "accretion/core/body_registry.hpp"
#include "accretion/core/deterministic_rng.hpp"
#include "accretion/core/events.hpp"
#include "accretion/core/scenario_config.hpp"
#include "accretion/core/settings.hpp"
#include "accretion/scenarios/i_scenario.hpp"
#include "accretion/systems/barnes_hut.hpp"
#include "accretion/systems/i_system.hpp"
#include "accretion/systems/leapfrog.hpp"
#include "accretion/systems/hazard_spawner.hpp"
#include "accretion/systems/mission.hpp"
#include "accretion/systems/stats.hpp"

/**
 * @class ECSSimulator
 * @brief Deterministic simulation engine: scenario, systems, event log and reducers.
 */
class ECSSimulator {
public:
    /**
     * @brief Starts with the empty preset
     */
    ECSSimulator();

    /**
     * @brief Starts the given scenario with its preset's default settings
     */
    explicit ECSSimulator(const ScenarioConfig& scenario);

    ~ECSSimulator();

    ECSSimulator(const ECSSimulator&) = delete;
    ECSSimulator& operator=(const ECSSimulator&) = delete;

    /**
     * @brief Replaces the scenario, applies its preset settings and resets
     */
    void loadScenario(const ScenarioConfig& scenario);

    /**
     * @brief Replaces the scenario with explicit settings and resets
     * @return false (and nothing changes) when the settings are invalid
     */
    bool loadScenario(const ScenarioConfig& scenario, const SimSettings& settings);

    /**
     * @brief Validates and applies a settings bundle for the following ticks
     * @return false when rejected; the previous settings stay in force
     */
    bool applySettings(const SimSettings& settings);

    /**
     * @brief Queues an intent for the start of the next tick
     */
    void queueIntent(const IntentEvent& intent);

    /**
     * @brief Advances the run by one step of length settings().dt
     * @return The event log of this tick (valid until the next tick or reset)
     */
    const EventLog& tick();

    /**
     * @brief Restarts the current scenario from its seed, keeping the current settings
     */
    void reset();

    // Read-only surface
    std::vector<BodySnapshot> snapshot() const { return bodies.snapshot(); }
    std::optional<BodySnapshot> findBody(BodyId id) const { return bodies.get(id); }
    std::optional<BodySnapshot> player() const;
    const EventLog& lastEventLog() const { return lastLog; }
    const MissionState& mission() const { return missionState; }
    const StatsAggregate& stats() const { return statsAggregate; }
    MissionStatus runState() const { return missionState.status; }
    const SimSettings& settings() const { return currentSettings; }
    const ScenarioConfig& scenario() const { return scenarioConfig; }
    std::uint64_t tickCount() const { return ticks; }
    double elapsedTime() const { return elapsed; }
    std::size_t liveBodyCount() const { return bodies.liveCount(); }
    std::size_t liveHazardCount() const { return bodies.liveHazardCount(); }
    std::size_t pendingIntentCount() const { return pendingIntents.size() + deferredIntents.size(); }

    /**
     * @brief Exact total energy (kinetic + softened potential) of the live bodies
     */
    double totalEnergy() const;
    Vector totalMomentum() const;
    double totalMass() const;

private:
    void createSystems();
    void configureSystems();
    void applyIntent(const IntentEvent& intent, TickContext& ctx);
    const EventLog& finishWithReset();

    BodyRegistry bodies;
    DeterministicRng rng;

    std::unique_ptr<IScenario> scenarioPtr;
    ScenarioConfig scenarioConfig;
    SimSettings currentSettings;
    StatsConfig statsConfig;

    // Owned outside the pipeline; the integrator calls it twice per tick
    std::unique_ptr<Systems::BarnesHutSystem> forceSolver;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::HazardSpawnSystem* spawner = nullptr;
    Systems::LeapfrogSystem* integrator = nullptr;

    std::vector<IntentEvent> pendingIntents;
    std::vector<IntentEvent> deferredIntents;

    EventLog lastLog;
    MissionState missionState;
    StatsAggregate statsAggregate;
    std::uint64_t ticks = 0;
    double elapsed = 0.0;
};
