/**
 * @fileoverview main.cpp
 * @brief Headless driver: runs a scenario for a number of ticks and prints a summary.
 *
 * Usage:
 *   accretion_headless [--scenario NAME] [--seed N] [--ticks N] [--theta X] [--dt X]
 *                      [--softening X] [--mode absorb|elastic] [--restitution X]
 *                      [--max-hazards N] [--sequential] [--threads N]
 *                      [--load FILE] [--save FILE] [--profile] [--report-every N] [--events]
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "accretion/core/profile.hpp"
#include "accretion/core/scenario_config.hpp"
#include "accretion/core/scenario_manager.hpp"
#include "accretion/core/simulator.hpp"

namespace {

struct CliOptions {
    std::string scenario = "calm_belts";
    std::optional<std::uint64_t> seed;
    std::uint64_t ticks = 1000;
    std::uint64_t reportEvery = 100;
    std::optional<double> theta;
    std::optional<double> dt;
    std::optional<double> softening;
    std::optional<std::string> mode;
    std::optional<double> restitution;
    std::optional<std::size_t> maxHazards;
    bool sequential = false;
    std::optional<unsigned int> threads;
    std::string loadPath;
    std::string savePath;
    bool profile = false;
    bool events = false;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  --scenario NAME     calm_belts | binary_mayhem | star_nursery | black_hole_arena | empty\n"
              << "  --seed N            scenario seed (default: 42)\n"
              << "  --ticks N           number of ticks to run (default: 1000)\n"
              << "  --report-every N    print a status line every N ticks (0 = never)\n"
              << "  --theta X           Barnes-Hut opening angle\n"
              << "  --dt X              time step\n"
              << "  --softening X       gravitational softening length\n"
              << "  --mode M            absorb | elastic\n"
              << "  --restitution X     elastic restitution in [0, 1]\n"
              << "  --max-hazards N     concurrent hazard cap\n"
              << "  --sequential        evaluate forces on the calling thread only\n"
              << "  --threads N         worker tasks for force evaluation (0 = hardware)\n"
              << "  --load FILE         load a scenario document\n"
              << "  --save FILE         write the scenario document before running\n"
              << "  --profile           print the profiler report at the end\n"
              << "  --events            print every event as it happens\n";
}

bool parseNumber(const std::string& text, double& out) {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return !text.empty() && end == text.c_str() + text.size();
}

bool parseCount(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    char* end = nullptr;
    out = std::strtoull(text.c_str(), &end, 10);
    return end == text.c_str() + text.size();
}

bool parseArgs(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string const arg = argv[i];

        auto next = [&](std::string& value) {
            if (i + 1 >= argc) {
                std::cerr << "[CLI] Error: " << arg << " needs a value\n";
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        double number = 0.0;
        std::uint64_t count = 0;

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--sequential") {
            opts.sequential = true;
        } else if (arg == "--profile") {
            opts.profile = true;
        } else if (arg == "--events") {
            opts.events = true;
        } else if (arg == "--scenario") {
            if (!next(opts.scenario)) return false;
        } else if (arg == "--load") {
            if (!next(opts.loadPath)) return false;
        } else if (arg == "--save") {
            if (!next(opts.savePath)) return false;
        } else if (arg == "--mode") {
            if (!next(value)) return false;
            opts.mode = value;
        } else if (arg == "--seed" || arg == "--ticks" || arg == "--max-hazards" ||
                   arg == "--threads" || arg == "--report-every") {
            if (!next(value)) return false;
            if (!parseCount(value, count)) {
                std::cerr << "[CLI] Error: " << arg << " expects a non-negative integer, got '" << value << "'\n";
                return false;
            }
            if (arg == "--seed") opts.seed = count;
            else if (arg == "--ticks") opts.ticks = count;
            else if (arg == "--max-hazards") opts.maxHazards = static_cast<std::size_t>(count);
            else if (arg == "--threads") opts.threads = static_cast<unsigned int>(count);
            else opts.reportEvery = count;
        } else if (arg == "--theta" || arg == "--dt" || arg == "--softening" || arg == "--restitution") {
            if (!next(value)) return false;
            if (!parseNumber(value, number)) {
                std::cerr << "[CLI] Error: " << arg << " expects a number, got '" << value << "'\n";
                return false;
            }
            if (arg == "--theta") opts.theta = number;
            else if (arg == "--dt") opts.dt = number;
            else if (arg == "--softening") opts.softening = number;
            else opts.restitution = number;
        } else {
            std::cerr << "[CLI] Error: unknown option " << arg << "\n";
            return false;
        }
    }
    return true;
}

void printStatus(const ECSSimulator& sim) {
    const auto& stats = sim.stats();
    const auto& mission = sim.mission();
    std::cout << "tick " << sim.tickCount()
              << "  t=" << sim.elapsedTime()
              << "  bodies=" << sim.liveBodyCount()
              << "  hazards=" << sim.liveHazardCount()
              << "  score=" << stats.score
              << "  x" << stats.multiplier
              << "  mission=" << objectiveKindName(mission.spec.kind)
              << " " << mission.progress << "/" << mission.spec.target
              << " (" << missionStatusName(mission.status) << ")\n";
}

void printEvents(const EventLog& log) {
    for (const auto& e : log.events) {
        std::cout << "  [" << log.tick << "] " << eventTypeName(e.type);
        if (e.type != EventType::Reset) {
            std::cout << " #" << e.bodyId;
            if (e.otherId != InvalidBodyId) {
                std::cout << " <-> #" << e.otherId;
            }
            std::cout << " " << BodyClasses::name(e.bodyClass);
        }
        if (e.playerInvolved) {
            std::cout << " (player)";
        }
        std::cout << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    ScenarioConfig config;
    if (!opts.loadPath.empty()) {
        auto loaded = loadScenarioFile(opts.loadPath);
        if (!loaded) {
            std::cerr << "[CLI] Error: could not load scenario from " << opts.loadPath << "\n";
            return 1;
        }
        config = *loaded;
    } else {
        auto preset = presetFromName(opts.scenario);
        if (!preset) {
            std::cerr << "[CLI] Error: unknown scenario '" << opts.scenario << "'\n";
            printUsage(argv[0]);
            return 1;
        }
        config = ScenarioManager::defaultConfig(*preset);
    }
    if (opts.seed) {
        config.seed = *opts.seed;
    }

    if (!opts.savePath.empty() && !saveScenarioFile(config, opts.savePath)) {
        return 1;
    }

    SimSettings settings = ScenarioManager::defaultSettings(config.preset);
    if (opts.theta) settings.theta = *opts.theta;
    if (opts.dt) settings.dt = *opts.dt;
    if (opts.softening) settings.softening = *opts.softening;
    if (opts.restitution) settings.restitution = *opts.restitution;
    if (opts.maxHazards) settings.maxHazards = *opts.maxHazards;
    if (opts.threads) settings.workerThreads = *opts.threads;
    if (opts.sequential) settings.parallelForces = false;
    if (opts.mode) {
        auto mode = collisionModeFromName(*opts.mode);
        if (!mode) {
            std::cerr << "[CLI] Error: unknown collision mode '" << *opts.mode << "'\n";
            return 1;
        }
        settings.collisionMode = *mode;
    }

    ECSSimulator sim;
    if (!sim.loadScenario(config, settings)) {
        return 1;
    }

    std::cout << "scenario " << presetName(config.preset) << " seed " << config.seed
              << ": " << sim.liveBodyCount() << " bodies, E0=" << sim.totalEnergy() << "\n";

    for (std::uint64_t i = 0; i < opts.ticks; ++i) {
        sim.tick();
        if (opts.events) {
            printEvents(sim.lastEventLog());
        }
        if (opts.reportEvery > 0 && sim.tickCount() % opts.reportEvery == 0) {
            printStatus(sim);
        }
        if (sim.runState() != MissionStatus::InProgress) {
            break;
        }
    }

    printStatus(sim);
    const auto& stats = sim.stats();
    std::cout << "absorbs=" << stats.playerAbsorbs
              << " best_streak=" << stats.bestStreak
              << " collisions=" << stats.collisions
              << " spawned=" << stats.bodiesSpawned
              << " hazards=" << stats.hazardsSpawned
              << " deaths=" << stats.deaths
              << " E=" << sim.totalEnergy() << "\n";

    if (opts.profile) {
        Profiling::Profiler::printStats(std::cout);
    }

    return 0;
}
