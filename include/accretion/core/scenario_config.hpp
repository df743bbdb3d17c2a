/**
 * @file scenario_config.hpp
 * @brief Everything needed to start a run: seed, preset and parameter set.
 *
 * A scenario is immutable once a run has started. It round-trips through a
 * versioned key=value text document so that a run can be replayed exactly.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "accretion/systems/hazard_spawner.hpp"
#include "accretion/systems/mission.hpp"

/**
 * @enum ScenarioPreset
 * @brief Initial layouts
 */
enum class ScenarioPreset {
    CalmBelts,
    BinaryMayhem,
    StarNursery,
    BlackHoleArena,
    Empty
};

std::string presetName(ScenarioPreset preset);
std::optional<ScenarioPreset> presetFromName(const std::string& name);
std::vector<ScenarioPreset> getAllPresets();

/**
 * @struct LayoutParams
 * @brief Initial body layout. Each preset reads the fields it needs.
 */
struct LayoutParams {
    // Central body at the origin; 0 for none
    double centralMass = 0.0;

    // Second star of a binary; 0 for none
    double companionMass = 0.0;
    double binarySeparation = 600.0;

    // Rings of bodies on circular orbits around the central mass
    std::vector<double> beltRadii;
    std::size_t bodiesPerBelt = 0;
    double beltWidth = 40.0;
    double beltMassMin = 6.0;
    double beltMassMax = 60.0;

    // Bodies at rest, uniform in a disc
    std::size_t clusterCount = 0;
    double clusterRadius = 1000.0;
    double clusterMassMin = 1000.0;
    double clusterMassMax = 50000.0;

    bool operator==(const LayoutParams& other) const;
};

/**
 * @struct PlayerParams
 * @brief Player body placement
 */
struct PlayerParams {
    bool enabled = true;
    double mass = 80.0;
    double orbitRadius = 340.0;  ///< on +x, circular velocity around the layout's central mass

    bool operator==(const PlayerParams& other) const {
        return enabled == other.enabled && mass == other.mass && orbitRadius == other.orbitRadius;
    }
};

/**
 * @struct ScenarioConfig
 * @brief Seed, preset and parameters of a run
 */
struct ScenarioConfig {
    std::uint64_t seed = 42;
    ScenarioPreset preset = ScenarioPreset::CalmBelts;
    LayoutParams layout;
    Systems::SpawnParams spawn;
    PlayerParams player;
    MissionSpec mission;

    bool operator==(const ScenarioConfig& other) const;
    bool operator!=(const ScenarioConfig& other) const { return !(*this == other); }
};

/**
 * @brief Writes a scenario as a versioned key=value document
 */
std::string serializeScenario(const ScenarioConfig& config);

/**
 * @brief Parses a document written by serializeScenario()
 *
 * Keys may come in any order and missing keys keep their defaults. Unknown
 * keys, bad values and a wrong header or version reject the whole document.
 *
 * @return std::nullopt for a malformed document
 */
std::optional<ScenarioConfig> deserializeScenario(const std::string& text);

bool saveScenarioFile(const ScenarioConfig& config, const std::string& path);
std::optional<ScenarioConfig> loadScenarioFile(const std::string& path);
