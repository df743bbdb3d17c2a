/**
 * @fileoverview scenario_config.cpp
 * @brief Scenario presets names and key=value persistence.
 */

#include "accretion/core/scenario_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>

namespace {

const char* const ScenarioHeader = "accretion-scenario";
const int ScenarioFormatVersion = 1;

std::string formatDouble(double value) {
    std::ostringstream out;
    out.precision(std::numeric_limits<double>::max_digits10);
    out << value;
    return out.str();
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parseUnsigned(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return false;
    }
    out = static_cast<std::uint64_t>(value);
    return true;
}

bool parseSize(const std::string& text, std::size_t& out) {
    std::uint64_t value = 0;
    if (!parseUnsigned(text, value)) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

bool parseBool(const std::string& text, bool& out) {
    if (text == "true" || text == "1") {
        out = true;
        return true;
    }
    if (text == "false" || text == "0") {
        out = false;
        return true;
    }
    return false;
}

std::string formatList(const std::vector<double>& values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += formatDouble(values[i]);
    }
    return out;
}

bool parseList(const std::string& text, std::vector<double>& out) {
    out.clear();
    if (text.empty()) {
        return true;
    }
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        double value = 0.0;
        if (!parseDouble(item, value)) {
            return false;
        }
        out.push_back(value);
    }
    return true;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

std::string presetName(ScenarioPreset preset) {
    switch (preset) {
        case ScenarioPreset::CalmBelts:      return "calm_belts";
        case ScenarioPreset::BinaryMayhem:   return "binary_mayhem";
        case ScenarioPreset::StarNursery:    return "star_nursery";
        case ScenarioPreset::BlackHoleArena: return "black_hole_arena";
        case ScenarioPreset::Empty:          return "empty";
    }
    return "calm_belts";
}

std::optional<ScenarioPreset> presetFromName(const std::string& name) {
    for (auto preset : getAllPresets()) {
        if (presetName(preset) == name) {
            return preset;
        }
    }
    return std::nullopt;
}

std::vector<ScenarioPreset> getAllPresets() {
    return {
        ScenarioPreset::CalmBelts,
        ScenarioPreset::BinaryMayhem,
        ScenarioPreset::StarNursery,
        ScenarioPreset::BlackHoleArena,
        ScenarioPreset::Empty
    };
}

bool LayoutParams::operator==(const LayoutParams& other) const {
    return centralMass == other.centralMass &&
           companionMass == other.companionMass &&
           binarySeparation == other.binarySeparation &&
           beltRadii == other.beltRadii &&
           bodiesPerBelt == other.bodiesPerBelt &&
           beltWidth == other.beltWidth &&
           beltMassMin == other.beltMassMin &&
           beltMassMax == other.beltMassMax &&
           clusterCount == other.clusterCount &&
           clusterRadius == other.clusterRadius &&
           clusterMassMin == other.clusterMassMin &&
           clusterMassMax == other.clusterMassMax;
}

bool ScenarioConfig::operator==(const ScenarioConfig& other) const {
    return seed == other.seed &&
           preset == other.preset &&
           layout == other.layout &&
           spawn == other.spawn &&
           player == other.player &&
           mission == other.mission;
}

std::string serializeScenario(const ScenarioConfig& config) {
    std::ostringstream out;
    out << ScenarioHeader << " " << ScenarioFormatVersion << "\n";
    out << "seed=" << config.seed << "\n";
    out << "preset=" << presetName(config.preset) << "\n";

    const auto& l = config.layout;
    out << "layout.central_mass=" << formatDouble(l.centralMass) << "\n";
    out << "layout.companion_mass=" << formatDouble(l.companionMass) << "\n";
    out << "layout.binary_separation=" << formatDouble(l.binarySeparation) << "\n";
    out << "layout.belt_radii=" << formatList(l.beltRadii) << "\n";
    out << "layout.bodies_per_belt=" << l.bodiesPerBelt << "\n";
    out << "layout.belt_width=" << formatDouble(l.beltWidth) << "\n";
    out << "layout.belt_mass_min=" << formatDouble(l.beltMassMin) << "\n";
    out << "layout.belt_mass_max=" << formatDouble(l.beltMassMax) << "\n";
    out << "layout.cluster_count=" << l.clusterCount << "\n";
    out << "layout.cluster_radius=" << formatDouble(l.clusterRadius) << "\n";
    out << "layout.cluster_mass_min=" << formatDouble(l.clusterMassMin) << "\n";
    out << "layout.cluster_mass_max=" << formatDouble(l.clusterMassMax) << "\n";

    const auto& s = config.spawn;
    out << "spawn.hazard_rate=" << formatDouble(s.hazardRatePerSecond) << "\n";
    out << "spawn.max_attempts=" << s.maxAttemptsPerTick << "\n";
    out << "spawn.weight.rogue_star=" << formatDouble(s.rogueStarWeight) << "\n";
    out << "spawn.weight.micro_black_hole=" << formatDouble(s.microBlackHoleWeight) << "\n";
    out << "spawn.weight.debris_storm=" << formatDouble(s.debrisStormWeight) << "\n";
    out << "spawn.rogue_star.mass=" << formatDouble(s.rogueStarMass) << "\n";
    out << "spawn.rogue_star.distance=" << formatDouble(s.rogueStarDistance) << "\n";
    out << "spawn.rogue_star.speed=" << formatDouble(s.rogueStarSpeed) << "\n";
    out << "spawn.micro_black_hole.mass=" << formatDouble(s.microBlackHoleMass) << "\n";
    out << "spawn.micro_black_hole.distance=" << formatDouble(s.microBlackHoleDistance) << "\n";
    out << "spawn.debris.count=" << s.debrisCount << "\n";
    out << "spawn.debris.radius=" << formatDouble(s.debrisRadius) << "\n";
    out << "spawn.debris.base_mass=" << formatDouble(s.debrisBaseMass) << "\n";
    out << "spawn.debris.speed=" << formatDouble(s.debrisSpeed) << "\n";
    out << "spawn.debris.distance=" << formatDouble(s.debrisDistance) << "\n";

    out << "player.enabled=" << (config.player.enabled ? "true" : "false") << "\n";
    out << "player.mass=" << formatDouble(config.player.mass) << "\n";
    out << "player.orbit_radius=" << formatDouble(config.player.orbitRadius) << "\n";

    out << "mission.objective=" << objectiveKindName(config.mission.kind) << "\n";
    out << "mission.target=" << formatDouble(config.mission.target) << "\n";

    return out.str();
}

std::optional<ScenarioConfig> deserializeScenario(const std::string& text) {
    std::istringstream in(text);
    std::string line;

    // Header: "accretion-scenario <version>"
    if (!std::getline(in, line)) {
        std::cerr << "[Scenario] Warning: empty scenario document\n";
        return std::nullopt;
    }
    {
        std::istringstream header(trim(line));
        std::string name;
        int version = 0;
        if (!(header >> name >> version) || name != ScenarioHeader) {
            std::cerr << "[Scenario] Warning: missing scenario header\n";
            return std::nullopt;
        }
        if (version != ScenarioFormatVersion) {
            std::cerr << "[Scenario] Warning: unsupported scenario version " << version << "\n";
            return std::nullopt;
        }
    }

    ScenarioConfig config;
    auto& l = config.layout;
    auto& s = config.spawn;

    auto number = [](double& field) {
        return [target = &field](const std::string& v) { return parseDouble(v, *target); };
    };
    auto count = [](std::size_t& field) {
        return [target = &field](const std::string& v) { return parseSize(v, *target); };
    };

    const std::map<std::string, std::function<bool(const std::string&)>> parsers = {
        {"seed", [&config](const std::string& v) { return parseUnsigned(v, config.seed); }},
        {"preset", [&config](const std::string& v) {
            auto preset = presetFromName(v);
            if (!preset) {
                return false;
            }
            config.preset = *preset;
            return true;
        }},
        {"layout.central_mass", number(l.centralMass)},
        {"layout.companion_mass", number(l.companionMass)},
        {"layout.binary_separation", number(l.binarySeparation)},
        {"layout.belt_radii", [&l](const std::string& v) { return parseList(v, l.beltRadii); }},
        {"layout.bodies_per_belt", count(l.bodiesPerBelt)},
        {"layout.belt_width", number(l.beltWidth)},
        {"layout.belt_mass_min", number(l.beltMassMin)},
        {"layout.belt_mass_max", number(l.beltMassMax)},
        {"layout.cluster_count", count(l.clusterCount)},
        {"layout.cluster_radius", number(l.clusterRadius)},
        {"layout.cluster_mass_min", number(l.clusterMassMin)},
        {"layout.cluster_mass_max", number(l.clusterMassMax)},
        {"spawn.hazard_rate", number(s.hazardRatePerSecond)},
        {"spawn.max_attempts", count(s.maxAttemptsPerTick)},
        {"spawn.weight.rogue_star", number(s.rogueStarWeight)},
        {"spawn.weight.micro_black_hole", number(s.microBlackHoleWeight)},
        {"spawn.weight.debris_storm", number(s.debrisStormWeight)},
        {"spawn.rogue_star.mass", number(s.rogueStarMass)},
        {"spawn.rogue_star.distance", number(s.rogueStarDistance)},
        {"spawn.rogue_star.speed", number(s.rogueStarSpeed)},
        {"spawn.micro_black_hole.mass", number(s.microBlackHoleMass)},
        {"spawn.micro_black_hole.distance", number(s.microBlackHoleDistance)},
        {"spawn.debris.count", count(s.debrisCount)},
        {"spawn.debris.radius", number(s.debrisRadius)},
        {"spawn.debris.base_mass", number(s.debrisBaseMass)},
        {"spawn.debris.speed", number(s.debrisSpeed)},
        {"spawn.debris.distance", number(s.debrisDistance)},
        {"player.enabled", [&config](const std::string& v) { return parseBool(v, config.player.enabled); }},
        {"player.mass", number(config.player.mass)},
        {"player.orbit_radius", number(config.player.orbitRadius)},
        {"mission.objective", [&config](const std::string& v) {
            auto kind = objectiveKindFromName(v);
            if (!kind) {
                return false;
            }
            config.mission.kind = *kind;
            return true;
        }},
        {"mission.target", number(config.mission.target)},
    };

    int lineNumber = 1;
    while (std::getline(in, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[Scenario] Warning: line " << lineNumber << " is not key=value\n";
            return std::nullopt;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        auto it = parsers.find(key);
        if (it == parsers.end()) {
            std::cerr << "[Scenario] Warning: unknown key '" << key << "' on line " << lineNumber << "\n";
            return std::nullopt;
        }
        if (!it->second(value)) {
            std::cerr << "[Scenario] Warning: bad value '" << value << "' for " << key << "\n";
            return std::nullopt;
        }
    }

    return config;
}

bool saveScenarioFile(const ScenarioConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Scenario] Error: cannot open " << path << " for writing\n";
        return false;
    }
    file << serializeScenario(config);
    if (!file.good()) {
        std::cerr << "[Scenario] Error: failed writing " << path << "\n";
        return false;
    }
    return true;
}

std::optional<ScenarioConfig> loadScenarioFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Scenario] Error: cannot open " << path << "\n";
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return deserializeScenario(buffer.str());
}
