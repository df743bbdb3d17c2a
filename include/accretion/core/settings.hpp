/**
 * @file settings.hpp
 * @brief Runtime settings bundle accepted from the controls layer.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "accretion/core/constants.hpp"

/**
 * @enum CollisionMode
 * @brief How overlapping bodies are resolved
 */
enum class CollisionMode {
    Absorb,
    Elastic
};

std::string collisionModeName(CollisionMode mode);
std::optional<CollisionMode> collisionModeFromName(const std::string& name);

/**
 * @enum ColorPalette
 * @brief Display hint only; the simulation never reads it
 */
enum class ColorPalette {
    Default,
    Colorblind
};

/**
 * @struct DisplayHints
 * @brief Presentation preferences carried alongside the settings bundle.
 */
struct DisplayHints {
    ColorPalette palette = ColorPalette::Default;
    bool trailsEnabled = true;
    double trailLifespan = 1.5;
};

/**
 * @struct SimSettings
 * @brief All tunables of the simulation step.
 *
 * Applied between ticks through ECSSimulator::applySettings(), which rejects
 * the whole bundle when validateSettings() reports a problem.
 */
struct SimSettings {
    // Barnes-Hut accuracy. Smaller = more accurate but slower
    double theta = 0.6;
    double softening = 4.0;
    double dt = 0.008;
    double gravitationalConstant = SimulatorConstants::DefaultG;

    CollisionMode collisionMode = CollisionMode::Absorb;
    double restitution = 0.8;

    std::size_t maxHazards = 4;
    std::size_t maxBodies = 50000;

    // 0 disables the clamp
    double maxSpeed = 0.0;

    std::size_t leafCapacity = 1;

    bool parallelForces = true;
    unsigned int workerThreads = 0;  ///< 0 = std::thread::hardware_concurrency()

    // Theta and softening lerped by local tree depth (dense regions: smaller theta, more softening)
    bool adaptiveTheta = false;
    double thetaMin = 0.4;
    double thetaMax = 1.0;
    bool adaptiveSoftening = false;
    double softeningMin = 2.0;
    double softeningMax = 10.0;

    DisplayHints display;
};

/**
 * @brief Checks a settings bundle.
 * @return Empty string when valid, otherwise a description of the first problem.
 */
std::string validateSettings(const SimSettings& settings);
