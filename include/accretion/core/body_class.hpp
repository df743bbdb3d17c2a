/**
 * @file body_class.hpp
 * @brief Evolution classes of bodies and the mass-derived properties attached to them.
 */

#pragma once

#include <optional>
#include <string>

/**
 * @enum BodyClass
 * @brief Evolution state of a body. Ordered from lightest to heaviest.
 */
enum class BodyClass {
    Asteroid,
    Planet,
    Star,
    BlackHole
};

namespace BodyClasses {

    /**
     * @brief Class a body of the given mass belongs to
     */
    BodyClass fromMass(double mass);

    /**
     * @brief Default radius for a freshly spawned body of the given mass
     */
    double radiusForMass(double mass);

    /**
     * @brief Divisor applied to score gained by absorbing a body of this class
     */
    double rarity(BodyClass bodyClass);

    std::string name(BodyClass bodyClass);

    /**
     * @brief Parses a class name as produced by name()
     */
    std::optional<BodyClass> fromName(const std::string& name);

}
