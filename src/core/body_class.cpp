#include "accretion/core/body_class.hpp"

#include <algorithm>
#include <cmath>

#include "accretion/core/constants.hpp"

namespace BodyClasses {

BodyClass fromMass(double mass) {
    if (mass < SimulatorConstants::PlanetMassThreshold) {
        return BodyClass::Asteroid;
    }
    if (mass < SimulatorConstants::StarMassThreshold) {
        return BodyClass::Planet;
    }
    if (mass < SimulatorConstants::BlackHoleMassThreshold) {
        return BodyClass::Star;
    }
    return BodyClass::BlackHole;
}

double radiusForMass(double mass) {
    switch (fromMass(mass)) {
        case BodyClass::Asteroid:
            return std::clamp(std::sqrt(mass) * 0.12, 1.2, 6.0);
        case BodyClass::Planet:
            return std::clamp(std::sqrt(mass) * 0.07, 6.0, 16.0);
        case BodyClass::Star:
            return std::clamp(std::pow(mass, 0.33) * 0.6, 16.0, 32.0);
        case BodyClass::BlackHole:
            return std::clamp(std::pow(mass, 0.25) * 0.9, 32.0, 60.0);
    }
    return 1.0;
}

double rarity(BodyClass bodyClass) {
    switch (bodyClass) {
        case BodyClass::Asteroid:  return 1.0;
        case BodyClass::Planet:    return 5.0;
        case BodyClass::Star:      return 25.0;
        case BodyClass::BlackHole: return 100.0;
    }
    return 1.0;
}

std::string name(BodyClass bodyClass) {
    switch (bodyClass) {
        case BodyClass::Asteroid:  return "asteroid";
        case BodyClass::Planet:    return "planet";
        case BodyClass::Star:      return "star";
        case BodyClass::BlackHole: return "black_hole";
    }
    return "unknown";
}

std::optional<BodyClass> fromName(const std::string& name) {
    for (auto c : {BodyClass::Asteroid, BodyClass::Planet, BodyClass::Star, BodyClass::BlackHole}) {
        if (BodyClasses::name(c) == name) {
            return c;
        }
    }
    return std::nullopt;
}

} // namespace BodyClasses
