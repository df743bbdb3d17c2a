#ifndef ACCRETION_COMPONENTS_BASIC_HPP
#define ACCRETION_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "accretion/core/body_class.hpp"
#include "accretion/math/vector_math.hpp" // for Position, Vector

/**
 * @brief Stable identity of a body within a run. Never reused.
 */
using BodyId = std::uint64_t;

constexpr BodyId InvalidBodyId = 0;

/**
 * @enum HazardKind
 * @brief Kinds of hazard the spawner can inject
 */
enum class HazardKind {
    RogueStar,
    MicroBlackHole,
    DebrisStorm
};

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // Written by the force solver, read by the integrator
    struct Acceleration {
        Vector value;
    };

    struct Identity {
        BodyId id;
    };

    struct Mass {
        double value;
    };

    struct Radius {
        double value;
    };

    struct Classification {
        BodyClass bodyClass;
    };

    // Dead bodies stay in the registry until the end of the tick
    struct Alive {
        bool value = true;
    };

    // Tag: the body controlled by the player
    struct Player {};

    struct Hazard {
        HazardKind kind;
    };

} // namespace Components

#endif
