/**
 * @file generators.hpp
 * @brief Building blocks shared by the layout presets
 */

#pragma once

#include <cstddef>

#include "accretion/core/body_registry.hpp"
#include "accretion/core/deterministic_rng.hpp"
#include "accretion/core/scenario_config.hpp"

namespace Generators {

    /**
     * @brief Speed of a circular orbit of radius r around mass M (0 when M or r is not positive)
     */
    double circularSpeed(double G, double M, double r);

    BodyId createCentralBody(BodyRegistry& bodies, double mass);

    /**
     * @brief Two stars on a circular orbit about their common center of mass at the origin
     */
    void createBinary(BodyRegistry& bodies, double massA, double massB, double separation, double G);

    /**
     * @brief Rings of bodies on circular orbits around `centralMass` at the origin
     * @return Number of bodies created
     */
    std::size_t createBelts(BodyRegistry& bodies, DeterministicRng& rng, const LayoutParams& layout,
                            double centralMass, double G);

    /**
     * @brief Bodies at rest, rejection-sampled uniformly in a disc
     * @return Number of bodies created
     */
    std::size_t createCluster(BodyRegistry& bodies, DeterministicRng& rng, const LayoutParams& layout);

    /**
     * @brief Player body on +x, orbiting the layout's total central mass
     */
    BodyId createPlayer(BodyRegistry& bodies, const PlayerParams& player, double centralMass, double G);

}
