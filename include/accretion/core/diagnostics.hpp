/**
 * @file diagnostics.hpp
 * @brief Exact (O(n²)) conserved quantities and reference accelerations
 */

#pragma once

#include <vector>

#include "accretion/core/body_registry.hpp"
#include "accretion/systems/quadtree.hpp"

namespace Diagnostics {

    double kineticEnergy(const BodyRegistry& bodies);

    /**
     * @brief Pairwise potential -G*mi*mj / sqrt(r² + ε²), consistent with the softened force law
     */
    double potentialEnergy(const BodyRegistry& bodies, double G, double softening);

    double totalEnergy(const BodyRegistry& bodies, double G, double softening);

    Vector totalMomentum(const BodyRegistry& bodies);

    double totalMass(const BodyRegistry& bodies);

    /**
     * @brief Direct-sum softened accelerations, the theta = 0 reference for the tree solver
     */
    std::vector<Vector> directAccelerations(const std::vector<Systems::TreeBody>& bodies,
                                            double G, double softening);

}
