/**
 * @fileoverview
 * @brief Implements an n-body gravitational solver using the Barnes-Hut algorithm.
 *
 * The Barnes-Hut algorithm reduces the computational complexity from O(n²) to O(n log n)
 * by approximating distant groups of bodies as single points. This system builds a quadtree
 * over all live bodies, aggregates mass and center of mass in each node, and writes the
 * softened acceleration of every body into its Acceleration component.
 *
 * Force evaluation can be split across worker tasks. Every body owns its output slot and
 * the tree is read-only during evaluation, so the result does not depend on how the work
 * was split.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "accretion/systems/i_system.hpp"
#include "accretion/systems/quadtree.hpp"

namespace Systems {

/**
 * @struct BarnesHutConfig
 * @brief Configuration parameters specific to the Barnes-Hut solver
 */
struct BarnesHutConfig {
    /**
     * @brief Below this many bodies per task the solver stays on the calling thread.
     */
    std::size_t minBodiesPerTask = 256;
};

/**
 * @class BarnesHutSystem
 * @brief N-body solver using the Barnes-Hut algorithm
 */
class BarnesHutSystem : public ConfigurableSystem<BarnesHutConfig> {
public:
    BarnesHutSystem();
    ~BarnesHutSystem() override = default;

    /**
     * @brief Computes and stores the acceleration of every live body
     * @param bodies The body registry
     * @param ctx Unused; present to fit the tick pipeline
     */
    void update(BodyRegistry& bodies, TickContext& ctx) override;

    /**
     * @brief Rebuilds the tree over `bodies` and returns one acceleration per body
     *
     * Uses theta, softening, G, leafCapacity and the parallel options of the
     * current settings bundle.
     */
    std::vector<Vector> computeAccelerations(const std::vector<TreeBody>& bodies);

    /**
     * @brief Tree of the last computeAccelerations() call
     */
    const Quadtree& tree() const { return tree_; }

    /**
     * @brief Number of tasks the last evaluation was split into (1 = sequential)
     */
    std::size_t lastTaskCount() const { return lastTaskCount_; }

private:
    void evaluateRange(std::size_t begin, std::size_t end, std::vector<Vector>& out) const;
    std::size_t taskCountFor(std::size_t bodyCount) const;

    Quadtree tree_;
    std::size_t lastTaskCount_ = 0;
};

}  // namespace Systems
