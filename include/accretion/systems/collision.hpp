/**
 * @file collision.hpp
 * @brief Overlap detection and resolution (elastic contact or absorption)
 */

#pragma once

#include <entt/entt.hpp>
#include <vector>

#include "accretion/systems/i_system.hpp"
#include "accretion/systems/quadtree.hpp"

namespace Systems {

/**
 * @struct CollisionPair
 * @brief Two overlapping bodies, `a` always has the lower id
 */
struct CollisionPair {
    BodyId a = InvalidBodyId;
    BodyId b = InvalidBodyId;
    entt::entity entityA = entt::null;
    entt::entity entityB = entt::null;
};

/**
 * @struct CollisionConfig
 * @brief Broad phase tuning
 */
struct CollisionConfig {
    std::size_t leafCapacity = 8;
};

/**
 * @class CollisionSystem
 * @brief Finds overlapping bodies after integration and resolves them
 *
 * Pairs are resolved one at a time in ascending (a, b) id order. A pair is
 * checked again just before it is resolved, so a body that died or moved
 * apart earlier in the same tick is skipped. In absorb mode the heavier body
 * (lower id on ties) takes the other's mass and momentum; the absorbed body
 * is marked dead and purged at the end of the tick by the simulator.
 */
class CollisionSystem : public ConfigurableSystem<CollisionConfig> {
public:
    CollisionSystem() = default;
    ~CollisionSystem() override = default;

    void update(BodyRegistry& bodies, TickContext& ctx) override;

    /**
     * @brief All overlapping live pairs, sorted by (a, b)
     */
    std::vector<CollisionPair> findOverlaps(const BodyRegistry& bodies);

private:
    bool resolveElastic(BodyRegistry& bodies, const CollisionPair& pair, TickContext& ctx) const;
    bool resolveAbsorb(BodyRegistry& bodies, const CollisionPair& pair, TickContext& ctx) const;

    Quadtree broadPhase;
};

} // namespace Systems
