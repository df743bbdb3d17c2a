/**
 * @file body_registry.hpp
 * @brief Owner of every body of a run, backed by an EnTT registry.
 *
 * Ids are handed out in increasing order and never reused until clear() starts
 * a new run. Iteration helpers return bodies in ascending id order so that
 * everything built on top of them is independent of EnTT's storage layout.
 */

#ifndef ACCRETION_BODY_REGISTRY_HPP
#define ACCRETION_BODY_REGISTRY_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "accretion/components/basic.hpp"

/**
 * @struct BodyDesc
 * @brief Initial state of a body to create
 */
struct BodyDesc {
    Position position;
    Vector velocity;
    double mass = 1.0;
    double radius = -1.0;  ///< < 0 picks BodyClasses::radiusForMass(mass)
    bool player = false;
    std::optional<HazardKind> hazard;
};

/**
 * @struct BodySnapshot
 * @brief Read-only copy of one body, handed to outside layers
 */
struct BodySnapshot {
    BodyId id = InvalidBodyId;
    Position position;
    Vector velocity;
    double mass = 0.0;
    double radius = 0.0;
    BodyClass bodyClass = BodyClass::Asteroid;
    bool alive = false;
    bool isPlayer = false;
    bool isHazard = false;
    HazardKind hazardKind = HazardKind::RogueStar;

    bool operator==(const BodySnapshot& other) const;
    bool operator!=(const BodySnapshot& other) const { return !(*this == other); }
};

class BodyRegistry {
public:
    BodyRegistry() = default;

    BodyRegistry(const BodyRegistry&) = delete;
    BodyRegistry& operator=(const BodyRegistry&) = delete;

    /**
     * @brief Adds a body.
     * @return The new id, or InvalidBodyId when mass/radius/state are not valid
     */
    BodyId create(const BodyDesc& desc);

    /**
     * @brief Entity of a body that is still in the registry (alive or pending purge)
     * @return entt::null when the id is unknown
     */
    entt::entity find(BodyId id) const;

    bool contains(BodyId id) const { return find(id) != entt::null; }

    /**
     * @brief Entities of all alive bodies, ascending id
     */
    std::vector<entt::entity> liveEntitiesById() const;

    /**
     * @brief Marks a body dead. It stays queryable until purgeDead().
     */
    void markDead(entt::entity entity);

    /**
     * @brief Removes all dead bodies.
     * @return Ids removed, ascending
     */
    std::vector<BodyId> purgeDead();

    std::size_t liveCount() const;
    std::size_t liveHazardCount() const;

    /**
     * @brief The live player body, or entt::null
     */
    entt::entity player() const;

    /**
     * @brief Copies of all bodies still in the registry, ascending id
     */
    std::vector<BodySnapshot> snapshot() const;

    std::optional<BodySnapshot> get(BodyId id) const;

    BodySnapshot describe(entt::entity entity) const;

    bool isAlive(entt::entity entity) const;

    BodyId nextId() const { return nextId_; }

    /**
     * @brief Drops every body and restarts id numbering (new run)
     */
    void clear();

    entt::registry& raw() { return registry; }
    const entt::registry& raw() const { return registry; }

private:
    entt::registry registry;
    std::map<BodyId, entt::entity> byId;
    BodyId nextId_ = 1;
};

#endif // ACCRETION_BODY_REGISTRY_HPP
