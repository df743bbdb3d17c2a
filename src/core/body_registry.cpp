/**
 * @fileoverview body_registry.cpp
 * @brief Implementation of BodyRegistry.
 */

#include "accretion/core/body_registry.hpp"

#include <cmath>
#include <iostream>

bool BodySnapshot::operator==(const BodySnapshot& other) const {
    return id == other.id &&
           position.x == other.position.x && position.y == other.position.y &&
           velocity.x == other.velocity.x && velocity.y == other.velocity.y &&
           mass == other.mass &&
           radius == other.radius &&
           bodyClass == other.bodyClass &&
           alive == other.alive &&
           isPlayer == other.isPlayer &&
           isHazard == other.isHazard &&
           (!isHazard || hazardKind == other.hazardKind);
}

BodyId BodyRegistry::create(const BodyDesc& desc) {
    if (!std::isfinite(desc.mass) || desc.mass <= 0.0) {
        std::cerr << "[BodyRegistry] Warning: rejected body with mass " << desc.mass << "\n";
        return InvalidBodyId;
    }
    if (!std::isfinite(desc.position.x) || !std::isfinite(desc.position.y) ||
        !std::isfinite(desc.velocity.x) || !std::isfinite(desc.velocity.y) ||
        !std::isfinite(desc.radius)) {
        std::cerr << "[BodyRegistry] Warning: rejected body with non-finite state\n";
        return InvalidBodyId;
    }

    double const radius = desc.radius < 0.0 ? BodyClasses::radiusForMass(desc.mass) : desc.radius;

    bool asPlayer = desc.player;
    if (asPlayer && player() != entt::null) {
        std::cerr << "[BodyRegistry] Warning: a player body already exists, spawning a plain body\n";
        asPlayer = false;
    }

    BodyId const id = nextId_++;
    auto e = registry.create();
    registry.emplace<Components::Identity>(e, id);
    registry.emplace<Components::Position>(e, desc.position.x, desc.position.y);
    registry.emplace<Components::Velocity>(e, desc.velocity.x, desc.velocity.y);
    registry.emplace<Components::Acceleration>(e, Vector(0.0, 0.0));
    registry.emplace<Components::Mass>(e, desc.mass);
    registry.emplace<Components::Radius>(e, radius);
    registry.emplace<Components::Classification>(e, BodyClasses::fromMass(desc.mass));
    registry.emplace<Components::Alive>(e, true);
    if (asPlayer) {
        registry.emplace<Components::Player>(e);
    }
    if (desc.hazard) {
        registry.emplace<Components::Hazard>(e, *desc.hazard);
    }

    byId.emplace(id, e);
    return id;
}

entt::entity BodyRegistry::find(BodyId id) const {
    auto it = byId.find(id);
    if (it == byId.end()) {
        return entt::null;
    }
    return it->second;
}

std::vector<entt::entity> BodyRegistry::liveEntitiesById() const {
    std::vector<entt::entity> out;
    out.reserve(byId.size());
    for (const auto& [id, e] : byId) {
        if (registry.get<Components::Alive>(e).value) {
            out.push_back(e);
        }
    }
    return out;
}

void BodyRegistry::markDead(entt::entity entity) {
    if (!registry.valid(entity)) {
        return;
    }
    registry.get<Components::Alive>(entity).value = false;
}

std::vector<BodyId> BodyRegistry::purgeDead() {
    std::vector<BodyId> removed;
    for (auto it = byId.begin(); it != byId.end();) {
        if (!registry.get<Components::Alive>(it->second).value) {
            removed.push_back(it->first);
            registry.destroy(it->second);
            it = byId.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t BodyRegistry::liveCount() const {
    std::size_t n = 0;
    for (const auto& [id, e] : byId) {
        if (registry.get<Components::Alive>(e).value) {
            ++n;
        }
    }
    return n;
}

std::size_t BodyRegistry::liveHazardCount() const {
    std::size_t n = 0;
    auto view = registry.view<const Components::Hazard, const Components::Alive>();
    for (auto [entity, hazard, alive] : view.each()) {
        if (alive.value) {
            ++n;
        }
    }
    return n;
}

entt::entity BodyRegistry::player() const {
    auto view = registry.view<const Components::Player, const Components::Alive>();
    for (auto entity : view) {
        if (view.get<const Components::Alive>(entity).value) {
            return entity;
        }
    }
    return entt::null;
}

BodySnapshot BodyRegistry::describe(entt::entity e) const {
    BodySnapshot s;
    s.id = registry.get<Components::Identity>(e).id;
    const auto& pos = registry.get<Components::Position>(e);
    const auto& vel = registry.get<Components::Velocity>(e);
    s.position = Position(pos.x, pos.y);
    s.velocity = Vector(vel.x, vel.y);
    s.mass = registry.get<Components::Mass>(e).value;
    s.radius = registry.get<Components::Radius>(e).value;
    s.bodyClass = registry.get<Components::Classification>(e).bodyClass;
    s.alive = registry.get<Components::Alive>(e).value;
    s.isPlayer = registry.all_of<Components::Player>(e);
    if (const auto* hazard = registry.try_get<Components::Hazard>(e)) {
        s.isHazard = true;
        s.hazardKind = hazard->kind;
    }
    return s;
}

std::vector<BodySnapshot> BodyRegistry::snapshot() const {
    std::vector<BodySnapshot> out;
    out.reserve(byId.size());
    for (const auto& [id, e] : byId) {
        out.push_back(describe(e));
    }
    return out;
}

std::optional<BodySnapshot> BodyRegistry::get(BodyId id) const {
    auto e = find(id);
    if (e == entt::null) {
        return std::nullopt;
    }
    return describe(e);
}

bool BodyRegistry::isAlive(entt::entity entity) const {
    return registry.valid(entity) && registry.get<Components::Alive>(entity).value;
}

void BodyRegistry::clear() {
    registry.clear();
    byId.clear();
    nextId_ = 1;
}
