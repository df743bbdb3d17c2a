#include "accretion/systems/leapfrog.hpp"

#include "accretion/core/profile.hpp"

namespace Systems {

LeapfrogSystem::LeapfrogSystem(BarnesHutSystem& forces)
    : forces(forces) {}

void LeapfrogSystem::update(BodyRegistry& bodies, TickContext& ctx) {
    PROFILE_SCOPE("LeapfrogSystem");

    auto live = bodies.liveEntitiesById();
    if (live.empty()) {
        accelerationsValid = false;
        return;
    }

    double const dt = sysConfig.dt;
    auto& registry = bodies.raw();

    if (!accelerationsValid) {
        forces.update(bodies, ctx);
    }

    kick(bodies, 0.5 * dt, false);

    // Drift
    for (auto entity : live) {
        auto& pos = registry.get<Components::Position>(entity);
        const auto& vel = registry.get<Components::Velocity>(entity);
        pos.x += vel.x * dt;
        pos.y += vel.y * dt;
    }

    forces.update(bodies, ctx);

    kick(bodies, 0.5 * dt, true);

    accelerationsValid = true;
}

void LeapfrogSystem::kick(BodyRegistry& bodies, double halfDt, bool clamp) const {
    auto& registry = bodies.raw();
    double const maxSpeed = sysConfig.maxSpeed;

    for (auto entity : bodies.liveEntitiesById()) {
        auto& vel = registry.get<Components::Velocity>(entity);
        const auto& acc = registry.get<Components::Acceleration>(entity);
        vel.x += acc.value.x * halfDt;
        vel.y += acc.value.y * halfDt;

        if (clamp && maxSpeed > 0.0) {
            vel = vel.clampLength(maxSpeed);
        }
    }
}

} // namespace Systems
