#include "accretion/core/diagnostics.hpp"

#include <cmath>

namespace Diagnostics {

double kineticEnergy(const BodyRegistry& bodies) {
    const auto& registry = bodies.raw();
    double energy = 0.0;
    for (auto entity : bodies.liveEntitiesById()) {
        const auto& vel = registry.get<Components::Velocity>(entity);
        energy += 0.5 * registry.get<Components::Mass>(entity).value * vel.lengthSquared();
    }
    return energy;
}

double potentialEnergy(const BodyRegistry& bodies, double G, double softening) {
    const auto& registry = bodies.raw();
    auto live = bodies.liveEntitiesById();
    double const softeningSq = softening * softening;

    double energy = 0.0;
    for (std::size_t i = 0; i < live.size(); ++i) {
        const auto& pi = registry.get<Components::Position>(live[i]);
        double const mi = registry.get<Components::Mass>(live[i]).value;
        for (std::size_t j = i + 1; j < live.size(); ++j) {
            const auto& pj = registry.get<Components::Position>(live[j]);
            double const mj = registry.get<Components::Mass>(live[j]).value;
            double const d = std::sqrt(pi.distSquared(pj) + softeningSq);
            if (d > 0.0) {
                energy -= G * mi * mj / d;
            }
        }
    }
    return energy;
}

double totalEnergy(const BodyRegistry& bodies, double G, double softening) {
    return kineticEnergy(bodies) + potentialEnergy(bodies, G, softening);
}

Vector totalMomentum(const BodyRegistry& bodies) {
    const auto& registry = bodies.raw();
    Vector p(0.0, 0.0);
    for (auto entity : bodies.liveEntitiesById()) {
        p += registry.get<Components::Velocity>(entity) * registry.get<Components::Mass>(entity).value;
    }
    return p;
}

double totalMass(const BodyRegistry& bodies) {
    const auto& registry = bodies.raw();
    double m = 0.0;
    for (auto entity : bodies.liveEntitiesById()) {
        m += registry.get<Components::Mass>(entity).value;
    }
    return m;
}

std::vector<Vector> directAccelerations(const std::vector<Systems::TreeBody>& bodies,
                                        double G, double softening) {
    std::vector<Vector> out(bodies.size());
    double const softeningSq = softening * softening;

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        for (std::size_t j = 0; j < bodies.size(); ++j) {
            if (i == j) {
                continue;
            }
            double dx = bodies[j].position.x - bodies[i].position.x;
            double dy = bodies[j].position.y - bodies[i].position.y;
            double distSq = dx * dx + dy * dy + softeningSq;
            if (distSq <= 0.0) {
                continue;
            }
            double inv = G * bodies[j].mass / (distSq * std::sqrt(distSq));
            out[i].x += dx * inv;
            out[i].y += dy * inv;
        }
    }
    return out;
}

}
