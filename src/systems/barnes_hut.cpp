/**
 * @fileoverview
 * @brief Barnes-Hut algorithm implementation for gravitational N-body simulation.
 */

#include "accretion/systems/barnes_hut.hpp"

#include <algorithm>
#include <future>
#include <thread>

#include "accretion/core/debug.hpp"
#include "accretion/core/profile.hpp"

namespace Systems {

BarnesHutSystem::BarnesHutSystem() {
    // No special setup; rely on default config
}

void BarnesHutSystem::update(BodyRegistry& bodies, TickContext& /*ctx*/) {
    PROFILE_SCOPE("BarnesHutSystem");

    auto live = bodies.liveEntitiesById();
    if (live.empty()) {
        tree_.build({});
        return;
    }

    auto& registry = bodies.raw();

    std::vector<TreeBody> input;
    input.reserve(live.size());
    for (auto entity : live) {
        const auto& pos = registry.get<Components::Position>(entity);
        TreeBody body;
        body.position = pos;
        body.mass = registry.get<Components::Mass>(entity).value;
        body.radius = registry.get<Components::Radius>(entity).value;
        input.push_back(body);
    }

    auto accelerations = computeAccelerations(input);

    for (std::size_t i = 0; i < live.size(); ++i) {
        registry.get<Components::Acceleration>(live[i]).value = accelerations[i];
    }
}

std::vector<Vector> BarnesHutSystem::computeAccelerations(const std::vector<TreeBody>& bodies) {
    {
        PROFILE_SCOPE("BarnesHut::buildTree");
        tree_.setLeafCapacity(sysConfig.leafCapacity);
        tree_.build(bodies);
    }

    std::vector<Vector> out(bodies.size());
    if (bodies.empty()) {
        lastTaskCount_ = 0;
        return out;
    }

    PROFILE_SCOPE("BarnesHut::forces");

    std::size_t const size = bodies.size();
    std::size_t const threads = taskCountFor(size);
    lastTaskCount_ = threads;

    if (threads <= 1) {
        evaluateRange(0, size, out);
        return out;
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[BarnesHut] splitting " << size << " bodies over " << threads << " tasks\n");

    std::vector<std::future<void>> fut(threads);
    for (std::size_t thread = 0; thread < threads; ++thread) {
        fut[thread] = std::async(
            std::launch::async,
            [this, thread, size, threads, &out]
        {
            evaluateRange(thread * size / threads, (thread + 1) * size / threads, out);
        });
    }
    for (std::size_t thread = 0; thread < threads; ++thread) {
        fut[thread].get();
    }

    return out;
}

void BarnesHutSystem::evaluateRange(std::size_t begin, std::size_t end, std::vector<Vector>& out) const {
    double const G = sysConfig.gravitationalConstant;

    for (std::size_t i = begin; i < end; ++i) {
        double theta = sysConfig.theta;
        double softening = sysConfig.softening;

        if (sysConfig.adaptiveTheta || sysConfig.adaptiveSoftening) {
            // Crowded regions get a tighter opening angle and more softening
            double density = tree_.densityFactor(tree_.bodies()[i].position);
            if (sysConfig.adaptiveTheta) {
                theta = sysConfig.thetaMax - (sysConfig.thetaMax - sysConfig.thetaMin) * density;
            }
            if (sysConfig.adaptiveSoftening) {
                softening = sysConfig.softeningMin + (sysConfig.softeningMax - sysConfig.softeningMin) * density;
            }
        }

        out[i] = tree_.accelerationOn(static_cast<std::uint32_t>(i), theta, softening, G);
    }
}

std::size_t BarnesHutSystem::taskCountFor(std::size_t bodyCount) const {
    if (!sysConfig.parallelForces) {
        return 1;
    }

    std::size_t workers = sysConfig.workerThreads;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }

    std::size_t const perTask = std::max<std::size_t>(1, specificConfig.minBodiesPerTask);
    std::size_t const bySize = std::max<std::size_t>(1, bodyCount / perTask);
    return std::min(workers, bySize);
}

}  // namespace Systems
