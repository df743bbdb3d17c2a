#include "accretion/systems/hazard_spawner.hpp"

#include <algorithm>
#include <cmath>

#include "accretion/core/constants.hpp"
#include "accretion/core/debug.hpp"
#include "accretion/core/profile.hpp"

namespace Systems {

bool SpawnParams::operator==(const SpawnParams& other) const {
    return hazardRatePerSecond == other.hazardRatePerSecond &&
           maxAttemptsPerTick == other.maxAttemptsPerTick &&
           rogueStarWeight == other.rogueStarWeight &&
           microBlackHoleWeight == other.microBlackHoleWeight &&
           debrisStormWeight == other.debrisStormWeight &&
           rogueStarMass == other.rogueStarMass &&
           rogueStarDistance == other.rogueStarDistance &&
           rogueStarSpeed == other.rogueStarSpeed &&
           microBlackHoleMass == other.microBlackHoleMass &&
           microBlackHoleDistance == other.microBlackHoleDistance &&
           debrisCount == other.debrisCount &&
           debrisRadius == other.debrisRadius &&
           debrisBaseMass == other.debrisBaseMass &&
           debrisSpeed == other.debrisSpeed &&
           debrisDistance == other.debrisDistance;
}

void HazardSpawnSystem::update(BodyRegistry& bodies, TickContext& ctx) {
    PROFILE_SCOPE("HazardSpawnSystem");

    if (bodies.liveCount() == 0) {
        return;
    }

    double const p = std::min(1.0, std::max(0.0, specificConfig.hazardRatePerSecond * sysConfig.dt));

    for (std::size_t attempt = 0; attempt < specificConfig.maxAttemptsPerTick; ++attempt) {
        if (!ctx.rng.bernoulli(p)) {
            continue;
        }
        if (bodies.liveHazardCount() >= sysConfig.maxHazards) {
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Spawner] hazard cap reached, attempt dropped\n");
            continue;
        }

        HazardKind kind = HazardKind::RogueStar;
        if (!pickKind(ctx.rng, kind)) {
            continue;
        }

        Position anchor(0.0, 0.0);
        auto player = bodies.player();
        if (player != entt::null) {
            anchor = bodies.raw().get<Components::Position>(player);
        }

        spawnHazard(bodies, ctx, kind, anchor);
    }
}

bool HazardSpawnSystem::pickKind(DeterministicRng& rng, HazardKind& kind) const {
    double const rogue = std::max(0.0, specificConfig.rogueStarWeight);
    double const hole = std::max(0.0, specificConfig.microBlackHoleWeight);
    double const debris = std::max(0.0, specificConfig.debrisStormWeight);
    double const total = rogue + hole + debris;

    double u = rng.uniform() * total;
    if (total <= 0.0) {
        return false;
    }

    if (u < rogue) {
        kind = HazardKind::RogueStar;
    } else if (u < rogue + hole) {
        kind = HazardKind::MicroBlackHole;
    } else {
        kind = HazardKind::DebrisStorm;
    }
    return true;
}

void HazardSpawnSystem::spawnHazard(BodyRegistry& bodies, TickContext& ctx, HazardKind kind,
                                    const Position& anchor) const {
    double const angle = ctx.rng.angle();
    Vector const dir(std::cos(angle), std::sin(angle));

    switch (kind) {
        case HazardKind::RogueStar: {
            if (bodies.liveCount() >= sysConfig.maxBodies) {
                return;
            }
            BodyDesc desc;
            desc.position = anchor + dir * specificConfig.rogueStarDistance;
            desc.velocity = -dir * specificConfig.rogueStarSpeed;
            desc.mass = specificConfig.rogueStarMass;
            desc.hazard = HazardKind::RogueStar;
            if (spawnBody(bodies, desc, ctx.log) != InvalidBodyId) {
                ctx.registryMutated = true;
            }
            break;
        }
        case HazardKind::MicroBlackHole: {
            if (bodies.liveCount() >= sysConfig.maxBodies) {
                return;
            }
            BodyDesc desc;
            desc.position = anchor + dir * specificConfig.microBlackHoleDistance;
            desc.mass = specificConfig.microBlackHoleMass;
            desc.hazard = HazardKind::MicroBlackHole;
            if (spawnBody(bodies, desc, ctx.log) != InvalidBodyId) {
                ctx.registryMutated = true;
            }
            break;
        }
        case HazardKind::DebrisStorm: {
            // Debris bodies are ordinary bodies, not hazards
            IntentEvent burst = IntentEvent::spawnBurst(
                anchor + dir * specificConfig.debrisDistance,
                specificConfig.debrisRadius,
                specificConfig.debrisCount,
                specificConfig.debrisBaseMass,
                specificConfig.debrisSpeed);
            if (spawnBurst(bodies, ctx.rng, burst, sysConfig.maxBodies, ctx.log) > 0) {
                ctx.registryMutated = true;
            }
            break;
        }
    }
}

std::size_t HazardSpawnSystem::spawnBurst(BodyRegistry& bodies, DeterministicRng& rng, const IntentEvent& burst,
                                          std::size_t maxBodies, EventLog& log) {
    std::size_t const live = bodies.liveCount();
    if (live >= maxBodies || burst.count == 0) {
        return 0;
    }
    std::size_t const count = std::min(burst.count, maxBodies - live);

    std::size_t created = 0;
    for (std::size_t i = 0; i < count; ++i) {
        double r = rng.uniform() * burst.radius;
        double angle = rng.angle();
        Vector offset(std::cos(angle) * r, std::sin(angle) * r);
        Vector tangential = offset.perp().normalizedOrZero() * burst.speed;
        Vector jitter(rng.uniform(-SimulatorConstants::BurstJitterSpeed, SimulatorConstants::BurstJitterSpeed),
                      rng.uniform(-SimulatorConstants::BurstJitterSpeed, SimulatorConstants::BurstJitterSpeed));
        double mass = burst.baseMass * rng.uniform(0.5, 1.5);

        BodyDesc desc;
        desc.position = burst.center + offset;
        desc.velocity = tangential + jitter;
        desc.mass = mass;
        if (spawnBody(bodies, desc, log) != InvalidBodyId) {
            ++created;
        }
    }
    return created;
}

BodyId HazardSpawnSystem::spawnBody(BodyRegistry& bodies, const BodyDesc& desc, EventLog& log) {
    BodyId id = bodies.create(desc);
    if (id == InvalidBodyId) {
        return id;
    }

    auto entity = bodies.find(id);
    const auto& registry = bodies.raw();

    SimEvent e;
    e.type = EventType::Spawned;
    e.bodyId = id;
    e.mass = registry.get<Components::Mass>(entity).value;
    e.speed = registry.get<Components::Velocity>(entity).length();
    e.bodyClass = registry.get<Components::Classification>(entity).bodyClass;
    e.playerInvolved = registry.all_of<Components::Player>(entity);
    if (const auto* hazard = registry.try_get<Components::Hazard>(entity)) {
        e.isHazard = true;
        e.hazardKind = hazard->kind;
    }
    log.push(e);
    return id;
}

} // namespace Systems
