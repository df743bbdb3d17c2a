/**
 * @fileoverview collision.cpp
 * @brief Broad phase over a proximity quadtree, then per-pair resolution.
 */

#include "accretion/systems/collision.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "accretion/core/constants.hpp"
#include "accretion/core/profile.hpp"

namespace Systems {

namespace {

bool finiteVector(const Vector& v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

double kineticEnergy(double m, const Vector& v) {
    return 0.5 * m * v.lengthSquared();
}

} // anonymous namespace

void CollisionSystem::update(BodyRegistry& bodies, TickContext& ctx) {
    PROFILE_SCOPE("CollisionSystem");

    auto pairs = findOverlaps(bodies);
    if (pairs.empty()) {
        return;
    }

    for (const auto& pair : pairs) {
        bool ok = sysConfig.collisionMode == CollisionMode::Absorb
            ? resolveAbsorb(bodies, pair, ctx)
            : resolveElastic(bodies, pair, ctx);
        if (!ok) {
            ctx.consistencyFailure = true;
            return;
        }
    }
}

std::vector<CollisionPair> CollisionSystem::findOverlaps(const BodyRegistry& bodies) {
    std::vector<CollisionPair> pairs;

    auto live = bodies.liveEntitiesById();
    if (live.size() < 2) {
        return pairs;
    }

    const auto& registry = bodies.raw();

    std::vector<TreeBody> input;
    input.reserve(live.size());
    for (auto entity : live) {
        TreeBody body;
        body.position = registry.get<Components::Position>(entity);
        body.mass = registry.get<Components::Mass>(entity).value;
        body.radius = registry.get<Components::Radius>(entity).value;
        input.push_back(body);
    }

    broadPhase.setLeafCapacity(specificConfig.leafCapacity);
    broadPhase.build(input);

    std::vector<std::uint32_t> candidates;
    for (std::uint32_t i = 0; i < input.size(); ++i) {
        candidates.clear();
        broadPhase.queryCircle(input[i].position, input[i].radius + broadPhase.maxBodyRadius(), candidates);

        for (auto j : candidates) {
            // Bodies are in id order, so j > i keeps each pair once with a < b
            if (j <= i) {
                continue;
            }
            double reach = input[i].radius + input[j].radius;
            if (input[i].position.distSquared(input[j].position) < reach * reach) {
                CollisionPair pair;
                pair.entityA = live[i];
                pair.entityB = live[j];
                pair.a = registry.get<Components::Identity>(live[i]).id;
                pair.b = registry.get<Components::Identity>(live[j]).id;
                pairs.push_back(pair);
            }
        }
    }

    std::sort(pairs.begin(), pairs.end(), [](const CollisionPair& l, const CollisionPair& r) {
        return l.a != r.a ? l.a < r.a : l.b < r.b;
    });
    return pairs;
}

bool CollisionSystem::resolveElastic(BodyRegistry& bodies, const CollisionPair& pair, TickContext& ctx) const {
    auto& registry = bodies.raw();
    if (!bodies.isAlive(pair.entityA) || !bodies.isAlive(pair.entityB)) {
        return true;
    }

    auto& posA = registry.get<Components::Position>(pair.entityA);
    auto& posB = registry.get<Components::Position>(pair.entityB);
    auto& velA = registry.get<Components::Velocity>(pair.entityA);
    auto& velB = registry.get<Components::Velocity>(pair.entityB);
    double const massA = registry.get<Components::Mass>(pair.entityA).value;
    double const massB = registry.get<Components::Mass>(pair.entityB).value;
    double const radiusA = registry.get<Components::Radius>(pair.entityA).value;
    double const radiusB = registry.get<Components::Radius>(pair.entityB).value;

    Vector delta = posB - posA;
    double dist = delta.length();
    double overlap = (radiusA + radiusB) - dist;
    if (overlap <= 0.0) {
        return true;  // separated by an earlier resolution this tick
    }

    // Coincident centres: push apart along +x
    Vector normal = dist > EPSILON ? delta / dist : Vector(1.0, 0.0);

    double invA = 1.0 / massA;
    double invB = 1.0 / massB;
    double invSum = invA + invB;

    double vrel = (velB - velA).dotProduct(normal);
    double impulse = 0.0;
    Vector newVelA = velA;
    Vector newVelB = velB;

    if (vrel < 0.0) {
        double energyBefore = kineticEnergy(massA, velA) + kineticEnergy(massB, velB);
        double allowed = energyBefore + SimulatorConstants::EnergyGainTolerance * std::max(1.0, energyBefore);

        impulse = -(1.0 + sysConfig.restitution) * vrel / invSum;
        newVelA = velA - normal * (impulse * invA);
        newVelB = velB + normal * (impulse * invB);

        if (kineticEnergy(massA, newVelA) + kineticEnergy(massB, newVelB) > allowed) {
            // Fall back to a perfectly inelastic normal impulse
            impulse = -vrel / invSum;
            newVelA = velA - normal * (impulse * invA);
            newVelB = velB + normal * (impulse * invB);

            if (kineticEnergy(massA, newVelA) + kineticEnergy(massB, newVelB) > allowed) {
                std::cerr << "[Collision] Warning: contact " << pair.a << "/" << pair.b
                          << " would gain energy, left unresolved\n";
                return true;
            }
        }
    }

    // Separate along the normal, heavier body moves less
    Position newPosA = posA + normal * (-overlap * invA / invSum);
    Position newPosB = posB + normal * (overlap * invB / invSum);

    if (!finiteVector(newVelA) || !finiteVector(newVelB) ||
        !finiteVector(Vector(newPosA)) || !finiteVector(Vector(newPosB))) {
        std::cerr << "[Collision] Error: non-finite state resolving " << pair.a << "/" << pair.b << "\n";
        return false;
    }

    velA = newVelA;
    velB = newVelB;
    posA = newPosA;
    posB = newPosB;
    ctx.registryMutated = true;

    if (impulse > 0.0) {
        SimEvent e;
        e.type = EventType::Collided;
        e.bodyId = pair.a;
        e.otherId = pair.b;
        e.impulse = impulse;
        e.speed = -vrel;
        e.bodyClass = registry.get<Components::Classification>(pair.entityA).bodyClass;
        e.playerInvolved = registry.all_of<Components::Player>(pair.entityA) ||
                           registry.all_of<Components::Player>(pair.entityB);
        ctx.log.push(e);
    }

    return true;
}

bool CollisionSystem::resolveAbsorb(BodyRegistry& bodies, const CollisionPair& pair, TickContext& ctx) const {
    auto& registry = bodies.raw();
    if (!bodies.isAlive(pair.entityA) || !bodies.isAlive(pair.entityB)) {
        return true;
    }

    double const massA = registry.get<Components::Mass>(pair.entityA).value;
    double const massB = registry.get<Components::Mass>(pair.entityB).value;

    // Heavier body wins, the lower id on a tie (a < b)
    bool const aWins = massA >= massB;
    entt::entity const winner = aWins ? pair.entityA : pair.entityB;
    entt::entity const loser = aWins ? pair.entityB : pair.entityA;
    BodyId const winnerId = aWins ? pair.a : pair.b;
    BodyId const loserId = aWins ? pair.b : pair.a;

    const auto& winnerPos = registry.get<Components::Position>(winner);
    const auto& loserPos = registry.get<Components::Position>(loser);
    auto& winnerVel = registry.get<Components::Velocity>(winner);
    const auto& loserVel = registry.get<Components::Velocity>(loser);
    auto& winnerMass = registry.get<Components::Mass>(winner);
    double const loserMass = registry.get<Components::Mass>(loser).value;
    auto& winnerRadius = registry.get<Components::Radius>(winner);
    double const loserRadius = registry.get<Components::Radius>(loser).value;

    double reach = winnerRadius.value + loserRadius;
    if (winnerPos.distSquared(loserPos) >= reach * reach) {
        return true;
    }

    double newMass = winnerMass.value + loserMass;
    Vector newVel = (Vector(winnerVel) * winnerMass.value + Vector(loserVel) * loserMass) / newMass;
    // Radius follows the merged mass, so a class change lands in the new class's band
    double newRadius = BodyClasses::radiusForMass(newMass);

    if (!std::isfinite(newMass) || newMass <= 0.0 || !std::isfinite(newRadius) || newRadius <= 0.0 ||
        !finiteVector(newVel)) {
        std::cerr << "[Collision] Error: invalid merge of " << winnerId << " and " << loserId
                  << " (mass " << newMass << ", radius " << newRadius << ")\n";
        return false;
    }

    auto& classification = registry.get<Components::Classification>(winner);
    BodyClass const previousClass = classification.bodyClass;
    BodyClass const loserClass = registry.get<Components::Classification>(loser).bodyClass;
    Vector const loserVelocity = loserVel;
    bool const winnerIsPlayer = registry.all_of<Components::Player>(winner);
    bool const loserIsPlayer = registry.all_of<Components::Player>(loser);
    const auto* loserHazard = registry.try_get<Components::Hazard>(loser);

    winnerMass.value = newMass;
    winnerVel.x = newVel.x;
    winnerVel.y = newVel.y;
    winnerRadius.value = newRadius;
    classification.bodyClass = BodyClasses::fromMass(newMass);

    SimEvent absorbed;
    absorbed.type = EventType::Absorbed;
    absorbed.bodyId = winnerId;
    absorbed.otherId = loserId;
    absorbed.mass = loserMass;
    absorbed.speed = loserVelocity.length();
    absorbed.bodyClass = loserClass;
    absorbed.playerInvolved = winnerIsPlayer;
    if (loserHazard) {
        absorbed.isHazard = true;
        absorbed.hazardKind = loserHazard->kind;
    }
    ctx.log.push(absorbed);

    SimEvent died;
    died.type = EventType::Died;
    died.bodyId = loserId;
    died.otherId = winnerId;
    died.mass = loserMass;
    died.speed = loserVelocity.length();
    died.bodyClass = loserClass;
    died.isHazard = absorbed.isHazard;
    died.hazardKind = absorbed.hazardKind;
    died.playerInvolved = loserIsPlayer;
    ctx.log.push(died);

    bodies.markDead(loser);

    if (classification.bodyClass != previousClass) {
        SimEvent evolved;
        evolved.type = EventType::Evolved;
        evolved.bodyId = winnerId;
        evolved.bodyClass = classification.bodyClass;
        evolved.previousClass = previousClass;
        evolved.mass = newMass;
        evolved.playerInvolved = winnerIsPlayer;
        ctx.log.push(evolved);

        if (winnerIsPlayer && classification.bodyClass > previousClass) {
            double burstRadius = newRadius * SimulatorConstants::EvolutionBurstRadiusFactor;
            ctx.deferredIntents.push_back(IntentEvent::spawnBurst(
                winnerPos, burstRadius,
                static_cast<std::size_t>(SimulatorConstants::EvolutionBurstCount),
                SimulatorConstants::EvolutionBurstBaseMass,
                SimulatorConstants::EvolutionBurstSpeed));
        }
    }

    ctx.registryMutated = true;
    return true;
}

} // namespace Systems
