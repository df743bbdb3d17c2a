#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "accretion/core/constants.hpp"
#include "accretion/core/diagnostics.hpp"
#include "accretion/systems/collision.hpp"

using Systems::CollisionSystem;

class CollisionTest : public ::testing::Test {
protected:
    BodyRegistry bodies;
    DeterministicRng rng{7};
    EventLog log;
    CollisionSystem collisions;
    SimSettings settings;

    BodyId addBody(double x, double y, double vx, double vy, double mass, double radius,
                   bool player = false) {
        BodyDesc desc;
        desc.position = Position(x, y);
        desc.velocity = Vector(vx, vy);
        desc.mass = mass;
        desc.radius = radius;
        desc.player = player;
        return bodies.create(desc);
    }

    TickContext run(CollisionMode mode, double restitution = 1.0) {
        settings.collisionMode = mode;
        settings.restitution = restitution;
        collisions.setSystemConfig(settings);
        TickContext ctx(rng, log);
        collisions.update(bodies, ctx);
        return ctx;
    }

    std::size_t countEvents(EventType type) const {
        return static_cast<std::size_t>(std::count_if(log.events.begin(), log.events.end(),
            [type](const SimEvent& e) { return e.type == type; }));
    }
};

TEST_F(CollisionTest, SeparatedBodiesAreLeftAlone) {
    addBody(0, 0, 1, 0, 10, 5);
    addBody(20, 0, -1, 0, 10, 5);

    EXPECT_TRUE(collisions.findOverlaps(bodies).empty());

    auto ctx = run(CollisionMode::Absorb);
    EXPECT_TRUE(log.empty());
    EXPECT_FALSE(ctx.registryMutated);
    EXPECT_EQ(bodies.liveCount(), 2u);
}

TEST_F(CollisionTest, ElasticConservesMomentumWithoutEnergyGain) {
    BodyId a = addBody(0, 0, 5, 0, 2, 5);
    BodyId b = addBody(8, 0, -5, 0, 1, 5);

    Vector p0 = Diagnostics::totalMomentum(bodies);
    double ke0 = Diagnostics::kineticEnergy(bodies);

    auto ctx = run(CollisionMode::Elastic, 1.0);
    EXPECT_FALSE(ctx.consistencyFailure);
    EXPECT_TRUE(ctx.registryMutated);

    Vector p1 = Diagnostics::totalMomentum(bodies);
    EXPECT_NEAR(p1.x, p0.x, 1e-12);
    EXPECT_NEAR(p1.y, p0.y, 1e-12);
    EXPECT_LE(Diagnostics::kineticEnergy(bodies), ke0 * (1.0 + 1e-9));

    // Pushed apart to touching distance
    auto sa = bodies.get(a);
    auto sb = bodies.get(b);
    EXPECT_NEAR(sa->position.dist(sb->position), 10.0, 1e-9);
    EXPECT_GT(sb->velocity.x, sa->velocity.x);

    ASSERT_EQ(countEvents(EventType::Collided), 1u);
    const auto& e = log.events.front();
    EXPECT_EQ(e.bodyId, a);
    EXPECT_EQ(e.otherId, b);
    // (1 + e) * approach speed / (1/mA + 1/mB)
    EXPECT_NEAR(e.impulse, 2.0 * 10.0 / 1.5, 1e-9);
    EXPECT_NEAR(e.speed, 10.0, 1e-12);
    EXPECT_DOUBLE_EQ(e.mass, 0.0);
    EXPECT_FALSE(e.playerInvolved);
}

TEST_F(CollisionTest, InelasticContactRemovesApproachSpeed) {
    BodyId a = addBody(0, 0, 3, 0, 4, 5);
    BodyId b = addBody(9, 0, -3, 0, 4, 5);

    run(CollisionMode::Elastic, 0.0);

    auto sa = bodies.get(a);
    auto sb = bodies.get(b);
    EXPECT_NEAR(sb->velocity.x - sa->velocity.x, 0.0, 1e-12);
    EXPECT_EQ(bodies.liveCount(), 2u);
}

TEST_F(CollisionTest, SeparatingOverlapOnlyPushesApart) {
    addBody(0, 0, -1, 0, 1, 5);
    addBody(6, 0, 1, 0, 1, 5);

    auto ctx = run(CollisionMode::Elastic, 1.0);
    EXPECT_EQ(countEvents(EventType::Collided), 0u);
    EXPECT_TRUE(ctx.registryMutated);
    EXPECT_TRUE(collisions.findOverlaps(bodies).empty());
}

TEST_F(CollisionTest, AbsorbConservesMassAndMomentum) {
    BodyId a = addBody(0, 0, 1, 0, 100, 5);
    BodyId b = addBody(3, 0, -2, 1, 50, 5);

    double m0 = Diagnostics::totalMass(bodies);
    Vector p0 = Diagnostics::totalMomentum(bodies);

    auto ctx = run(CollisionMode::Absorb);
    EXPECT_TRUE(ctx.registryMutated);
    EXPECT_FALSE(ctx.consistencyFailure);

    EXPECT_NEAR(Diagnostics::totalMass(bodies), m0, 1e-12);
    Vector p1 = Diagnostics::totalMomentum(bodies);
    EXPECT_NEAR(p1.x, p0.x, 1e-12);
    EXPECT_NEAR(p1.y, p0.y, 1e-12);

    auto winner = bodies.get(a);
    EXPECT_TRUE(winner->alive);
    EXPECT_DOUBLE_EQ(winner->mass, 150.0);
    EXPECT_DOUBLE_EQ(winner->radius, BodyClasses::radiusForMass(150.0));
    EXPECT_FALSE(bodies.get(b)->alive);

    ASSERT_EQ(log.events.size(), 2u);
    EXPECT_EQ(log.events[0].type, EventType::Absorbed);
    EXPECT_EQ(log.events[0].bodyId, a);
    EXPECT_EQ(log.events[0].otherId, b);
    EXPECT_DOUBLE_EQ(log.events[0].mass, 50.0);
    EXPECT_EQ(log.events[1].type, EventType::Died);
    EXPECT_EQ(log.events[1].bodyId, b);

    auto removed = bodies.purgeDead();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], b);
}

TEST_F(CollisionTest, AbsorbRadiusFollowsMergedClass) {
    BodyId asteroid = addBody(0, 0, 0, 0, 400, BodyClasses::radiusForMass(400));
    addBody(3, 0, 0, 0, 200, BodyClasses::radiusForMass(200));

    run(CollisionMode::Absorb);

    auto merged = bodies.get(asteroid);
    EXPECT_EQ(merged->bodyClass, BodyClass::Planet);
    EXPECT_DOUBLE_EQ(merged->radius, 6.0);
}

TEST_F(CollisionTest, AbsorbRadiusStaysWithinBlackHoleBand) {
    BodyId a = addBody(0, 0, 0, 0, 5e8, 60);
    addBody(10, 0, 0, 0, 4e8, 60);

    run(CollisionMode::Absorb);

    auto merged = bodies.get(a);
    EXPECT_EQ(merged->bodyClass, BodyClass::BlackHole);
    EXPECT_DOUBLE_EQ(merged->radius, 60.0);
}

TEST_F(CollisionTest, HeavierBodyWinsRegardlessOfId) {
    BodyId light = addBody(0, 0, 0, 0, 10, 5);
    BodyId heavy = addBody(2, 0, 0, 0, 90, 5);

    run(CollisionMode::Absorb);

    EXPECT_FALSE(bodies.get(light)->alive);
    EXPECT_DOUBLE_EQ(bodies.get(heavy)->mass, 100.0);
}

TEST_F(CollisionTest, EqualMassesLowerIdWins) {
    BodyId first = addBody(0, 0, 0, 0, 40, 5);
    BodyId second = addBody(2, 0, 0, 0, 40, 5);

    run(CollisionMode::Absorb);

    EXPECT_TRUE(bodies.get(first)->alive);
    EXPECT_FALSE(bodies.get(second)->alive);
}

TEST_F(CollisionTest, ChainedAbsorptionsKillEachBodyOnce) {
    BodyId a = addBody(0, 0, 0, 0, 10, 5);
    BodyId b = addBody(1, 0, 0, 0, 20, 5);
    BodyId c = addBody(2, 0, 0, 0, 30, 5);

    run(CollisionMode::Absorb);

    // (a,b): b takes a. (a,c): a already dead. (b,c): 30 vs 30, b has the lower id.
    EXPECT_FALSE(bodies.get(a)->alive);
    EXPECT_TRUE(bodies.get(b)->alive);
    EXPECT_FALSE(bodies.get(c)->alive);
    EXPECT_DOUBLE_EQ(bodies.get(b)->mass, 60.0);
    EXPECT_EQ(countEvents(EventType::Died), 2u);
    EXPECT_EQ(countEvents(EventType::Absorbed), 2u);

    auto removed = bodies.purgeDead();
    EXPECT_EQ(removed, (std::vector<BodyId>{a, c}));
}

TEST_F(CollisionTest, PlayerEvolutionQueuesBurst) {
    BodyId player = addBody(0, 0, 0, 0, 450, 2.5, true);
    addBody(2, 0, 0, 0, 100, 1.2);

    auto ctx = run(CollisionMode::Absorb);

    auto snap = bodies.get(player);
    EXPECT_EQ(snap->bodyClass, BodyClass::Planet);

    ASSERT_EQ(log.events.size(), 3u);
    EXPECT_EQ(log.events[0].type, EventType::Absorbed);
    EXPECT_TRUE(log.events[0].playerInvolved);
    EXPECT_EQ(log.events[1].type, EventType::Died);
    EXPECT_FALSE(log.events[1].playerInvolved);
    EXPECT_EQ(log.events[2].type, EventType::Evolved);
    EXPECT_EQ(log.events[2].previousClass, BodyClass::Asteroid);
    EXPECT_EQ(log.events[2].bodyClass, BodyClass::Planet);

    ASSERT_EQ(ctx.deferredIntents.size(), 1u);
    EXPECT_EQ(ctx.deferredIntents[0].type, IntentType::SpawnBurst);
    EXPECT_EQ(ctx.deferredIntents[0].count, SimulatorConstants::EvolutionBurstCount);
}

TEST_F(CollisionTest, PlayerAbsorbedReportsDeath) {
    BodyId player = addBody(0, 0, 0, 0, 10, 3, true);
    BodyId big = addBody(2, 0, 0, 0, 1000, 6);

    run(CollisionMode::Absorb);

    ASSERT_EQ(log.events.size(), 2u);
    EXPECT_EQ(log.events[0].bodyId, big);
    EXPECT_FALSE(log.events[0].playerInvolved);
    EXPECT_EQ(log.events[1].type, EventType::Died);
    EXPECT_EQ(log.events[1].bodyId, player);
    EXPECT_TRUE(log.events[1].playerInvolved);
    EXPECT_EQ(bodies.player(), entt::null);
}

TEST_F(CollisionTest, OverlapsMatchBruteForceInIdOrder) {
    DeterministicRng placement(21);
    for (int i = 0; i < 200; ++i) {
        addBody(placement.uniform(-200, 200), placement.uniform(-200, 200), 0, 0,
                placement.uniform(1, 10), placement.uniform(1, 8));
    }

    auto pairs = collisions.findOverlaps(bodies);

    auto snap = bodies.snapshot();
    std::size_t expected = 0;
    for (std::size_t i = 0; i < snap.size(); ++i) {
        for (std::size_t j = i + 1; j < snap.size(); ++j) {
            double reach = snap[i].radius + snap[j].radius;
            if (snap[i].position.distSquared(snap[j].position) < reach * reach) {
                ++expected;
            }
        }
    }

    EXPECT_GT(expected, 0u);
    EXPECT_EQ(pairs.size(), expected);
    for (std::size_t k = 0; k < pairs.size(); ++k) {
        EXPECT_LT(pairs[k].a, pairs[k].b);
        if (k > 0) {
            bool ordered = pairs[k - 1].a < pairs[k].a ||
                           (pairs[k - 1].a == pairs[k].a && pairs[k - 1].b < pairs[k].b);
            EXPECT_TRUE(ordered);
        }
    }
}

TEST_F(CollisionTest, OverflowingMergeIsAConsistencyFailure) {
    BodyId a = addBody(0, 0, 0, 0, 1e308, 5);
    BodyId b = addBody(1, 0, 0, 0, 1e308, 5);

    auto ctx = run(CollisionMode::Absorb);

    EXPECT_TRUE(ctx.consistencyFailure);
    EXPECT_TRUE(log.empty());
    // Nothing was applied
    EXPECT_TRUE(bodies.get(a)->alive);
    EXPECT_TRUE(bodies.get(b)->alive);
    EXPECT_DOUBLE_EQ(bodies.get(a)->mass, 1e308);
}
