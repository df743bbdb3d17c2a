#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "accretion/core/diagnostics.hpp"
#include "accretion/systems/leapfrog.hpp"

using Systems::BarnesHutSystem;
using Systems::LeapfrogSystem;

class LeapfrogTest : public ::testing::Test {
protected:
    BodyRegistry bodies;
    DeterministicRng rng{1};
    EventLog log;
    SimSettings settings;

    void SetUp() override {
        settings.gravitationalConstant = 1.0;
        settings.softening = 0.0;
        settings.theta = 1e-12;  // exact forces
        settings.maxSpeed = 0.0;
        settings.parallelForces = false;
    }

    BodyId addBody(const Position& pos, const Vector& vel, double mass) {
        BodyDesc desc;
        desc.position = pos;
        desc.velocity = vel;
        desc.mass = mass;
        desc.radius = 0.1;
        return bodies.create(desc);
    }

    // Largest relative energy deviation seen while integrating `steps` steps
    double maxEnergyDrift(double dt, int steps) {
        settings.dt = dt;
        BarnesHutSystem forces;
        forces.setSystemConfig(settings);
        LeapfrogSystem integrator(forces);
        integrator.setSystemConfig(settings);

        double const e0 = Diagnostics::totalEnergy(bodies, settings.gravitationalConstant, settings.softening);
        double drift = 0.0;
        for (int i = 0; i < steps; ++i) {
            TickContext ctx(rng, log);
            integrator.update(bodies, ctx);
            double e = Diagnostics::totalEnergy(bodies, settings.gravitationalConstant, settings.softening);
            drift = std::max(drift, std::abs((e - e0) / e0));
        }
        return drift;
    }

    void addEccentricPair() {
        // Satellite starts at apoapsis with 70% of the circular speed
        double const M = 1000.0;
        double const r = 100.0;
        double const v = 0.7 * std::sqrt(M / r);
        addBody(Position(0.0, 0.0), Vector(0.0, 0.0), M);
        addBody(Position(r, 0.0), Vector(0.0, v), 1.0);
    }
};

TEST_F(LeapfrogTest, EmptyRegistryIsANoOp) {
    BarnesHutSystem forces;
    forces.setSystemConfig(settings);
    LeapfrogSystem integrator(forces);
    integrator.setSystemConfig(settings);

    TickContext ctx(rng, log);
    integrator.update(bodies, ctx);
    EXPECT_FALSE(integrator.accelerationsCached());
    EXPECT_TRUE(log.empty());
}

TEST_F(LeapfrogTest, FreeBodyMovesInAStraightLine) {
    settings.dt = 0.5;
    BarnesHutSystem forces;
    forces.setSystemConfig(settings);
    LeapfrogSystem integrator(forces);
    integrator.setSystemConfig(settings);

    BodyId id = addBody(Position(1.0, 2.0), Vector(4.0, -2.0), 5.0);
    for (int i = 0; i < 4; ++i) {
        TickContext ctx(rng, log);
        integrator.update(bodies, ctx);
    }

    auto snap = bodies.get(id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_NEAR(snap->position.x, 1.0 + 4.0 * 2.0, 1e-12);
    EXPECT_NEAR(snap->position.y, 2.0 - 2.0 * 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(snap->velocity.x, 4.0);
    EXPECT_DOUBLE_EQ(snap->velocity.y, -2.0);
}

TEST_F(LeapfrogTest, EnergyConservedOnCircularOrbits) {
    double const M = 1e4;
    addBody(Position(0.0, 0.0), Vector(0.0, 0.0), M);
    for (int i = 0; i < 10; ++i) {
        double r = 100.0 + 10.0 * i;
        double angle = 0.6 * i;
        double v = std::sqrt(M / r);
        addBody(Position(r * std::cos(angle), r * std::sin(angle)),
                Vector(-v * std::sin(angle), v * std::cos(angle)), 1e-3);
    }

    EXPECT_LT(maxEnergyDrift(0.01, 500), 1e-4);
}

TEST_F(LeapfrogTest, SecondOrderConvergence) {
    addEccentricPair();
    double coarse = maxEnergyDrift(0.05, 2000);

    bodies.clear();
    addEccentricPair();
    double fine = maxEnergyDrift(0.025, 4000);

    ASSERT_GT(fine, 0.0);
    EXPECT_GT(coarse / fine, 3.0);
    EXPECT_LT(coarse / fine, 5.0);
}

TEST_F(LeapfrogTest, EnergyBoundedWithApproximateForces) {
    // Massive core with a swarm of unit-mass bodies on nested circular orbits
    auto addSwarm = [this]() {
        double const M = 1e4;
        addBody(Position(0.0, 0.0), Vector(0.0, 0.0), M);
        for (int i = 0; i < 30; ++i) {
            double r = 100.0 + 3.0 * i;
            double angle = 0.7 * i;
            double v = std::sqrt(M / r);
            addBody(Position(r * std::cos(angle), r * std::sin(angle)),
                    Vector(-v * std::sin(angle), v * std::cos(angle)), 1.0);
        }
    };

    settings.softening = 1.0;
    for (double theta : {0.3, 0.5, 0.8}) {
        settings.theta = theta;
        for (double dt : {0.01, 0.02}) {
            bodies.clear();
            addSwarm();
            int steps = static_cast<int>(std::lround(5.0 / dt));
            double bound = 1e-4 * (dt / 0.01) * (dt / 0.01);
            EXPECT_LT(maxEnergyDrift(dt, steps), bound) << "theta " << theta << " dt " << dt;
        }
    }
}

TEST_F(LeapfrogTest, MomentumConservedForPair) {
    addEccentricPair();
    Vector p0 = Diagnostics::totalMomentum(bodies);
    maxEnergyDrift(0.05, 500);
    Vector p1 = Diagnostics::totalMomentum(bodies);

    EXPECT_NEAR(p1.x, p0.x, 1e-9);
    EXPECT_NEAR(p1.y, p0.y, 1e-9);
}

TEST_F(LeapfrogTest, SpeedIsClamped) {
    settings.dt = 0.01;
    settings.maxSpeed = 10.0;
    BarnesHutSystem forces;
    forces.setSystemConfig(settings);
    LeapfrogSystem integrator(forces);
    integrator.setSystemConfig(settings);

    BodyId id = addBody(Position(0.0, 0.0), Vector(300.0, 400.0), 1.0);
    TickContext ctx(rng, log);
    integrator.update(bodies, ctx);

    auto snap = bodies.get(id);
    EXPECT_NEAR(snap->velocity.length(), 10.0, 1e-12);
    EXPECT_NEAR(snap->velocity.x, 6.0, 1e-12);
    EXPECT_NEAR(snap->velocity.y, 8.0, 1e-12);
}

TEST_F(LeapfrogTest, CachedAccelerationsCanBeInvalidated) {
    settings.dt = 0.01;
    BarnesHutSystem forces;
    forces.setSystemConfig(settings);
    LeapfrogSystem integrator(forces);
    integrator.setSystemConfig(settings);

    addEccentricPair();
    EXPECT_FALSE(integrator.accelerationsCached());

    TickContext ctx(rng, log);
    integrator.update(bodies, ctx);
    EXPECT_TRUE(integrator.accelerationsCached());

    integrator.invalidateAccelerations();
    EXPECT_FALSE(integrator.accelerationsCached());
}
