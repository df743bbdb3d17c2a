#include "accretion/scenarios/generators.hpp"

#include <cmath>
#include <iostream>

#include "accretion/core/debug.hpp"

namespace Generators {

double circularSpeed(double G, double M, double r) {
    if (M <= 0.0 || r <= 0.0) {
        return 0.0;
    }
    return std::sqrt(G * M / r);
}

BodyId createCentralBody(BodyRegistry& bodies, double mass) {
    BodyDesc desc;
    desc.position = Position(0.0, 0.0);
    desc.mass = mass;
    return bodies.create(desc);
}

void createBinary(BodyRegistry& bodies, double massA, double massB, double separation, double G) {
    double const total = massA + massB;
    double const rA = separation * massB / total;
    double const rB = separation * massA / total;
    double const omega = std::sqrt(G * total / (separation * separation * separation));

    BodyDesc a;
    a.position = Position(-rA, 0.0);
    a.velocity = Vector(0.0, -omega * rA);
    a.mass = massA;
    bodies.create(a);

    BodyDesc b;
    b.position = Position(rB, 0.0);
    b.velocity = Vector(0.0, omega * rB);
    b.mass = massB;
    bodies.create(b);
}

std::size_t createBelts(BodyRegistry& bodies, DeterministicRng& rng, const LayoutParams& layout,
                        double centralMass, double G) {
    std::size_t created = 0;

    for (double radius : layout.beltRadii) {
        for (std::size_t i = 0; i < layout.bodiesPerBelt; ++i) {
            double const angle = rng.angle();
            double const r = radius + (rng.uniform() - 0.5) * layout.beltWidth;
            Vector const dir(std::cos(angle), std::sin(angle));

            BodyDesc desc;
            desc.position = Position(0.0, 0.0) + dir * r;
            desc.velocity = dir.perp() * circularSpeed(G, centralMass, r);
            desc.mass = rng.uniform(layout.beltMassMin, layout.beltMassMax);
            if (bodies.create(desc) != InvalidBodyId) {
                ++created;
            }
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Generators] created " << created << " belt bodies\n");
    return created;
}

std::size_t createCluster(BodyRegistry& bodies, DeterministicRng& rng, const LayoutParams& layout) {
    std::size_t created = 0;
    double const R = layout.clusterRadius;

    for (std::size_t i = 0; i < layout.clusterCount; ++i) {
        double x = 0.0;
        double y = 0.0;
        do {
            x = rng.uniform(-R, R);
            y = rng.uniform(-R, R);
        } while (x * x + y * y > R * R);

        BodyDesc desc;
        desc.position = Position(x, y);
        desc.mass = rng.uniform(layout.clusterMassMin, layout.clusterMassMax);
        if (bodies.create(desc) != InvalidBodyId) {
            ++created;
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Generators] created " << created << " cluster bodies\n");
    return created;
}

BodyId createPlayer(BodyRegistry& bodies, const PlayerParams& player, double centralMass, double G) {
    BodyDesc desc;
    desc.position = Position(player.orbitRadius, 0.0);
    desc.velocity = Vector(0.0, circularSpeed(G, centralMass, player.orbitRadius));
    desc.mass = player.mass;
    desc.player = true;

    BodyId id = bodies.create(desc);
    if (id == InvalidBodyId) {
        std::cerr << "[Generators] Warning: player body rejected (mass " << player.mass << ")\n";
    }
    return id;
}

}
