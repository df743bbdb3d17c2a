#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "accretion/core/constants.hpp"
#include "accretion/core/deterministic_rng.hpp"
#include "accretion/systems/quadtree.hpp"

using Systems::Quadtree;
using Systems::TreeBody;

class QuadtreeTest : public ::testing::Test {
protected:
    TreeBody makeBody(double x, double y, double mass, double radius = 1.0) {
        TreeBody b;
        b.position = Position(x, y);
        b.mass = mass;
        b.radius = radius;
        return b;
    }
};

TEST_F(QuadtreeTest, NodeContainsPoint) {
    Quadtree::Node node;
    node.boundaryX = -1.0;
    node.boundaryY = -1.0;
    node.boundarySize = 2.0;

    // Test points inside
    EXPECT_TRUE(node.contains(0.0, 0.0));
    EXPECT_TRUE(node.contains(-0.5, 0.5));
    EXPECT_TRUE(node.contains(-1.0, -1.0));  // minimum corner is inclusive

    // Test points outside
    EXPECT_FALSE(node.contains(1.0, 0.0));  // maximum edge is exclusive
    EXPECT_FALSE(node.contains(-1.5, 0.0));
    EXPECT_FALSE(node.contains(0.0, 2.0));
}

TEST_F(QuadtreeTest, NodeQuadrants) {
    Quadtree::Node node;
    node.boundaryX = 0.0;
    node.boundaryY = 0.0;
    node.boundarySize = 4.0;

    EXPECT_EQ(node.getQuadrant(1.0, 1.0), 0);  // NW
    EXPECT_EQ(node.getQuadrant(3.0, 1.0), 1);  // NE
    EXPECT_EQ(node.getQuadrant(1.0, 3.0), 2);  // SW
    EXPECT_EQ(node.getQuadrant(3.0, 3.0), 3);  // SE
    EXPECT_EQ(node.getQuadrant(2.0, 2.0), 3);  // midpoint goes to the higher quadrant
}

TEST_F(QuadtreeTest, EmptyBuild) {
    Quadtree tree;
    tree.build({});

    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.bodyCount(), 0u);

    Vector acc = tree.accelerationAt(Position(0, 0), Quadtree::NoBody, 0.5, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(acc.x, 0.0);
    EXPECT_DOUBLE_EQ(acc.y, 0.0);
    EXPECT_DOUBLE_EQ(tree.densityFactor(Position(0, 0)), 0.0);

    std::vector<std::uint32_t> found;
    tree.queryCircle(Position(0, 0), 100.0, found);
    EXPECT_TRUE(found.empty());
}

TEST_F(QuadtreeTest, RebuildWithNoBodiesDropsRoot) {
    Quadtree tree;
    tree.build({makeBody(1, 1, 2.0)});
    ASSERT_FALSE(tree.empty());
    EXPECT_DOUBLE_EQ(tree.root().totalMass, 2.0);

    tree.build({});
    EXPECT_TRUE(tree.empty());
    EXPECT_TRUE(tree.nodes().empty());
}

TEST_F(QuadtreeTest, RootMassAndCenterOfMass) {
    Quadtree tree;
    tree.build({makeBody(0.0, 0.0, 1.0), makeBody(10.0, 0.0, 3.0), makeBody(10.0, 8.0, 4.0)});

    const auto& root = tree.root();
    EXPECT_DOUBLE_EQ(root.totalMass, 8.0);
    EXPECT_NEAR(root.centerOfMassX, (0.0 + 30.0 + 40.0) / 8.0, 1e-12);
    EXPECT_NEAR(root.centerOfMassY, 32.0 / 8.0, 1e-12);
    EXPECT_FALSE(root.isLeaf());

    // Every body lies strictly inside the root square
    for (const auto& b : tree.bodies()) {
        EXPECT_TRUE(root.contains(b.position.x, b.position.y));
    }
}

TEST_F(QuadtreeTest, LeafCapacityLimitsSplitting) {
    std::vector<TreeBody> bodies;
    for (int i = 0; i < 4; ++i) {
        bodies.push_back(makeBody(i * 10.0, i * 3.0, 1.0));
    }

    Quadtree wide(8);
    wide.build(bodies);
    EXPECT_TRUE(wide.root().isLeaf());
    EXPECT_EQ(wide.nodes().size(), 1u);

    Quadtree narrow(1);
    narrow.build(bodies);
    EXPECT_FALSE(narrow.root().isLeaf());
    for (const auto& node : narrow.nodes()) {
        if (node.isLeaf()) {
            EXPECT_LE(node.bodies.size(), 1u);
        }
    }
}

TEST_F(QuadtreeTest, CoincidentBodiesShareALeaf) {
    std::vector<TreeBody> bodies = {
        makeBody(5.0, 5.0, 2.0),
        makeBody(5.0, 5.0, 2.0),
        makeBody(5.0, 5.0, 2.0),
        makeBody(0.0, 0.0, 1.0),
    };

    Quadtree tree(1);
    tree.build(bodies);

    EXPECT_DOUBLE_EQ(tree.root().totalMass, 7.0);

    int deepest = 0;
    for (const auto& node : tree.nodes()) {
        deepest = std::max(deepest, node.depth);
    }
    EXPECT_LE(deepest, SimulatorConstants::MaxTreeDepth);

    // Zero softening: coincident neighbours contribute nothing, no NaN
    Vector acc = tree.accelerationOn(0, 0.5, 0.0, 1.0);
    EXPECT_TRUE(std::isfinite(acc.x));
    EXPECT_TRUE(std::isfinite(acc.y));
    EXPECT_LT(acc.x, 0.0);  // pulled towards the body at the origin
}

TEST_F(QuadtreeTest, TwoBodyAccelerationMatchesForceLaw) {
    Quadtree tree;
    tree.build({makeBody(0.0, 0.0, 5.0), makeBody(3.0, 4.0, 2.0)});

    double const G = 2.0;
    double const eps = 1.0;
    Vector acc = tree.accelerationOn(0, 0.5, eps, G);

    // a = G*m*r / (r^2 + eps^2)^1.5 with r = (3, 4)
    double denom = std::pow(25.0 + 1.0, 1.5);
    EXPECT_NEAR(acc.x, G * 2.0 * 3.0 / denom, 1e-12);
    EXPECT_NEAR(acc.y, G * 2.0 * 4.0 / denom, 1e-12);
}

TEST_F(QuadtreeTest, QueryCircleMatchesBruteForce) {
    DeterministicRng rng(17);
    std::vector<TreeBody> bodies;
    for (int i = 0; i < 300; ++i) {
        bodies.push_back(makeBody(rng.uniform(-100.0, 100.0), rng.uniform(-100.0, 100.0), 1.0));
    }

    Quadtree tree(4);
    tree.build(bodies);

    Position center(12.0, -30.0);
    double const radius = 35.0;

    std::vector<std::uint32_t> found;
    tree.queryCircle(center, radius, found);
    std::sort(found.begin(), found.end());

    std::vector<std::uint32_t> expected;
    for (std::uint32_t i = 0; i < bodies.size(); ++i) {
        if (bodies[i].position.distSquared(center) <= radius * radius) {
            expected.push_back(i);
        }
    }

    EXPECT_FALSE(expected.empty());
    EXPECT_EQ(found, expected);
}

TEST_F(QuadtreeTest, DensityFactorGrowsInClusters) {
    DeterministicRng rng(5);
    std::vector<TreeBody> bodies;
    // Dense clump near the origin, one lonely body far away
    for (int i = 0; i < 200; ++i) {
        bodies.push_back(makeBody(rng.uniform(-1.0, 1.0), rng.uniform(-1.0, 1.0), 1.0));
    }
    bodies.push_back(makeBody(1000.0, 1000.0, 1.0));

    Quadtree tree(1);
    tree.build(bodies);

    double crowded = tree.densityFactor(Position(0.0, 0.0));
    double lonely = tree.densityFactor(Position(1000.0, 1000.0));
    EXPECT_GT(crowded, lonely);
    EXPECT_LE(crowded, 1.0);
    EXPECT_GE(lonely, 0.0);
}

TEST_F(QuadtreeTest, TracksLargestRadius) {
    Quadtree tree;
    tree.build({makeBody(0, 0, 1, 2.0), makeBody(5, 5, 1, 7.5), makeBody(-5, 3, 1, 1.0)});
    EXPECT_DOUBLE_EQ(tree.maxBodyRadius(), 7.5);
}
