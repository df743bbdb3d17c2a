/**
 * @fileoverview
 * @brief Quadtree construction, mass aggregation and traversal.
 */

#include "accretion/systems/quadtree.hpp"

#include <algorithm>
#include <cmath>

#include "accretion/core/constants.hpp"

namespace Systems {

Quadtree::Quadtree(std::size_t leafCapacity)
    : leafCapacity_(std::max<std::size_t>(1, leafCapacity)) {}

void Quadtree::setLeafCapacity(std::size_t leafCapacity) {
    leafCapacity_ = std::max<std::size_t>(1, leafCapacity);
}

int Quadtree::allocateNode(double x, double y, double size, int depth) {
    Node node;
    node.boundaryX = x;
    node.boundaryY = y;
    node.boundarySize = size;
    node.depth = depth;
    nodePool_.push_back(std::move(node));
    return static_cast<int>(nodePool_.size() - 1);
}

void Quadtree::build(const std::vector<TreeBody>& bodies) {
    nodePool_.clear();
    bodies_ = bodies;
    maxRadius_ = 0.0;

    if (bodies_.empty()) {
        return;
    }

    double minX = bodies_.front().position.x;
    double maxX = minX;
    double minY = bodies_.front().position.y;
    double maxY = minY;
    for (const auto& b : bodies_) {
        minX = std::min(minX, b.position.x);
        maxX = std::max(maxX, b.position.x);
        minY = std::min(minY, b.position.y);
        maxY = std::max(maxY, b.position.y);
        maxRadius_ = std::max(maxRadius_, b.radius);
    }

    // Square root region, never degenerate, slightly larger than the bounding box
    double span = std::max(maxX - minX, maxY - minY);
    double size = std::max(span, SimulatorConstants::MinRootExtent) * SimulatorConstants::RootPaddingFactor;
    double cx = 0.5 * (minX + maxX);
    double cy = 0.5 * (minY + maxY);

    nodePool_.reserve(bodies_.size() * 2 + 1);
    allocateNode(cx - size * 0.5, cy - size * 0.5, size, 0);

    for (std::uint32_t i = 0; i < bodies_.size(); ++i) {
        insertBody(0, i);
    }

    computeMassDistribution(0);
}

void Quadtree::insertBody(int nodeIndex, std::uint32_t body) {
    const Position& pos = bodies_[body].position;
    int current = nodeIndex;

    while (true) {
        Node& node = nodePool_[current];
        if (!node.isLeaf()) {
            current = node.firstChild + node.getQuadrant(pos.x, pos.y);
            continue;
        }

        if (node.bodies.size() < leafCapacity_ || node.depth >= SimulatorConstants::MaxTreeDepth) {
            node.bodies.push_back(body);
            return;
        }

        // Full leaf: split it and push its occupants one level down
        std::vector<std::uint32_t> occupants = std::move(node.bodies);
        nodePool_[current].bodies.clear();
        subdivide(current);
        for (auto occupant : occupants) {
            insertBody(current, occupant);
        }
        // Loop again: current is now internal
    }
}

void Quadtree::subdivide(int nodeIndex) {
    // Copy what we need first; allocateNode may reallocate the pool
    double halfSize = nodePool_[nodeIndex].boundarySize * 0.5;
    double x = nodePool_[nodeIndex].boundaryX;
    double y = nodePool_[nodeIndex].boundaryY;
    int depth = nodePool_[nodeIndex].depth + 1;

    int nw = allocateNode(x, y, halfSize, depth);
    allocateNode(x + halfSize, y, halfSize, depth);
    allocateNode(x, y + halfSize, halfSize, depth);
    allocateNode(x + halfSize, y + halfSize, halfSize, depth);

    nodePool_[nodeIndex].firstChild = nw;
}

void Quadtree::computeMassDistribution(int nodeIndex) {
    double mass = 0.0;
    double mx = 0.0;
    double my = 0.0;

    if (nodePool_[nodeIndex].isLeaf()) {
        for (auto b : nodePool_[nodeIndex].bodies) {
            mass += bodies_[b].mass;
            mx += bodies_[b].position.x * bodies_[b].mass;
            my += bodies_[b].position.y * bodies_[b].mass;
        }
    } else {
        int first = nodePool_[nodeIndex].firstChild;
        for (int c = 0; c < 4; ++c) {
            computeMassDistribution(first + c);
            const Node& child = nodePool_[first + c];
            mass += child.totalMass;
            mx += child.centerOfMassX * child.totalMass;
            my += child.centerOfMassY * child.totalMass;
        }
    }

    Node& node = nodePool_[nodeIndex];
    node.totalMass = mass;
    if (mass > 0.0) {
        node.centerOfMassX = mx / mass;
        node.centerOfMassY = my / mass;
    } else {
        node.centerOfMassX = node.boundaryX + node.boundarySize * 0.5;
        node.centerOfMassY = node.boundaryY + node.boundarySize * 0.5;
    }
}

Vector Quadtree::accelerationAt(const Position& point, std::uint32_t self,
                                double theta, double softening, double G) const {
    Vector acc(0.0, 0.0);
    if (nodePool_.empty()) {
        return acc;
    }
    accumulate(0, point, self, theta, softening * softening, G, acc);
    return acc;
}

Vector Quadtree::accelerationOn(std::uint32_t index, double theta, double softening, double G) const {
    return accelerationAt(bodies_[index].position, index, theta, softening, G);
}

void Quadtree::accumulate(int nodeIndex, const Position& point, std::uint32_t self,
                          double theta, double softeningSq, double G, Vector& acc) const {
    const Node& node = nodePool_[nodeIndex];
    if (node.totalMass == 0.0) {
        return;
    }

    if (node.isLeaf()) {
        for (auto b : node.bodies) {
            if (b == self) {
                continue;
            }
            double dx = bodies_[b].position.x - point.x;
            double dy = bodies_[b].position.y - point.y;
            double distSq = dx * dx + dy * dy + softeningSq;
            if (distSq <= 0.0) {
                continue;  // coincident with zero softening
            }
            double inv = G * bodies_[b].mass / (distSq * std::sqrt(distSq));
            acc.x += dx * inv;
            acc.y += dy * inv;
        }
        return;
    }

    double dx = node.centerOfMassX - point.x;
    double dy = node.centerOfMassY - point.y;
    double dist = std::sqrt(dx * dx + dy * dy);

    // Far enough and not containing the point => treat as a single mass
    if (!node.contains(point.x, point.y) && dist > 0.0 && node.boundarySize < theta * dist) {
        double distSq = dx * dx + dy * dy + softeningSq;
        double inv = G * node.totalMass / (distSq * std::sqrt(distSq));
        acc.x += dx * inv;
        acc.y += dy * inv;
        return;
    }

    for (int c = 0; c < 4; ++c) {
        accumulate(node.firstChild + c, point, self, theta, softeningSq, G, acc);
    }
}

void Quadtree::queryCircle(const Position& center, double radius, std::vector<std::uint32_t>& out) const {
    if (nodePool_.empty() || radius < 0.0) {
        return;
    }
    queryNode(0, center, radius, out);
}

void Quadtree::queryNode(int nodeIndex, const Position& center, double radius,
                         std::vector<std::uint32_t>& out) const {
    const Node& node = nodePool_[nodeIndex];

    // Closest point of the square to the circle center
    double qx = std::clamp(center.x, node.boundaryX, node.boundaryX + node.boundarySize);
    double qy = std::clamp(center.y, node.boundaryY, node.boundaryY + node.boundarySize);
    double ddx = qx - center.x;
    double ddy = qy - center.y;
    if (ddx * ddx + ddy * ddy > radius * radius) {
        return;
    }

    if (node.isLeaf()) {
        for (auto b : node.bodies) {
            if (bodies_[b].position.distSquared(center) <= radius * radius) {
                out.push_back(b);
            }
        }
        return;
    }

    for (int c = 0; c < 4; ++c) {
        queryNode(node.firstChild + c, center, radius, out);
    }
}

double Quadtree::densityFactor(const Position& point) const {
    if (nodePool_.empty()) {
        return 0.0;
    }
    int current = 0;
    int depth = 0;
    while (!nodePool_[current].isLeaf() && depth < SimulatorConstants::DensityDepthLevels) {
        const Node& node = nodePool_[current];
        if (!node.contains(point.x, point.y)) {
            break;
        }
        current = node.firstChild + node.getQuadrant(point.x, point.y);
        ++depth;
    }
    return std::min(1.0, static_cast<double>(depth) / SimulatorConstants::DensityDepthLevels);
}

}  // namespace Systems
