/**
 * @fileoverview
 * @brief Pool-allocated quadtree used for Barnes-Hut force evaluation and proximity queries.
 *
 * The tree is rebuilt from scratch every time it is needed. Nodes live in a
 * flat pool and refer to their children by index, so building never chases
 * heap pointers and a rebuild reuses the pool's storage. Bodies are addressed
 * by their index in the input array handed to build(); callers keep that
 * array sorted by body id so that tree shape and traversal order only depend
 * on the bodies themselves.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "accretion/math/vector_math.hpp"

namespace Systems {

/**
 * @struct TreeBody
 * @brief Minimal view of a body as seen by the tree
 */
struct TreeBody {
    Position position;
    double mass = 0.0;
    double radius = 0.0;
};

class Quadtree {
public:
    static constexpr std::uint32_t NoBody = 0xffffffffu;

    /**
     * @struct Node
     * @brief Square region of the plane with its aggregated mass
     */
    struct Node {
        double boundaryX = 0.0;  ///< minimum corner
        double boundaryY = 0.0;
        double boundarySize = 0.0;

        double totalMass = 0.0;
        double centerOfMassX = 0.0;
        double centerOfMassY = 0.0;

        int depth = 0;

        // Index of the NW child; NE, SW, SE follow. -1 for leaves.
        int firstChild = -1;

        std::vector<std::uint32_t> bodies;  ///< leaf contents

        bool isLeaf() const { return firstChild < 0; }

        /**
         * @brief Checks whether a point (x, y) is within this node's bounding square
         */
        bool contains(double x, double y) const {
            return (x >= boundaryX && x < boundaryX + boundarySize &&
                    y >= boundaryY && y < boundaryY + boundarySize);
        }

        /**
         * @brief Determines which quadrant of this node the point (x, y) belongs in
         * @return 0 = NW, 1 = NE, 2 = SW, 3 = SE
         */
        int getQuadrant(double x, double y) const {
            double midX = boundaryX + boundarySize * 0.5;
            double midY = boundaryY + boundarySize * 0.5;

            if (x < midX) {
                return (y < midY) ? 0 : 2;
            } else {
                return (y < midY) ? 1 : 3;
            }
        }
    };

    explicit Quadtree(std::size_t leafCapacity = 1);

    void setLeafCapacity(std::size_t leafCapacity);

    /**
     * @brief Rebuilds the tree over the given bodies
     *
     * The root square is fitted to the bodies' bounding box, padded so that
     * every body lies strictly inside. Coincident bodies stop subdividing at
     * SimulatorConstants::MaxTreeDepth and share a leaf.
     */
    void build(const std::vector<TreeBody>& bodies);

    bool empty() const { return nodePool_.empty(); }
    std::size_t bodyCount() const { return bodies_.size(); }
    const std::vector<Node>& nodes() const { return nodePool_; }
    const std::vector<TreeBody>& bodies() const { return bodies_; }

    /**
     * @brief Root node. Only valid after building from at least one body (!empty()).
     */
    const Node& root() const {
        assert(!nodePool_.empty() && "Quadtree::root() on an empty tree.");
        return nodePool_.front();
    }

    /**
     * @brief Softened gravitational acceleration at a point
     *
     * A node is replaced by its center of mass when size / distance < theta
     * and the point lies outside the node. theta = 0 visits every body.
     *
     * @param point Where the acceleration is evaluated
     * @param self Index of the body sitting at point, excluded from the sum; NoBody for none
     */
    Vector accelerationAt(const Position& point, std::uint32_t self,
                          double theta, double softening, double G) const;

    /**
     * @brief Acceleration on body `index` of the last build()
     */
    Vector accelerationOn(std::uint32_t index, double theta, double softening, double G) const;

    /**
     * @brief Indices of bodies whose position lies within `radius` of center
     */
    void queryCircle(const Position& center, double radius, std::vector<std::uint32_t>& out) const;

    /**
     * @brief Local crowding in [0, 1], from the depth of the leaf holding the point
     */
    double densityFactor(const Position& point) const;

    double maxBodyRadius() const { return maxRadius_; }

private:
    int allocateNode(double x, double y, double size, int depth);
    void insertBody(int nodeIndex, std::uint32_t body);
    void subdivide(int nodeIndex);
    void computeMassDistribution(int nodeIndex);
    void accumulate(int nodeIndex, const Position& point, std::uint32_t self,
                    double theta, double softeningSq, double G, Vector& acc) const;
    void queryNode(int nodeIndex, const Position& center, double radius,
                   std::vector<std::uint32_t>& out) const;

    std::vector<Node> nodePool_;
    std::vector<TreeBody> bodies_;
    std::size_t leafCapacity_;
    double maxRadius_ = 0.0;
};

}  // namespace Systems
