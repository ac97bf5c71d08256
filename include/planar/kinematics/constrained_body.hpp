/**
 * @file constrained_body.hpp
 * @brief Tree of points held together by distance and angle constraints
 *
 * Used for procedural motion (snakes, tentacles, limbs): the caller drags
 * the root around and the rest of the tree follows. Each node keeps the
 * distance to its parent it had when it was added, and every chain of three
 * consecutive nodes keeps its bend angle inside [minAngle, maxAngle].
 *
 * Corrections are a single sequential pass in breadth-first order; there is
 * no iterative relaxation.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "planar/math/constants.hpp"
#include "planar/math/vector_math.hpp"

namespace Kinematics {

struct Node {
    Vector position;
    std::string tag;
    std::optional<size_t> parent;           ///< Index of the parent, empty for the root
    std::optional<double> distanceToParent; ///< Frozen when the node is added
    std::vector<size_t> children;
};

class ConstrainedBody {
public:
    /**
     * @param minAngle Smallest allowed |bend| between grandparent and node, seen from the parent
     * @param maxAngle Largest allowed |bend|
     */
    ConstrainedBody(const Vector& rootPosition,
                    const std::string& rootTag,
                    double minAngle = 0.0,
                    double maxAngle = MathConstants::PI);

    /**
     * @brief Adds a node under an existing parent
     *
     * The distance to the parent is measured now and kept from then on.
     *
     * @throws Errors::InvalidArgument if the tag is taken or the parent is unknown
     */
    void addNodeToParent(const Vector& position, const std::string& tag, const std::string& parentTag);

    /**
     * @brief Node by tag, nullptr if absent
     *
     * The pointer is invalidated by addNodeToParent().
     */
    const Node* findNode(const std::string& tag) const;

    const Node& root() const { return nodes.front(); }
    size_t size() const { return nodes.size(); }
    double getMinAngle() const { return minAngle; }
    double getMaxAngle() const { return maxAngle; }

    /** @brief All nodes, breadth-first from the root */
    std::vector<const Node*> nodesInOrder() const;

    /**
     * @brief Unit vector from the node toward its parent
     *
     * @return std::nullopt for the root
     * @throws Errors::InvalidArgument if the tag is unknown
     * @throws Errors::DivideByZero if the node sits on its parent
     */
    std::optional<Vector> directionToParent(const std::string& tag) const;

    /**
     * @brief Moves the root, then runs the distance pass and the two-sided angle pass
     */
    void moveRoot(const Vector& position);

    /**
     * @brief Pulls every node back to its frozen distance along the line to its parent
     *
     * A node lying exactly on its parent has no direction and stays put.
     */
    void applyDistanceConstraint();

    /**
     * @brief Clamps the bend angle of every grandparent-parent-node triple
     *
     * One-sided mode rotates only the grandparent about the parent; with
     * bothSides the correction is split evenly between grandparent and node.
     */
    void applyAngleConstraint(bool bothSides = false);

private:
    std::vector<size_t> breadthFirst() const;

    std::vector<Node> nodes;
    std::unordered_map<std::string, size_t> tagIndex;
    double minAngle;
    double maxAngle;
};

} // namespace Kinematics
