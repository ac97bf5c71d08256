#include "planar/kinematics/constrained_body.hpp"

#include <cmath>
#include <deque>

#include "planar/core/debug.hpp"
#include "planar/core/errors.hpp"
#include "planar/math/math_utils.hpp"

namespace Kinematics {

ConstrainedBody::ConstrainedBody(const Vector& rootPosition,
                                 const std::string& rootTag,
                                 double minAngle,
                                 double maxAngle)
    : minAngle(minAngle), maxAngle(maxAngle)
{
    nodes.push_back(Node{rootPosition, rootTag, std::nullopt, std::nullopt, {}});
    tagIndex.emplace(rootTag, 0);
}

void ConstrainedBody::addNodeToParent(const Vector& position, const std::string& tag, const std::string& parentTag) {
    auto parentIt = tagIndex.find(parentTag);
    if (parentIt == tagIndex.end()) {
        throw Errors::InvalidArgument("addNodeToParent: unknown parent tag '" + parentTag + "'");
    }
    if (tagIndex.count(tag) != 0) {
        throw Errors::InvalidArgument("addNodeToParent: tag '" + tag + "' already in use");
    }

    size_t const parentIdx = parentIt->second;
    size_t const idx = nodes.size();
    double const distance = nodes[parentIdx].position.dist(position);

    nodes.push_back(Node{position, tag, parentIdx, distance, {}});
    nodes[parentIdx].children.push_back(idx);
    tagIndex.emplace(tag, idx);
}

const Node* ConstrainedBody::findNode(const std::string& tag) const {
    auto it = tagIndex.find(tag);
    return it == tagIndex.end() ? nullptr : &nodes[it->second];
}

std::vector<size_t> ConstrainedBody::breadthFirst() const {
    std::vector<size_t> order;
    order.reserve(nodes.size());
    std::deque<size_t> queue{0};
    while (!queue.empty()) {
        size_t const idx = queue.front();
        queue.pop_front();
        order.push_back(idx);
        for (size_t child : nodes[idx].children) {
            queue.push_back(child);
        }
    }
    return order;
}

std::vector<const Node*> ConstrainedBody::nodesInOrder() const {
    std::vector<const Node*> result;
    result.reserve(nodes.size());
    for (size_t idx : breadthFirst()) {
        result.push_back(&nodes[idx]);
    }
    return result;
}

std::optional<Vector> ConstrainedBody::directionToParent(const std::string& tag) const {
    const Node* node = findNode(tag);
    if (node == nullptr) {
        throw Errors::InvalidArgument("directionToParent: unknown tag '" + tag + "'");
    }
    if (!node->parent) {
        return std::nullopt;
    }
    return (nodes[*node->parent].position - node->position).normalize(false);
}

void ConstrainedBody::moveRoot(const Vector& position) {
    nodes.front().position = position;
    applyDistanceConstraint();
    applyAngleConstraint(true);
}

void ConstrainedBody::applyDistanceConstraint() {
    for (size_t idx : breadthFirst()) {
        Node& node = nodes[idx];
        if (!node.parent || !node.distanceToParent) {
            continue;
        }
        const Vector& parentPos = nodes[*node.parent].position;
        Vector const dir = (parentPos - node.position).normalize(true);
        if (dir.magSquare() == 0.0) {
            continue;
        }
        node.position = parentPos - dir * *node.distanceToParent;
    }
}

void ConstrainedBody::applyAngleConstraint(bool bothSides) {
    for (size_t idx : breadthFirst()) {
        Node& node = nodes[idx];
        if (!node.parent || !nodes[*node.parent].parent) {
            continue;
        }
        Node& parent = nodes[*node.parent];
        Node& grandparent = nodes[*parent.parent];

        Vector const toGrandparent = grandparent.position - parent.position;
        Vector const toNode = node.position - parent.position;
        if (toGrandparent.magSquare() == 0.0 || toNode.magSquare() == 0.0) {
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[ConstrainedBody] zero-length arm at '" << node.tag << "'\n");
            continue;
        }

        double const angle = toGrandparent.angle(toNode);
        double const absAngle = std::fabs(angle);
        double const s = MathUtils::sign(angle);

        double deltaGrandparent = 0.0;
        double deltaNode = 0.0;
        if (absAngle < minAngle) {
            double const delta = minAngle - absAngle;
            deltaGrandparent = bothSides ? -s * delta / 2 : -s * delta;
            deltaNode = bothSides ? s * delta / 2 : 0.0;
        } else if (absAngle > maxAngle) {
            // close the bend: grandparent and node turn toward each other
            double const excess = absAngle - maxAngle;
            deltaGrandparent = bothSides ? s * excess / 2 : s * excess;
            deltaNode = bothSides ? -s * excess / 2 : 0.0;
        } else {
            continue;
        }

        grandparent.position = grandparent.position.rotate(deltaGrandparent, parent.position);
        node.position = node.position.rotate(deltaNode, parent.position);
    }
}

} // namespace Kinematics
