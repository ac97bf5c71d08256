#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "planar/core/errors.hpp"
#include "planar/kinematics/constrained_body.hpp"
#include "planar/math/constants.hpp"

using Kinematics::ConstrainedBody;

namespace {

double bendAt(const ConstrainedBody& body, const std::string& grandparent,
              const std::string& parent, const std::string& node) {
    Vector const g = body.findNode(grandparent)->position;
    Vector const p = body.findNode(parent)->position;
    Vector const n = body.findNode(node)->position;
    return std::fabs((g - p).angle(n - p));
}

} // namespace

TEST(ConstrainedBodyTest, DefaultsAndRoot) {
    ConstrainedBody body(Vector(1.0, 2.0), "head");
    EXPECT_DOUBLE_EQ(body.getMinAngle(), 0.0);
    EXPECT_DOUBLE_EQ(body.getMaxAngle(), MathConstants::PI);
    EXPECT_EQ(body.size(), 1u);
    EXPECT_EQ(body.root().tag, "head");
    EXPECT_FALSE(body.root().parent.has_value());
    EXPECT_FALSE(body.directionToParent("head").has_value());
}

TEST(ConstrainedBodyTest, AddNodeFreezesDistance) {
    ConstrainedBody body(Vector(0.0, 0.0), "0");
    body.addNodeToParent(Vector(3.0, 4.0), "1", "0");

    const auto* node = body.findNode("1");
    ASSERT_NE(node, nullptr);
    ASSERT_TRUE(node->distanceToParent.has_value());
    EXPECT_DOUBLE_EQ(*node->distanceToParent, 5.0);

    auto dir = body.directionToParent("1");
    ASSERT_TRUE(dir.has_value());
    EXPECT_DOUBLE_EQ(dir->x, -0.6);
    EXPECT_DOUBLE_EQ(dir->y, -0.8);
}

TEST(ConstrainedBodyTest, DuplicateAndUnknownTagsAreRejected) {
    ConstrainedBody body(Vector(), "0");
    body.addNodeToParent(Vector(1.0, 0.0), "1", "0");

    EXPECT_THROW(body.addNodeToParent(Vector(2.0, 0.0), "1", "0"), Errors::InvalidArgument);
    EXPECT_THROW(body.addNodeToParent(Vector(2.0, 0.0), "0", "1"), Errors::InvalidArgument);
    EXPECT_THROW(body.addNodeToParent(Vector(2.0, 0.0), "2", "missing"), Errors::InvalidArgument);
    EXPECT_EQ(body.size(), 2u);

    EXPECT_EQ(body.findNode("missing"), nullptr);
    EXPECT_THROW(body.directionToParent("missing"), Errors::InvalidArgument);
}

TEST(ConstrainedBodyTest, NodesInBreadthFirstOrder) {
    ConstrainedBody body(Vector(), "root");
    body.addNodeToParent(Vector(1.0, 0.0), "a", "root");
    body.addNodeToParent(Vector(2.0, 0.0), "a1", "a");
    body.addNodeToParent(Vector(-1.0, 0.0), "b", "root");

    auto nodes = body.nodesInOrder();
    ASSERT_EQ(nodes.size(), 4u);
    EXPECT_EQ(nodes[0]->tag, "root");
    EXPECT_EQ(nodes[1]->tag, "a");
    EXPECT_EQ(nodes[2]->tag, "b");
    EXPECT_EQ(nodes[3]->tag, "a1");
}

TEST(ConstrainedBodyTest, DistanceConstraintRestoresLengths) {
    ConstrainedBody body(Vector(0.0, 0.0), "0");
    body.addNodeToParent(Vector(10.0, 0.0), "1", "0");
    body.addNodeToParent(Vector(20.0, 0.0), "2", "1");

    body.moveRoot(Vector(-5.0, 3.0));

    EXPECT_NEAR(body.findNode("0")->position.dist(body.findNode("1")->position), 10.0, 1e-9);
    EXPECT_NEAR(body.findNode("1")->position.dist(body.findNode("2")->position), 10.0, 1e-9);
}

TEST(ConstrainedBodyTest, DistancePassIsIdempotent) {
    ConstrainedBody body(Vector(0.0, 0.0), "0");
    body.addNodeToParent(Vector(4.0, 3.0), "1", "0");
    body.addNodeToParent(Vector(6.0, -1.0), "2", "1");

    body.moveRoot(Vector(12.0, -7.0));
    body.applyDistanceConstraint();
    auto once = body.nodesInOrder();
    std::vector<Vector> first;
    for (const auto* n : once) {
        first.push_back(n->position);
    }

    body.applyDistanceConstraint();
    auto twice = body.nodesInOrder();
    for (size_t i = 0; i < twice.size(); ++i) {
        EXPECT_TRUE(nearlyEqual(twice[i]->position, first[i], 1e-9)) << twice[i]->tag;
    }
}

TEST(ConstrainedBodyTest, CoincidentNodeStaysInPlace) {
    ConstrainedBody body(Vector(0.0, 0.0), "0");
    body.addNodeToParent(Vector(0.0, 0.0), "1", "0");
    EXPECT_NO_THROW(body.applyDistanceConstraint());
    EXPECT_TRUE(nearlyEqual(body.findNode("1")->position, Vector(0.0, 0.0)));
}

TEST(ConstrainedBodyTest, SharpBendIsOpenedToMinAngle) {
    ConstrainedBody body(Vector(0.0, 0.0), "0", 0.8 * MathConstants::PI);
    body.addNodeToParent(Vector(10.0, 0.0), "1", "0");
    body.addNodeToParent(Vector(10.0, 10.0), "2", "1");
    ASSERT_NEAR(bendAt(body, "0", "1", "2"), MathConstants::PI / 2, 1e-12);

    body.moveRoot(Vector(0.0, 0.0));

    EXPECT_NEAR(bendAt(body, "0", "1", "2"), 0.8 * MathConstants::PI, 1e-9);
    EXPECT_NEAR(body.findNode("0")->position.dist(body.findNode("1")->position), 10.0, 1e-9);
    EXPECT_NEAR(body.findNode("1")->position.dist(body.findNode("2")->position), 10.0, 1e-9);
}

TEST(ConstrainedBodyTest, MovedRootKeepsLengthsAndBendLimits) {
    double const minAngle = 0.75 * MathConstants::PI;
    double const maxAngle = MathConstants::PI;
    ConstrainedBody body(Vector(0.0, 0.0), "root", minAngle, maxAngle);
    body.addNodeToParent(Vector(10.0, 0.0), "mid", "root");
    body.addNodeToParent(Vector(20.0, 0.0), "tail", "mid");

    // pulling the root up and back folds the chain to about 0.3 pi at mid
    body.moveRoot(Vector(15.0, 8.0));

    EXPECT_NEAR(body.findNode("root")->position.dist(body.findNode("mid")->position), 10.0, 1e-9);
    EXPECT_NEAR(body.findNode("mid")->position.dist(body.findNode("tail")->position), 10.0, 1e-9);
    double const bend = bendAt(body, "root", "mid", "tail");
    EXPECT_GE(bend, minAngle - 1e-9);
    EXPECT_LE(bend, maxAngle + 1e-9);
    EXPECT_GT(body.findNode("root")->position.dist(Vector(0.0, 0.0)), 10.0);
}

TEST(ConstrainedBodyTest, OneSidedCorrectionMovesOnlyTheGrandparent) {
    ConstrainedBody body(Vector(0.0, 0.0), "0", 0.8 * MathConstants::PI);
    body.addNodeToParent(Vector(10.0, 0.0), "1", "0");
    body.addNodeToParent(Vector(10.0, 10.0), "2", "1");

    body.applyAngleConstraint(false);

    EXPECT_TRUE(nearlyEqual(body.findNode("2")->position, Vector(10.0, 10.0), 1e-12));
    EXPECT_NEAR(bendAt(body, "0", "1", "2"), 0.8 * MathConstants::PI, 1e-9);
}

TEST(ConstrainedBodyTest, OverBendIsClosedToMaxAngle) {
    ConstrainedBody body(Vector(0.0, 0.0), "0", 0.0, MathConstants::PI / 2);
    body.addNodeToParent(Vector(10.0, 0.0), "1", "0");
    body.addNodeToParent(Vector(20.0, 1.0), "2", "1");

    body.applyAngleConstraint(true);
    EXPECT_NEAR(bendAt(body, "0", "1", "2"), MathConstants::PI / 2, 1e-9);
}

TEST(ConstrainedBodyTest, BendInsideLimitsIsUntouched) {
    ConstrainedBody body(Vector(0.0, 0.0), "0", 0.5 * MathConstants::PI);
    body.addNodeToParent(Vector(10.0, 0.0), "1", "0");
    body.addNodeToParent(Vector(18.0, 6.0), "2", "1");

    body.applyAngleConstraint(true);
    EXPECT_TRUE(nearlyEqual(body.findNode("0")->position, Vector(0.0, 0.0)));
    EXPECT_TRUE(nearlyEqual(body.findNode("2")->position, Vector(18.0, 6.0)));
}
