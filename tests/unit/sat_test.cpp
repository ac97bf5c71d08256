#include <gtest/gtest.h>

#include <cmath>

#include "planar/core/errors.hpp"
#include "planar/math/polygon.hpp"
#include "planar/systems/collision/rect_overlap.hpp"
#include "planar/systems/collision/sat.hpp"

static Polygon unitSquare(double cx, double cy) {
    return rectPrimitive(Vector(cx, cy), 1.0, 1.0, true);
}

TEST(SatTest, OverlappingUnitSquares) {
    auto mtv = Collision::separatingAxisTest(unitSquare(0.0, 0.0), unitSquare(0.5, 0.0));
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->mag(), 0.5, 1e-12);
    EXPECT_NEAR(std::fabs(mtv->x), 0.5, 1e-12);
    EXPECT_NEAR(mtv->y, 0.0, 1e-12);
}

TEST(SatTest, SeparatedUnitSquares) {
    EXPECT_FALSE(Collision::separatingAxisTest(unitSquare(0.0, 0.0), unitSquare(2.0, 0.0)).has_value());
    EXPECT_FALSE(Collision::separatingAxisTest(unitSquare(0.0, 0.0), unitSquare(0.0, -1.5)).has_value());
}

TEST(SatTest, PicksShallowestAxis) {
    auto mtv = Collision::separatingAxisTest(unitSquare(0.0, 0.0), unitSquare(0.2, 0.9));
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(std::fabs(mtv->y), 0.1, 1e-12);
    EXPECT_NEAR(mtv->x, 0.0, 1e-12);
}

TEST(SatTest, DepthIsInWorldUnitsForLongEdges) {
    // wide slab with long edges against a small square
    Polygon slab = rectPrimitive(Vector(0.0, 0.0), 20.0, 2.0, true);
    auto mtv = Collision::separatingAxisTest(slab, unitSquare(0.0, 1.25));
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->mag(), 0.25, 1e-12);
}

TEST(SatTest, TouchingGivesZeroVector) {
    auto mtv = Collision::separatingAxisTest(unitSquare(0.0, 0.0), unitSquare(1.0, 0.0));
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->mag(), 0.0, 1e-12);
}

TEST(SatTest, RotatedSquareAgainstAxisAligned) {
    // diamond of half-diagonal 1 centered at (1.4, 0): tip at x = 0.4
    Polygon diamond{Vector(1.4, 1.0), Vector(2.4, 0.0), Vector(1.4, -1.0), Vector(0.4, 0.0)};
    auto mtv = Collision::separatingAxisTest(unitSquare(0.0, 0.0), diamond);
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->mag(), 0.1, 1e-9);

    Polygon farDiamond{Vector(2.6, 1.0), Vector(3.6, 0.0), Vector(2.6, -1.0), Vector(1.6, 0.0)};
    EXPECT_FALSE(Collision::separatingAxisTest(unitSquare(0.0, 0.0), farDiamond).has_value());
}

TEST(SatTest, DegeneratePolygonsAreRejected) {
    Polygon segment{Vector(0.0, 0.0), Vector(1.0, 0.0)};
    EXPECT_THROW(Collision::separatingAxisTest(segment, unitSquare(0.0, 0.0)), Errors::InvalidArgument);
    EXPECT_THROW(Collision::separatingAxisTest(unitSquare(0.0, 0.0), Polygon{}), Errors::InvalidArgument);
}

TEST(SatTest, RepeatedVertexIsSkipped) {
    Polygon square = unitSquare(0.0, 0.0);
    square.insert(square.begin() + 1, square[0]);
    auto mtv = Collision::separatingAxisTest(square, unitSquare(0.5, 0.0));
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->mag(), 0.5, 1e-12);
}

TEST(RectOverlapTest, YUpCorners) {
    // top-left has the larger y
    EXPECT_TRUE(Collision::rectsOverlap(Vector(0.0, 2.0), Vector(2.0, 0.0),
                                        Vector(1.0, 3.0), Vector(3.0, 1.0)));
    EXPECT_FALSE(Collision::rectsOverlap(Vector(0.0, 2.0), Vector(2.0, 0.0),
                                         Vector(3.0, 2.0), Vector(4.0, 0.0)));
    EXPECT_FALSE(Collision::rectsOverlap(Vector(0.0, 2.0), Vector(2.0, 0.0),
                                         Vector(0.0, -1.0), Vector(2.0, -3.0)));
    // shared edge
    EXPECT_TRUE(Collision::rectsOverlap(Vector(0.0, 2.0), Vector(2.0, 0.0),
                                        Vector(2.0, 2.0), Vector(4.0, 0.0)));
}
