#include <gtest/gtest.h>

#include "planar/core/errors.hpp"
#include "planar/math/math_utils.hpp"

TEST(MathUtilsTest, ClipAndSign) {
    EXPECT_DOUBLE_EQ(MathUtils::clip(5.0, 0.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(MathUtils::clip(-5.0, 0.0, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(MathUtils::clip(0.25, 0.0, 1.0), 0.25);

    EXPECT_DOUBLE_EQ(MathUtils::sign(-0.1), -1.0);
    EXPECT_DOUBLE_EQ(MathUtils::sign(0.0), 1.0);
    EXPECT_DOUBLE_EQ(MathUtils::sign(3.0), 1.0);
}

TEST(MathUtilsTest, Interpolation) {
    EXPECT_DOUBLE_EQ(MathUtils::interp1d(10.0, 20.0, 0.25), 12.5);
    EXPECT_DOUBLE_EQ(MathUtils::interp1d(10.0, 20.0, 1.5), 25.0);
    EXPECT_DOUBLE_EQ(MathUtils::interp1d(10.0, 20.0, 1.5, true), 20.0);

    Vector mid = MathUtils::interp2d(Vector(0.0, 0.0), Vector(4.0, -2.0), 0.5);
    EXPECT_DOUBLE_EQ(mid.x, 2.0);
    EXPECT_DOUBLE_EQ(mid.y, -1.0);
}

TEST(MathUtilsTest, Mapper) {
    EXPECT_DOUBLE_EQ(MathUtils::mapper1d(5.0, 0.0, 10.0, 100.0, 200.0), 150.0);
    EXPECT_DOUBLE_EQ(MathUtils::mapper1d(0.0, -1.0, 1.0, 0.0, 1.0), 0.5);
    EXPECT_THROW(MathUtils::mapper1d(1.0, 2.0, 2.0, 0.0, 1.0), Errors::DivideByZero);
}

TEST(MathUtilsTest, BezierEndpointsAndCount) {
    Vector p0(0.0, 0.0), p1(1.0, 2.0), p2(2.0, 0.0), p3(3.0, 3.0);

    auto quad = MathUtils::quadraticBezier(p0, p1, p2, 4);
    ASSERT_EQ(quad.size(), 5u);
    EXPECT_TRUE(nearlyEqual(quad.front(), p0));
    EXPECT_TRUE(nearlyEqual(quad.back(), p2));
    // apex of this symmetric curve
    EXPECT_NEAR(quad[2].x, 1.0, 1e-12);
    EXPECT_NEAR(quad[2].y, 1.0, 1e-12);

    auto cubic = MathUtils::cubicBezier(p0, p1, p2, p3, 10);
    ASSERT_EQ(cubic.size(), 11u);
    EXPECT_TRUE(nearlyEqual(cubic.front(), p0));
    EXPECT_TRUE(nearlyEqual(cubic.back(), p3));

    EXPECT_THROW(MathUtils::quadraticBezier(p0, p1, p2, 0), Errors::InvalidArgument);
    EXPECT_THROW(MathUtils::cubicBezier(p0, p1, p2, p3, -1), Errors::InvalidArgument);
}
