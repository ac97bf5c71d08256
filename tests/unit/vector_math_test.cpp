#include <gtest/gtest.h>

#include <cmath>
#include <sstream>

#include "planar/core/errors.hpp"
#include "planar/math/constants.hpp"
#include "planar/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, ArithmeticReturnsNewValues) {
    Vector const v1(1.0, 2.0);
    Vector const v2(3.0, 4.0);

    Vector sum = v1 + v2;
    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, 6.0);

    Vector diff = v2 - v1;
    EXPECT_DOUBLE_EQ(diff.x, 2.0);
    EXPECT_DOUBLE_EQ(diff.y, 2.0);

    Vector neg = -v1;
    EXPECT_DOUBLE_EQ(neg.x, -1.0);
    EXPECT_DOUBLE_EQ(neg.y, -2.0);

    // operands untouched
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);

    // compound forms only modify the local copy
    Vector acc = v1;
    acc += v2;
    acc -= Vector(1.0, 1.0);
    EXPECT_DOUBLE_EQ(acc.x, 3.0);
    EXPECT_DOUBLE_EQ(acc.y, 5.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector left_mult = 2.0 * v;
    EXPECT_DOUBLE_EQ(left_mult.x, 4.0);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);
}

TEST(VectorMathTest, DivisionByZero) {
    Vector v(2.0, 3.0);
    EXPECT_THROW(v / 0.0, Errors::DivideByZero);

    Vector guarded = v.divide(0.0, true);
    EXPECT_DOUBLE_EQ(guarded.x, 0.0);
    EXPECT_DOUBLE_EQ(guarded.y, 0.0);
    EXPECT_THROW(v.divide(0.0, false), Errors::DivideByZero);
}

TEST(VectorMathTest, MagnitudeAndNormalize) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.mag(), 5.0);
    EXPECT_DOUBLE_EQ(v.magSquare(), 25.0);

    Vector unit = v.normalize(false);
    EXPECT_NEAR(unit.mag(), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(unit.x, 0.6);
    EXPECT_DOUBLE_EQ(unit.y, 0.8);

    Vector odd(-7.25, 1e-3);
    EXPECT_NEAR(odd.normalize(false).mag(), 1.0, 1e-12);
}

TEST(VectorMathTest, NormalizeZeroVector) {
    Vector zero;
    EXPECT_THROW(zero.normalize(false), Errors::DivideByZero);

    Vector ignored = zero.normalize(true);
    EXPECT_DOUBLE_EQ(ignored.x, 0.0);
    EXPECT_DOUBLE_EQ(ignored.y, 0.0);
}

TEST(VectorMathTest, DotAndCross) {
    Vector v5(1.0, 0.0);
    Vector v6(0.0, 1.0);
    EXPECT_DOUBLE_EQ(v5.cross(v6), 1.0);
    EXPECT_DOUBLE_EQ(v6.cross(v5), -1.0);
    EXPECT_DOUBLE_EQ(v5.dot(v6), 0.0);
    EXPECT_DOUBLE_EQ(Vector(2.0, 3.0).dot(Vector(4.0, -1.0)), 5.0);
}

TEST(VectorMathTest, SignedAngle) {
    Vector right = Vector::right();
    Vector up = Vector::up();

    EXPECT_NEAR(right.angle(up), MathConstants::PI / 2, 1e-12);
    EXPECT_NEAR(up.angle(right), -MathConstants::PI / 2, 1e-12);
    EXPECT_NEAR(right.angle(right), 0.0, 1e-12);

    // zero cross product counts as positive
    EXPECT_NEAR(right.angle(Vector::left()), MathConstants::PI, 1e-12);

    EXPECT_THROW(right.angle(Vector()), Errors::DivideByZero);
}

TEST(VectorMathTest, RotateRoundTrip) {
    Vector const v(3.5, -1.25);
    for (double theta : {0.0, 0.3, 1.0, -2.2, MathConstants::PI}) {
        Vector back = v.rotate(theta).rotate(-theta);
        EXPECT_TRUE(nearlyEqual(back, v, 1e-9)) << "theta=" << theta << " got " << back;
    }
}

TEST(VectorMathTest, RotateAboutPivot) {
    Vector const p(2.0, 1.0);
    Vector const pivot(1.0, 1.0);

    Vector r = p.rotate(MathConstants::PI / 2, pivot);
    EXPECT_NEAR(r.x, 1.0, 1e-12);
    EXPECT_NEAR(r.y, 2.0, 1e-12);

    Vector back = p.rotate(0.7, pivot).rotate(-0.7, pivot);
    EXPECT_TRUE(nearlyEqual(back, p, 1e-9));
}

TEST(VectorMathTest, ParallelAndPerpendicularComponents) {
    Vector const v(3.0, 4.0);
    Vector const axis(2.0, 0.0);

    Vector par = v.componentParallel(axis);
    Vector perp = v.componentPerpendicular(axis);
    EXPECT_DOUBLE_EQ(par.x, 3.0);
    EXPECT_DOUBLE_EQ(par.y, 0.0);
    EXPECT_DOUBLE_EQ(perp.x, 0.0);
    EXPECT_DOUBLE_EQ(perp.y, 4.0);

    Vector const skew(1.0, 1.0);
    Vector sum = v.componentParallel(skew) + v.componentPerpendicular(skew);
    EXPECT_TRUE(nearlyEqual(sum, v, 1e-12));
    EXPECT_NEAR(v.componentPerpendicular(skew).dot(skew), 0.0, 1e-12);

    EXPECT_THROW(v.componentParallel(Vector()), Errors::DivideByZero);
}

TEST(VectorMathTest, DistanceAndClip) {
    EXPECT_DOUBLE_EQ(Vector(1.0, 1.0).dist(Vector(4.0, 5.0)), 5.0);

    Vector longVec(30.0, 40.0);
    EXPECT_NEAR(longVec.clip(1.0, 10.0).mag(), 10.0, 1e-12);
    EXPECT_NEAR(Vector(0.3, 0.4).clip(1.0, 10.0).mag(), 1.0, 1e-12);
    EXPECT_NEAR(Vector(3.0, 4.0).clip(1.0, 10.0).mag(), 5.0, 1e-12);
}

TEST(VectorMathTest, DirectionFactoriesAreYUp) {
    EXPECT_DOUBLE_EQ(Vector::up(2.0).y, 2.0);
    EXPECT_DOUBLE_EQ(Vector::down().y, -1.0);
    EXPECT_DOUBLE_EQ(Vector::left(3.0).x, -3.0);
    EXPECT_DOUBLE_EQ(Vector::right().x, 1.0);
    EXPECT_DOUBLE_EQ(Vector::origin().mag(), 0.0);
}

TEST(VectorMathTest, AngleConversionsAndPrinting) {
    EXPECT_NEAR(deg2rad(180.0), MathConstants::PI, 1e-12);
    EXPECT_NEAR(rad2deg(MathConstants::PI / 2), 90.0, 1e-12);

    std::ostringstream os;
    os << Vector(1.0, -2.5);
    EXPECT_EQ(os.str(), "V2(1.00, -2.50)");
}
