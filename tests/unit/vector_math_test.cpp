#include <gtest/gtest.h>
#include "accretion/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.y, 2.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector left_mult = 2.0 * v;
    EXPECT_DOUBLE_EQ(left_mult.x, 4.0);
    EXPECT_DOUBLE_EQ(left_mult.y, 6.0);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);

    Vector neg = -v;
    EXPECT_DOUBLE_EQ(neg.x, -2.0);
    EXPECT_DOUBLE_EQ(neg.y, -3.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);

    EXPECT_DOUBLE_EQ(v.normalized().length(), 1.0);

    Vector v5(1.0, 0.0);
    Vector v6(0.0, 1.0);
    EXPECT_DOUBLE_EQ(v5.cross(v6), 1.0);

    // Counter-clockwise quarter turn
    Vector perp = v5.perp();
    EXPECT_DOUBLE_EQ(perp.x, 0.0);
    EXPECT_DOUBLE_EQ(perp.y, 1.0);
}

TEST(VectorMathTest, ZeroLengthNormalisation) {
    Vector zero;
    Vector fallback = zero.normalized();
    EXPECT_DOUBLE_EQ(fallback.x, 1.0);
    EXPECT_DOUBLE_EQ(fallback.y, 0.0);

    Vector none = zero.normalizedOrZero();
    EXPECT_DOUBLE_EQ(none.x, 0.0);
    EXPECT_DOUBLE_EQ(none.y, 0.0);
}

TEST(VectorMathTest, ClampLength) {
    Vector v(30.0, 40.0);

    Vector clamped = v.clampLength(10.0);
    EXPECT_NEAR(clamped.length(), 10.0, EPSILON);
    EXPECT_NEAR(clamped.x, 6.0, EPSILON);
    EXPECT_NEAR(clamped.y, 8.0, EPSILON);

    Vector untouched = v.clampLength(100.0);
    EXPECT_DOUBLE_EQ(untouched.x, 30.0);
    EXPECT_DOUBLE_EQ(untouched.y, 40.0);
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Position p3 = p1 + p2;
    EXPECT_DOUBLE_EQ(p3.x, 4.0);
    EXPECT_DOUBLE_EQ(p3.y, 6.0);

    EXPECT_DOUBLE_EQ(p1.dist(p2), 2.8284271247461903);  // sqrt(8)
    EXPECT_DOUBLE_EQ(p1.distSquared(p2), 8.0);

    Position moved = p1 + Vector(0.5, -0.5);
    EXPECT_DOUBLE_EQ(moved.x, 1.5);
    EXPECT_DOUBLE_EQ(moved.y, 1.5);
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    Vector v2(3.0, 4.0);
    Position p2 = static_cast<Position>(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}
