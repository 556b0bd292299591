#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "linear_algebra.hpp"

using navl::Mat3;
using navl::Vec3;

TEST(Vec3Test, DistanceAndNorm) {
    const Vec3 a(1.0, 2.0, 2.0);
    EXPECT_DOUBLE_EQ(a.norm(), 3.0);
    EXPECT_DOUBLE_EQ(a.normSquared(), 9.0);
    EXPECT_DOUBLE_EQ(navl::distance(a, Vec3()), 3.0);
    EXPECT_DOUBLE_EQ(a.dot(Vec3(1.0, 0.0, 0.0)), 1.0);
}

TEST(Vec3Test, DetectsNonFinite) {
    EXPECT_TRUE(Vec3(1.0, 2.0, 3.0).isFinite());
    EXPECT_FALSE(Vec3(std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0).isFinite());
    EXPECT_FALSE(Vec3(0.0, std::numeric_limits<double>::infinity(), 0.0).isFinite());
}

TEST(Mat3Test, InverseOfDiagonal) {
    const Mat3 m = Mat3::diagonal(Vec3(2.0, 4.0, 8.0));
    const auto inv = m.inverse();
    ASSERT_TRUE(inv.has_value());
    EXPECT_DOUBLE_EQ((*inv)(0, 0), 0.5);
    EXPECT_DOUBLE_EQ((*inv)(1, 1), 0.25);
    EXPECT_DOUBLE_EQ((*inv)(2, 2), 0.125);
    EXPECT_DOUBLE_EQ((*inv)(0, 1), 0.0);
}

TEST(Mat3Test, InverseTimesMatrixIsIdentity) {
    Mat3 m;
    m(0, 0) = 4.0; m(0, 1) = 1.0; m(0, 2) = 0.5;
    m(1, 0) = 1.0; m(1, 1) = 3.0; m(1, 2) = 0.2;
    m(2, 0) = 0.5; m(2, 1) = 0.2; m(2, 2) = 2.0;

    const auto inv = m.inverse();
    ASSERT_TRUE(inv.has_value());

    const Mat3 product = m * (*inv);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            EXPECT_NEAR(product(r, c), r == c ? 1.0 : 0.0, 1e-12);
        }
    }
}

TEST(Mat3Test, SingularMatrixHasNoInverse) {
    EXPECT_FALSE(Mat3::zeros().inverse().has_value());

    // Rank 2: third row is the sum of the first two
    Mat3 m;
    m(0, 0) = 1.0; m(0, 1) = 2.0; m(0, 2) = 3.0;
    m(1, 0) = 4.0; m(1, 1) = 5.0; m(1, 2) = 6.0;
    m(2, 0) = 5.0; m(2, 1) = 7.0; m(2, 2) = 9.0;
    EXPECT_FALSE(m.inverse().has_value());
}

TEST(Mat3Test, SingularityCheckIgnoresScale) {
    // Tiny but well-conditioned
    const auto small = Mat3::diagonal(Vec3(1e-5, 1e-5, 1e-5)).inverse();
    ASSERT_TRUE(small.has_value());
    EXPECT_NEAR((*small)(0, 0), 1e5, 1e-6);

    // Large determinant, nearly dependent rows
    Mat3 m;
    m(0, 0) = 1e6;
    m(1, 0) = 1e6; m(1, 1) = 1e-8;
    m(2, 2) = 1e6;
    EXPECT_GT(std::abs(m.determinant()), 1.0);
    EXPECT_FALSE(m.inverse().has_value());
}

TEST(Mat3Test, NonFiniteMatrixHasNoInverse) {
    Mat3 m = Mat3::identity();
    m(1, 2) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(m.isFinite());
    EXPECT_FALSE(m.inverse().has_value());
}

TEST(Mat3Test, ForceSymmetricAveragesOffDiagonal) {
    Mat3 m = Mat3::identity();
    m(0, 1) = 1.0;
    m(1, 0) = 3.0;
    m.forceSymmetric();
    EXPECT_DOUBLE_EQ(m(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(m(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(m.trace(), 3.0);
}

TEST(Mat3Test, MatrixVectorProduct) {
    const Mat3 m = Mat3::diagonal(Vec3(1.0, 2.0, 3.0));
    const Vec3 v = m * Vec3(1.0, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);
    EXPECT_DOUBLE_EQ(v.z, 3.0);
    EXPECT_DOUBLE_EQ(m.transposed()(2, 2), 3.0);
    EXPECT_DOUBLE_EQ(m.determinant(), 6.0);
}
