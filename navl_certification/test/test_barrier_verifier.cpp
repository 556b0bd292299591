#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "barrier_verifier.hpp"

using namespace navl;

class BarrierVerifierTest : public ::testing::Test {
protected:
    BarrierVerifier verifier_{BarrierConfig()};
    const Vec3 origin_{0.0, 0.0, 0.0};
};

TEST_F(BarrierVerifierTest, NoObstaclesIsCertified) {
    const BarrierRecord record = verifier_.evaluate(origin_, Vec3(1.0, 0.0, 0.0), {});

    EXPECT_TRUE(record.certified);
    EXPECT_DOUBLE_EQ(record.value, 1.0);
    EXPECT_DOUBLE_EQ(record.derivative, 0.0);
    EXPECT_EQ(record.obstacle_count, 0u);
    EXPECT_TRUE(std::isinf(record.min_distance));
    EXPECT_TRUE(verifier_.isCertifiedSafe());
}

TEST_F(BarrierVerifierTest, ApproachingObstacleInsideMarginViolates) {
    // d = 0.4m, margin 0.5m -> h = 1 - 0.16/0.25 = 0.36
    const std::vector<Vec3> obstacles{Vec3(0.4, 0.0, 0.0)};

    const BarrierRecord record = verifier_.evaluate(origin_, Vec3(1.0, 0.0, 0.0), obstacles);

    EXPECT_NEAR(record.value, 0.36, 1e-12);
    EXPECT_NEAR(record.derivative, 3.2, 1e-12);
    EXPECT_FALSE(record.certified);
    EXPECT_NEAR(record.min_distance, 0.4, 1e-12);
    EXPECT_FALSE(verifier_.isCertifiedSafe());
    EXPECT_NEAR(verifier_.getBarrierValue(), 0.36, 1e-12);
}

TEST_F(BarrierVerifierTest, RetreatingFromObstacleIsCertified) {
    const std::vector<Vec3> obstacles{Vec3(0.4, 0.0, 0.0)};

    const BarrierRecord record = verifier_.evaluate(origin_, Vec3(-1.0, 0.0, 0.0), obstacles);

    EXPECT_NEAR(record.derivative, -3.2, 1e-12);
    EXPECT_TRUE(record.certified);
}

TEST_F(BarrierVerifierTest, CoincidentObstacleHasUnitBarrier) {
    const std::vector<Vec3> obstacles{origin_};

    const BarrierRecord record = verifier_.evaluate(origin_, Vec3(), obstacles);

    EXPECT_DOUBLE_EQ(record.value, 1.0);
    EXPECT_DOUBLE_EQ(record.derivative, 0.0);
    // 0 <= -alpha * 1 does not hold
    EXPECT_FALSE(record.certified);
}

TEST_F(BarrierVerifierTest, ObstacleBeyondMarginIsNotCertified) {
    const std::vector<Vec3> obstacles{Vec3(2.0, 0.0, 0.0)};

    const BarrierRecord record = verifier_.evaluate(origin_, Vec3(), obstacles);

    EXPECT_NEAR(record.value, 1.0 - 4.0 / 0.25, 1e-12);
    EXPECT_LT(record.value, 0.0);
    EXPECT_FALSE(record.certified);
}

TEST_F(BarrierVerifierTest, BindingObstacleHasMinimumBarrier) {
    const std::vector<Vec3> obstacles{
        Vec3(0.1, 0.0, 0.0),
        Vec3(0.0, 0.45, 0.0),
        Vec3(0.0, -0.3, 0.0)};

    const BarrierRecord record = verifier_.evaluate(origin_, Vec3(0.0, 1.0, 0.0), obstacles);

    const double expected_h = verifier_.barrierFunction(origin_, obstacles[1]);
    EXPECT_NEAR(record.value, expected_h, 1e-12);
    EXPECT_NEAR(record.derivative,
                verifier_.barrierGradient(origin_, obstacles[1]).dot(Vec3(0.0, 1.0, 0.0)), 1e-12);
    EXPECT_NEAR(record.min_distance, 0.1, 1e-12);
    EXPECT_EQ(record.obstacle_count, 3u);
}

TEST_F(BarrierVerifierTest, ObstaclesAreNotRetained) {
    verifier_.evaluate(origin_, Vec3(1.0, 0.0, 0.0), {Vec3(0.4, 0.0, 0.0)});
    ASSERT_FALSE(verifier_.isCertifiedSafe());

    verifier_.evaluate(origin_, Vec3(1.0, 0.0, 0.0), {});
    EXPECT_TRUE(verifier_.isCertifiedSafe());
    EXPECT_DOUBLE_EQ(verifier_.getBarrierValue(), 1.0);
}

TEST_F(BarrierVerifierTest, GradientMatchesFormula) {
    const Vec3 gradient = verifier_.barrierGradient(Vec3(1.0, 2.0, 0.0), Vec3(0.5, 1.0, 0.0));
    EXPECT_NEAR(gradient.x, -2.0 * 0.5 / 0.25, 1e-12);
    EXPECT_NEAR(gradient.y, -2.0 * 1.0 / 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(gradient.z, 0.0);
}

TEST_F(BarrierVerifierTest, NonFiniteValuesAreNeverCertified) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(verifier_.satisfiesCondition(nan, -1.0));
    EXPECT_FALSE(verifier_.satisfiesCondition(0.5, nan));
    EXPECT_FALSE(verifier_.evaluate(Vec3(nan, 0.0, 0.0), Vec3(), {Vec3()}).certified);
}

TEST_F(BarrierVerifierTest, AlphaIsClamped) {
    EXPECT_DOUBLE_EQ(verifier_.alpha(), 5.0);

    verifier_.updateSafetyAlpha(100.0);
    EXPECT_DOUBLE_EQ(verifier_.alpha(), 10.0);

    verifier_.updateSafetyAlpha(0.1);
    EXPECT_DOUBLE_EQ(verifier_.alpha(), 5.0);

    verifier_.updateSafetyAlpha(7.5);
    EXPECT_DOUBLE_EQ(verifier_.alpha(), 7.5);

    verifier_.updateSafetyAlpha(std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(verifier_.alpha(), 7.5);
}

TEST_F(BarrierVerifierTest, LargerAlphaIsStricter) {
    const double h = 0.36;
    const double dh = -2.0;

    verifier_.updateSafetyAlpha(5.0);
    EXPECT_TRUE(verifier_.satisfiesCondition(h, dh));

    verifier_.updateSafetyAlpha(10.0);
    EXPECT_FALSE(verifier_.satisfiesCondition(h, dh));
}

TEST(BarrierVerifierConfigTest, ConstructorClampsAlpha) {
    BarrierConfig config;
    config.alpha = 42.0;
    BarrierVerifier verifier(config);
    EXPECT_DOUBLE_EQ(verifier.alpha(), config.max_alpha);
}

TEST(BarrierVerifierConfigTest, InvalidConfigurationThrows) {
    BarrierConfig zero_margin;
    zero_margin.safety_margin = 0.0;
    EXPECT_THROW(BarrierVerifier{zero_margin}, std::invalid_argument);

    BarrierConfig inverted;
    inverted.min_alpha = 10.0;
    inverted.max_alpha = 5.0;
    EXPECT_THROW(BarrierVerifier{inverted}, std::invalid_argument);

    BarrierConfig nan_alpha;
    nan_alpha.alpha = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(BarrierVerifier{nan_alpha}, std::invalid_argument);
}
