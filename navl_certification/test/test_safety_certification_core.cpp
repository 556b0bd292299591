#include <gtest/gtest.h>
#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <filesystem>
#include <limits>
#include <memory>
#include <stdexcept>

#include "certificate_log.hpp"
#include "safety_certification_core.hpp"

using namespace navl;

class SafetyCertificationCoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<rclcpp::Clock>(RCL_SYSTEM_TIME);
        config_.compilation_rate_hz = 0.0;   // Compile every tick unless a test says otherwise
    }

    std::unique_ptr<SafetyCertificationCore> makeCore(CertificateSink* sink = nullptr) {
        return std::make_unique<SafetyCertificationCore>(config_, sink, clock_);
    }

    static CycleInput stationary(double dt = 0.1) {
        CycleInput input;
        input.dt = dt;
        return input;
    }

    SafetyCoreConfig config_;
    rclcpp::Clock::SharedPtr clock_;
};

TEST_F(SafetyCertificationCoreTest, ClearPathIsCertified) {
    auto core = makeCore();

    const CycleOutput output = core->tick(stationary());

    EXPECT_TRUE(output.certified);
    EXPECT_TRUE(output.barrier_certified);
    EXPECT_DOUBLE_EQ(output.barrier_value, 1.0);
    EXPECT_NEAR(output.sub_scores.h_safety, 100.0, 1e-12);
    EXPECT_GE(output.p_score, 100.0);
    EXPECT_FALSE(output.lockdown_active);
    EXPECT_FALSE(output.zero_velocity_requested);

    ASSERT_TRUE(output.certificate_issued);
    ASSERT_TRUE(output.certificate.has_value());
    EXPECT_TRUE(output.certificate->verified);
    EXPECT_EQ(output.certificate->status, "VERIFIED_SAFE");
    // No obstacles: full margin, no near miss
    EXPECT_DOUBLE_EQ(output.certificate->sim2val_y, 0.0);
    EXPECT_DOUBLE_EQ(output.sim2val_estimate, output.certificate->p_estimate);
}

TEST_F(SafetyCertificationCoreTest, ApproachingObstacleFailsBarrier) {
    auto core = makeCore();

    CycleInput input = stationary();
    input.robot_velocity = Vec3(1.0, 0.0, 0.0);
    input.obstacles = {Vec3(0.4, 0.0, 0.0)};

    const CycleOutput output = core->tick(input);

    EXPECT_FALSE(output.barrier_certified);
    EXPECT_FALSE(output.certified);
    EXPECT_NEAR(output.barrier_value, 0.36, 1e-9);
    EXPECT_NEAR(output.barrier_derivative, 3.2, 1e-9);
    EXPECT_NEAR(output.sub_scores.h_safety, 68.0, 1e-9);

    // Inside the margin: maximal near-miss indicator
    ASSERT_TRUE(output.certificate.has_value());
    EXPECT_NEAR(output.certificate->margin, -0.1, 1e-9);
    EXPECT_DOUBLE_EQ(output.certificate->sim2val_y, 1.0);
}

TEST_F(SafetyCertificationCoreTest, NonFiniteObstaclesAreDropped) {
    auto core = makeCore();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CycleInput input = stationary();
    input.obstacles = {Vec3(nan, 0.0, 0.0)};
    CycleOutput output = core->tick(input);

    EXPECT_EQ(output.rejected_obstacles, 1u);
    EXPECT_TRUE(output.barrier_certified);
    EXPECT_DOUBLE_EQ(output.barrier_value, 1.0);
    EXPECT_EQ(core->verifier().lastRecord().obstacle_count, 0u);

    // A finite obstacle alongside a corrupt one still binds
    input.robot_velocity = Vec3(1.0, 0.0, 0.0);
    input.obstacles = {Vec3(0.0, std::numeric_limits<double>::infinity(), 0.0), Vec3(0.4, 0.0, 0.0)};
    output = core->tick(input);

    EXPECT_EQ(output.rejected_obstacles, 1u);
    EXPECT_NEAR(output.barrier_value, 0.36, 1e-6);
    EXPECT_FALSE(output.barrier_certified);
}

TEST_F(SafetyCertificationCoreTest, CompilationIsRateGated) {
    config_.compilation_rate_hz = 2.0;
    auto core = makeCore();

    for (int i = 1; i <= 6; ++i) {
        const CycleOutput output = core->tick(stationary(0.25));
        EXPECT_EQ(output.certificate_issued, i % 2 == 1) << "tick " << i;
    }
    EXPECT_EQ(core->compiler().certificateCount(), 3u);
    EXPECT_EQ(core->tickCount(), 6u);
}

TEST_F(SafetyCertificationCoreTest, LowScoreEngagesLockdownUntilReset) {
    auto core = makeCore();

    CycleInput blocked = stationary();
    blocked.obstacles = {Vec3(2.0, 0.0, 0.0)};

    CycleOutput output = core->tick(blocked);
    EXPECT_LT(output.p_score, 50.0);
    EXPECT_TRUE(output.lockdown_active);
    EXPECT_TRUE(output.zero_velocity_requested);
    ASSERT_TRUE(output.certificate.has_value());
    EXPECT_FALSE(output.certificate->verified);
    EXPECT_EQ(output.certificate->status, "VNC_VIOLATION");

    EXPECT_FALSE(core->resetFailure());

    // Recovered score alone does not release the latch
    output = core->tick(stationary());
    EXPECT_GE(output.p_score, 50.0);
    EXPECT_TRUE(output.lockdown_active);

    EXPECT_TRUE(core->resetFailure());
    output = core->tick(stationary());
    EXPECT_FALSE(output.lockdown_active);
    EXPECT_FALSE(output.zero_velocity_requested);
    EXPECT_EQ(core->lockdown().activationCount(), 1u);
}

TEST_F(SafetyCertificationCoreTest, FatigueShowsInCertificateStatus) {
    auto core = makeCore();
    core->scorer().setConsciousness(0.1);

    CycleInput blocked = stationary();
    blocked.obstacles = {Vec3(2.0, 0.0, 0.0)};
    blocked.fatigue_trigger = true;

    const CycleOutput output = core->tick(blocked);
    ASSERT_TRUE(output.certificate.has_value());
    EXPECT_EQ(output.certificate->status, "FATIGUE");
}

TEST_F(SafetyCertificationCoreTest, CertificatesReachTheLog) {
    const auto unique_suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    const auto temp_dir = std::filesystem::temp_directory_path() / ("navl_core_test_" + unique_suffix);
    const std::string log_path = (temp_dir / "certificates.csv").string();

    {
        CertificateLog log(log_path);
        auto core = makeCore(&log);
        for (int i = 0; i < 4; ++i) {
            core->tick(stationary());
        }
        EXPECT_EQ(log.recordCount(), 5u);
        EXPECT_EQ(core->compiler().persistenceFailures(), 0u);
    }

    const auto entries = CertificateLog::readAll(log_path);
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries.front().certificate.log_type, "SYSTEM_INIT");
    EXPECT_TRUE(CertificateLog::verifyChain(entries));

    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
}

TEST_F(SafetyCertificationCoreTest, InvalidConstructionThrows) {
    config_.barrier.safety_margin = -1.0;
    EXPECT_THROW(makeCore(), std::invalid_argument);

    config_.barrier.safety_margin = 0.5;
    EXPECT_THROW(SafetyCertificationCore(config_, nullptr, nullptr), std::invalid_argument);
}
