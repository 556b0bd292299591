#include "safety_certification_core.hpp"

#include <cmath>
#include <memory>

namespace navl
{

namespace
{
const SafetyCoreConfig& validated(const SafetyCoreConfig& config) {
    config.validate();
    return config;
}
}  // namespace

SafetyCertificationCore::SafetyCertificationCore(const SafetyCoreConfig& config,
                                                 CertificateSink* sink,
                                                 rclcpp::Clock::SharedPtr clock,
                                                 rclcpp::Logger logger)
    : config_(validated(config)),
      logger_(logger),
      throttle_clock_(std::make_shared<rclcpp::Clock>(RCL_ROS_TIME)),
      estimator_(config_.estimator, logger.get_child("estimator")),
      verifier_(config_.barrier, logger.get_child("barrier")),
      lockdown_(logger.get_child("lockdown")),
      scorer_(config_.scorer, &verifier_, &estimator_, &lockdown_, logger.get_child("rigor")),
      compiler_(config_.compiler, sink, std::move(clock), logger.get_child("compiler")),
      since_last_compile_(0.0),
      compiled_once_(false),
      tick_count_(0) {

    RCLCPP_INFO(logger_, "Safety certification core ready (compilation %.1f Hz)",
                config_.compilation_rate_hz);
}

CycleOutput SafetyCertificationCore::tick(const CycleInput& input) {
    ++tick_count_;
    CycleOutput output;

    // 1. State estimation (a rejected update keeps the previous estimate)
    estimator_.update(input.robot_position, input.robot_velocity, input.dt);
    output.state = estimator_.getStateEstimate();
    output.estimator_fault = estimator_.isFaultDetected();

    // 2. Barrier verification on the estimated state
    std::vector<Vec3> obstacles;
    obstacles.reserve(input.obstacles.size());
    for (const auto& obstacle : input.obstacles) {
        if (obstacle.isFinite()) {
            obstacles.push_back(obstacle);
        }
    }
    output.rejected_obstacles = input.obstacles.size() - obstacles.size();
    if (output.rejected_obstacles > 0) {
        RCLCPP_WARN_THROTTLE(logger_, *throttle_clock_, 2000,
            "Dropped %lu non-finite obstacle position(s)",
            static_cast<unsigned long>(output.rejected_obstacles));
    }

    const BarrierRecord barrier = verifier_.evaluate(
        output.state.position, output.state.velocity, obstacles);
    output.barrier_certified = barrier.certified;
    output.barrier_value = barrier.value;
    output.barrier_derivative = barrier.derivative;

    // 3. Cognitive rigor
    ScoreInput score_input;
    score_input.position = output.state.position;
    score_input.goal = input.goal;
    score_input.model_intent = input.model_intent;
    score_input.fatigue_trigger = input.fatigue_trigger;
    score_input.obstacles = obstacles;
    score_input.delta_t = input.dt;
    output.sub_scores = scorer_.evaluate(score_input);
    output.p_score = output.sub_scores.total;

    // 4. Statistical certification
    if (compilationDue(input.dt)) {
        CompilationInput compile_input;
        compile_input.p_score = output.sub_scores.total;
        compile_input.h_safety = output.sub_scores.h_safety;
        compile_input.goal_proximity = output.sub_scores.goal_proximity;
        compile_input.model_intent = output.sub_scores.model_intent;
        compile_input.consciousness = output.sub_scores.consciousness;
        compile_input.safety_threshold = scorer_.safetyThreshold();
        compile_input.margin = barrier.obstacle_count > 0 ?
            barrier.min_distance - verifier_.safetyMargin() :
            config_.compiler.near_miss_range;
        compile_input.barrier_certified = barrier.certified;

        output.certificate = compiler_.compileCertificate(compile_input);
        output.certificate_issued = true;
    }

    if (compiler_.lastCertificate()) {
        output.sim2val_estimate = compiler_.lastCertificate()->p_estimate;
        output.sigma = compiler_.lastCertificate()->sigma;
    } else {
        output.sim2val_estimate = compiler_.getStats().historical_mean;
    }

    output.certified = barrier.certified && output.p_score >= scorer_.safetyThreshold();
    output.lockdown_active = lockdown_.isLocked();
    output.zero_velocity_requested = scorer_.isZeroVelocityRequested();

    return output;
}

bool SafetyCertificationCore::compilationDue(double dt) {
    if (std::isfinite(dt) && dt > 0.0) {
        since_last_compile_ += dt;
    }

    const double interval = config_.compilation_rate_hz > 0.0 ?
        1.0 / config_.compilation_rate_hz : 0.0;

    if (compiled_once_ && since_last_compile_ < interval) {
        return false;
    }

    compiled_once_ = true;
    since_last_compile_ = 0.0;
    return true;
}

bool SafetyCertificationCore::resetFailure() {
    return scorer_.resetFailure();
}

}  // namespace navl
