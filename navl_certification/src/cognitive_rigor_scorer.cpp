#include "cognitive_rigor_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace navl
{

namespace
{
double clamp01(double value)
{
    return std::clamp(value, 0.0, 1.0);
}
}  // namespace

CognitiveRigorScorer::CognitiveRigorScorer(const ScorerConfig& config,
                                           const BarrierVerifier* verifier,
                                           const StateEstimateSource* estimator,
                                           LockdownSink* lockdown,
                                           rclcpp::Logger logger)
    : config_(config),
      verifier_(verifier),
      estimator_(estimator),
      lockdown_(lockdown),
      consciousness_(1.0),   // Start fully awake
      failure_(false),
      logger_(logger),
      clock_(std::make_shared<rclcpp::Clock>(RCL_ROS_TIME)) {

    if (!std::isfinite(config_.max_goal_distance) || config_.max_goal_distance <= 0.0) {
        throw std::invalid_argument("max_goal_distance must be > 0");
    }
    if (!std::isfinite(config_.fatigue_decay_rate) || config_.fatigue_decay_rate < 0.0 ||
        !std::isfinite(config_.recovery_rate) || config_.recovery_rate < 0.0) {
        throw std::invalid_argument("Fatigue decay and recovery rates must be >= 0");
    }
    if (!std::isfinite(config_.safety_threshold)) {
        throw std::invalid_argument("safety_threshold must be finite");
    }

    last_.model_intent = DEFAULT_MODEL_INTENT;
    last_.consciousness = consciousness_;

    RCLCPP_INFO(logger_, "Initialized - P = h_safety + g + i + c (threshold=%.1f, verifier=%s)",
                config_.safety_threshold, verifier_ ? "wired" : "distance proxy");
}

PScoreRecord CognitiveRigorScorer::evaluate(const ScoreInput& input) {
    PScoreRecord record;
    record.goal_proximity = computeGoalProximity(input);
    record.model_intent = computeModelIntent(input);

    if (config_.enable_fatigue_simulation) {
        updateConsciousness(input.fatigue_trigger, input.delta_t);
    }
    record.consciousness = consciousness_;
    record.h_safety = computeSafety(input);

    record.total = record.h_safety + record.goal_proximity +
                   record.model_intent + record.consciousness;

    if (record.total < config_.safety_threshold) {
        latchFailure(record.total);
    }
    record.failure_latched = failure_;

    last_ = record;
    return record;
}

double CognitiveRigorScorer::computeSafety(const ScoreInput& input) const {
    if (verifier_ != nullptr) {
        const double h = verifier_->getBarrierValue();
        if (!std::isfinite(h)) {
            return 0.0;
        }
        return std::clamp(h * 50.0 + 50.0, 0.0, 100.0);
    }

    // Distance proxy
    double min_dist = std::numeric_limits<double>::max();
    for (const auto& obstacle : input.obstacles) {
        min_dist = std::min(min_dist, distance(input.position, obstacle));
    }
    if (input.obstacles.empty()) {
        min_dist = NO_OBSTACLE_DISTANCE;
    }
    return std::clamp(FALLBACK_SAFETY_RANGE - min_dist, 0.0, 100.0);
}

double CognitiveRigorScorer::computeGoalProximity(const ScoreInput& input) const {
    if (!input.goal || !input.goal->isFinite()) {
        return DEFAULT_GOAL_PROXIMITY;
    }
    const double dist = distance(input.position, *input.goal);
    return 1.0 - clamp01(dist / config_.max_goal_distance);  // Closer = higher
}

double CognitiveRigorScorer::computeModelIntent(const ScoreInput& input) const {
    if (!input.model_intent || !std::isfinite(*input.model_intent)) {
        return DEFAULT_MODEL_INTENT;
    }
    return clamp01(*input.model_intent);
}

void CognitiveRigorScorer::updateConsciousness(bool fatigue_trigger, double delta_t) {
    if (!std::isfinite(delta_t) || delta_t <= 0.0) {
        return;
    }

    if (fatigue_trigger) {
        consciousness_ -= delta_t * config_.fatigue_decay_rate;
    } else {
        consciousness_ = std::min(1.0, consciousness_ + delta_t * config_.recovery_rate);
    }

    // Sensor failure wears the operator down faster
    if (estimator_ != nullptr && estimator_->isFaultDetected()) {
        consciousness_ -= delta_t * config_.fatigue_decay_rate * FAULT_DECAY_GAIN;
    }

    consciousness_ = clamp01(consciousness_);
}

void CognitiveRigorScorer::latchFailure(double p_score) {
    if (failure_) {
        return;  // Already latched
    }
    failure_ = true;

    RCLCPP_ERROR(logger_, "CONSCIOUSNESS FAILURE: P=%.2f < %.2f - zero velocity requested",
                 p_score, config_.safety_threshold);

    if (lockdown_ != nullptr) {
        std::ostringstream reason;
        reason << "P-score " << p_score << " below threshold " << config_.safety_threshold;
        lockdown_->assertLockdown(reason.str());
    }
}

void CognitiveRigorScorer::setConsciousness(double value) {
    if (!std::isfinite(value)) {
        RCLCPP_WARN(logger_, "Ignoring non-finite consciousness value");
        return;
    }
    consciousness_ = clamp01(value);
}

bool CognitiveRigorScorer::resetFailure() {
    if (!failure_) {
        return true;
    }

    if (last_.total < config_.safety_threshold) {
        RCLCPP_WARN_THROTTLE(logger_, *clock_, 1000,
            "Reset refused: P=%.2f still below threshold %.2f",
            last_.total, config_.safety_threshold);
        return false;
    }

    failure_ = false;
    last_.failure_latched = false;
    if (lockdown_ != nullptr) {
        lockdown_->releaseLockdown();
    }
    RCLCPP_INFO(logger_, "Consciousness failure cleared (P=%.2f)", last_.total);
    return true;
}

}  // namespace navl
