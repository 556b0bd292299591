#include "barrier_verifier.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace navl
{

BarrierVerifier::BarrierVerifier(const BarrierConfig& config, rclcpp::Logger logger)
    : config_(config),
      alpha_(0.0),
      margin_sq_(0.0),
      logger_(logger) {

    if (!std::isfinite(config_.safety_margin) || config_.safety_margin <= 0.0) {
        throw std::invalid_argument("Barrier safety_margin must be > 0");
    }
    if (!std::isfinite(config_.min_alpha) || !std::isfinite(config_.max_alpha) ||
        config_.min_alpha < 0.0 || config_.min_alpha > config_.max_alpha) {
        throw std::invalid_argument("Barrier alpha range must satisfy 0 <= min_alpha <= max_alpha");
    }
    if (!std::isfinite(config_.alpha)) {
        throw std::invalid_argument("Barrier alpha must be finite");
    }

    margin_sq_ = config_.safety_margin * config_.safety_margin;
    alpha_ = std::clamp(config_.alpha, config_.min_alpha, config_.max_alpha);

    RCLCPP_INFO(logger_, "Initialized - CBF verification (alpha=%.2f in [%.2f, %.2f], margin=%.3fm)",
                alpha_, config_.min_alpha, config_.max_alpha, config_.safety_margin);
}

BarrierRecord BarrierVerifier::evaluate(const Vec3& position, const Vec3& velocity,
                                        const std::vector<Vec3>& obstacles) {
    BarrierRecord record;
    record.obstacle_count = obstacles.size();

    if (obstacles.empty()) {
        // Vacuously safe: nothing to violate
        record.value = 1.0;
        record.derivative = 0.0;
        record.certified = true;
        record.min_distance = std::numeric_limits<double>::infinity();
        last_ = record;
        return record;
    }

    double binding_h = std::numeric_limits<double>::max();
    double binding_dh = 0.0;
    double min_distance = std::numeric_limits<double>::infinity();

    for (const auto& obstacle : obstacles) {
        const double h = barrierFunction(position, obstacle);
        const double dh = barrierGradient(position, obstacle).dot(velocity);

        if (h < binding_h) {
            binding_h = h;
            binding_dh = dh;
        }
        min_distance = std::min(min_distance, distance(position, obstacle));
    }

    record.value = binding_h;
    record.derivative = binding_dh;
    record.min_distance = min_distance;
    record.certified = satisfiesCondition(binding_h, binding_dh);

    if (!record.certified && last_.certified) {
        RCLCPP_WARN(logger_, "CBF VIOLATION: dh/dt=%.3f > -%.2f*h (h=%.3f)",
                    binding_dh, alpha_, binding_h);
    }

    last_ = record;
    return record;
}

double BarrierVerifier::barrierFunction(const Vec3& position, const Vec3& obstacle) const {
    const double dist_sq = (position - obstacle).normSquared();
    return 1.0 - (dist_sq / margin_sq_);
}

Vec3 BarrierVerifier::barrierGradient(const Vec3& position, const Vec3& obstacle) const {
    const double factor = -2.0 / margin_sq_;
    return (position - obstacle) * factor;
}

bool BarrierVerifier::satisfiesCondition(double value, double derivative) const {
    if (!std::isfinite(value) || !std::isfinite(derivative)) {
        return false;
    }
    return value >= 0.0 && derivative <= -alpha_ * value;
}

void BarrierVerifier::updateSafetyAlpha(double new_alpha) {
    if (!std::isfinite(new_alpha)) {
        RCLCPP_WARN(logger_, "Ignoring non-finite alpha update");
        return;
    }
    alpha_ = std::clamp(new_alpha, config_.min_alpha, config_.max_alpha);
    RCLCPP_INFO(logger_, "Safety alpha updated to %.2f", alpha_);
}

}  // namespace navl
