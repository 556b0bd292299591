#include "state_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace navl
{

namespace
{
bool isValidNoise(const Vec3& v)
{
    return v.isFinite() && v.x >= 0.0 && v.y >= 0.0 && v.z >= 0.0;
}

Vec3 clampComponents(const Vec3& v, double lo, double hi)
{
    return {std::clamp(v.x, lo, hi), std::clamp(v.y, lo, hi), std::clamp(v.z, lo, hi)};
}
}  // namespace

AdaptiveStateEstimator::AdaptiveStateEstimator(const EstimatorConfig& config,
                                               rclcpp::Logger logger)
    : config_(config),
      heading_(0.0),
      seeded_(false),
      raim_fault_(false),
      numerical_fault_(false),
      dead_reckoning_(false),
      last_residual_(0.0),
      fault_count_(0),
      logger_(logger),
      clock_(std::make_shared<rclcpp::Clock>(RCL_ROS_TIME)) {

    if (!isValidNoise(config_.process_noise) || !isValidNoise(config_.measurement_noise)) {
        throw std::invalid_argument("Estimator noise terms must be finite and >= 0");
    }
    if (!std::isfinite(config_.initial_covariance) || config_.initial_covariance < 0.0) {
        throw std::invalid_argument("Estimator initial covariance must be finite and >= 0");
    }
    if (!std::isfinite(config_.raim_threshold) || config_.raim_threshold <= 0.0) {
        throw std::invalid_argument("RAIM threshold must be > 0");
    }

    reset();

    RCLCPP_INFO(logger_, "Initialized - adaptive filter + RAIM (threshold=%.2fm, adaptive=%s)",
                config_.raim_threshold, config_.adaptive_noise ? "on" : "off");
}

void AdaptiveStateEstimator::reset() {
    position_ = Vec3();
    velocity_ = Vec3();
    heading_ = 0.0;
    covariance_ = Mat3::identity() * config_.initial_covariance;
    seeded_ = false;
    process_noise_ = config_.process_noise;
    measurement_noise_ = config_.measurement_noise;
    raim_fault_ = false;
    numerical_fault_ = false;
    dead_reckoning_ = false;
    last_residual_ = 0.0;
}

bool AdaptiveStateEstimator::update(const Vec3& gps_measurement, const Vec3& imu_velocity,
                                    double delta_t) {
    if (!gps_measurement.isFinite() || !imu_velocity.isFinite()) {
        RCLCPP_ERROR_THROTTLE(logger_, *clock_, 2000,
            "Non-finite measurement rejected (sensor fault?)");
        return false;
    }

    if (!seeded_) {
        position_ = gps_measurement;
        velocity_ = imu_velocity;
        updateHeading();
        seeded_ = true;
        RCLCPP_INFO(logger_, "Seeded at (%.3f, %.3f, %.3f)",
                    position_.x, position_.y, position_.z);
        return true;
    }

    if (!std::isfinite(delta_t) || delta_t <= 0.0) {
        RCLCPP_ERROR_THROTTLE(logger_, *clock_, 2000,
            "Invalid delta_t: %.6f (must be > 0)", delta_t);
        return false;
    }

    const Vec3 tuned_noise = config_.adaptive_noise ?
        tuneMeasurementNoise(gps_measurement) : measurement_noise_;

    // 1. Predict (constant velocity)
    const Vec3 x_pred = position_ + velocity_ * delta_t;
    const Mat3 p_pred = covariance_ + Mat3::diagonal(process_noise_) * delta_t;

    // 2. Update
    const Mat3 s = p_pred + Mat3::diagonal(tuned_noise);
    const auto s_inv = s.inverse();
    if (!s_inv) {
        // Keep the previous estimate rather than propagating NaN
        numerical_fault_ = true;
        ++fault_count_;
        RCLCPP_ERROR_THROTTLE(logger_, *clock_, 2000,
            "Innovation covariance singular (det=%.3e) - estimate retained", s.determinant());
        return false;
    }

    const Mat3 gain = p_pred * (*s_inv);
    const Vec3 innovation = gps_measurement - x_pred;
    const Vec3 new_position = x_pred + gain * innovation;
    Mat3 new_covariance = (Mat3::identity() - gain) * p_pred;
    new_covariance.forceSymmetric();

    if (!new_position.isFinite() || !new_covariance.isFinite()) {
        numerical_fault_ = true;
        ++fault_count_;
        RCLCPP_ERROR_THROTTLE(logger_, *clock_, 2000,
            "Non-finite state after update - estimate retained");
        return false;
    }

    position_ = new_position;
    covariance_ = new_covariance;
    measurement_noise_ = tuned_noise;
    velocity_ = imu_velocity;
    numerical_fault_ = false;
    updateHeading();

    // 3. RAIM (residual against prediction)
    checkRaim(distance(gps_measurement, x_pred));

    return true;
}

Vec3 AdaptiveStateEstimator::tuneMeasurementNoise(const Vec3& gps_measurement) const {
    const double deviation = distance(gps_measurement, position_);

    Vec3 noise = measurement_noise_;
    if (deviation > DEVIATION_HIGH) {
        noise *= NOISE_GROWTH;
    } else if (deviation < DEVIATION_LOW) {
        noise *= NOISE_DECAY;
    }
    return clampComponents(noise, MIN_NOISE, MAX_MEASUREMENT_NOISE);
}

void AdaptiveStateEstimator::checkRaim(double residual) {
    last_residual_ = residual;

    if (residual > config_.raim_threshold) {
        raim_fault_ = true;
        ++fault_count_;

        RCLCPP_WARN_THROTTLE(logger_, *clock_, 1000,
            "RAIM FAULT: residual=%.2fm (threshold: %.2fm)", residual, config_.raim_threshold);

        if (config_.enable_dead_reckoning) {
            process_noise_ = clampComponents(process_noise_ * DEAD_RECKONING_GAIN,
                                             0.0, MAX_PROCESS_NOISE);
            if (!dead_reckoning_) {
                dead_reckoning_ = true;
                RCLCPP_WARN(logger_, "Switched to dead reckoning (process noise widened)");
            }
        }
        return;
    }

    raim_fault_ = false;
    if (dead_reckoning_) {
        dead_reckoning_ = false;
        process_noise_ = config_.process_noise;
        RCLCPP_INFO(logger_, "RAIM integrity restored (residual=%.2fm) - nominal process noise",
                    residual);
    }
}

void AdaptiveStateEstimator::updateHeading() {
    const double planar_speed = std::hypot(velocity_.x, velocity_.y);
    if (planar_speed > MIN_HEADING_SPEED) {
        heading_ = std::atan2(velocity_.y, velocity_.x);
    }
}

double AdaptiveStateEstimator::getUncertainty() const {
    return std::sqrt(std::max(0.0, covariance_.trace()));
}

double AdaptiveStateEstimator::getCertainty() const {
    return 1.0 / (1.0 + getUncertainty());
}

StateEstimate AdaptiveStateEstimator::getStateEstimate() const {
    StateEstimate estimate;
    estimate.position = position_;
    estimate.velocity = velocity_;
    estimate.heading = heading_;
    estimate.certainty = getCertainty();
    return estimate;
}

}  // namespace navl
