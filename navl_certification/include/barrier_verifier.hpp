#ifndef NAVL_BARRIER_VERIFIER_HPP
#define NAVL_BARRIER_VERIFIER_HPP

#include <cstddef>
#include <vector>
#include <rclcpp/rclcpp.hpp>

#include "linear_algebra.hpp"

namespace navl
{

/**
 * @brief Result of one barrier evaluation (immutable once produced)
 */
struct BarrierRecord {
    double value{1.0};          // h(x) of the binding obstacle
    double derivative{0.0};     // dh/dt of the binding obstacle
    bool certified{true};
    double min_distance{0.0};   // Distance to the closest obstacle [m]
    std::size_t obstacle_count{0};
};

/**
 * @brief Barrier tuning
 */
struct BarrierConfig {
    double alpha{5.0};          // Class-K strictness
    double min_alpha{5.0};
    double max_alpha{10.0};
    double safety_margin{0.5};  // Radius of the barrier ball [m]
};

/**
 * @brief Control Barrier Function verifier
 *
 * Per obstacle o:
 *   h(x)  = 1 - |p - o|^2 / margin^2
 *   dh/dx = -2 (p - o) / margin^2
 *   dh/dt = dh/dx . v
 *
 * The binding constraint is the obstacle with minimum h. The state is
 * certified iff dh/dt <= -alpha * h and h >= 0. An empty obstacle set is
 * certified.
 *
 * The verifier only reports; actuation is the responsibility of its
 * consumers. Obstacles are not retained between evaluations.
 */
class BarrierVerifier {
public:
    /**
     * @brief Constructor
     * @param config Barrier tuning; alpha is clamped to [min_alpha, max_alpha]
     * @param logger ROS2 logger for output
     * @throws std::invalid_argument if safety_margin <= 0 or the alpha range
     *         is malformed
     */
    explicit BarrierVerifier(const BarrierConfig& config = BarrierConfig(),
                             rclcpp::Logger logger = rclcpp::get_logger("barrier_verifier"));

    /**
     * @brief Evaluate the barrier against the current obstacle set
     * @param position Robot position [m]
     * @param velocity Robot velocity [m/s]
     * @param obstacles Obstacle positions for this cycle [m]
     * @return Fresh barrier record (also stored as lastRecord())
     */
    BarrierRecord evaluate(const Vec3& position, const Vec3& velocity,
                           const std::vector<Vec3>& obstacles);

    /**
     * @brief Barrier value for a single obstacle
     */
    double barrierFunction(const Vec3& position, const Vec3& obstacle) const;

    /**
     * @brief Gradient dh/dx for a single obstacle
     */
    Vec3 barrierGradient(const Vec3& position, const Vec3& obstacle) const;

    /**
     * @brief CBF condition for a given (h, dh/dt) pair at the current alpha
     */
    bool satisfiesCondition(double value, double derivative) const;

    bool isCertifiedSafe() const { return last_.certified; }
    double getBarrierValue() const { return last_.value; }
    double getBarrierDerivative() const { return last_.derivative; }
    double minObstacleDistance() const { return last_.min_distance; }
    const BarrierRecord& lastRecord() const { return last_; }

    /**
     * @brief Update strictness (for adaptive safety)
     * @param new_alpha Requested alpha; clamped to [min_alpha, max_alpha]
     */
    void updateSafetyAlpha(double new_alpha);

    double alpha() const { return alpha_; }
    double safetyMargin() const { return config_.safety_margin; }

private:
    BarrierConfig config_;
    double alpha_;
    double margin_sq_;
    BarrierRecord last_;
    rclcpp::Logger logger_;
};

}  // namespace navl

#endif // NAVL_BARRIER_VERIFIER_HPP
