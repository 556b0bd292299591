#ifndef NAVL_STATE_ESTIMATOR_HPP
#define NAVL_STATE_ESTIMATOR_HPP

#include <cstdint>
#include <memory>
#include <rclcpp/rclcpp.hpp>

#include "linear_algebra.hpp"

namespace navl
{

/**
 * @brief Snapshot of the estimated robot state
 */
struct StateEstimate {
    Vec3 position;          // [m]
    Vec3 velocity;          // [m/s]
    double heading{0.0};    // [rad, -pi to pi]
    double certainty{0.0};  // 1 / (1 + uncertainty), in (0, 1]
};

/**
 * @brief Read-only view of a state estimator
 *
 * Downstream safety layers depend on this interface rather than on a
 * concrete filter, so the verifier and scorer can be exercised against
 * any estimator implementation (or a fake one in unit tests).
 */
class StateEstimateSource {
public:
    virtual ~StateEstimateSource() = default;

    virtual Vec3 position() const = 0;
    virtual Vec3 velocity() const = 0;
    virtual double heading() const = 0;

    /**
     * @brief Position uncertainty
     * @return sqrt(trace(P)) [m], always >= 0
     */
    virtual double getUncertainty() const = 0;

    /**
     * @brief Certainty derived from uncertainty
     * @return 1 / (1 + uncertainty), in (0, 1]
     */
    virtual double getCertainty() const = 0;

    /**
     * @brief Integrity state of the last update
     * @return true if RAIM or numerical fault is active
     */
    virtual bool isFaultDetected() const = 0;
};

/**
 * @brief Tuning of the adaptive estimator
 */
struct EstimatorConfig {
    double initial_covariance{10.0};            // Large initial uncertainty [m^2]
    Vec3 process_noise{0.01, 0.01, 0.01};       // Q diagonal [m^2/s]
    Vec3 measurement_noise{0.1, 0.1, 0.1};      // R diagonal [m^2]
    bool adaptive_noise{true};
    double raim_threshold{2.0};                 // Residual triggering a fault [m]
    bool enable_dead_reckoning{true};
};

/**
 * @brief Adaptive Kalman-style position estimator with RAIM
 *
 * Fuses absolute position fixes (GPS-like) with IMU-derived velocity using a
 * constant-velocity model. Measurement noise adapts to measurement
 * consistency and a residual check (Receiver Autonomous Integrity
 * Monitoring) flags faulty fixes and widens process noise.
 *
 * Thread Safety: Not thread-safe (caller must synchronize)
 * Coordinate System: ROS standard (x forward, y left, z up)
 */
class AdaptiveStateEstimator : public StateEstimateSource {
public:
    /**
     * @brief Constructor
     * @param config Filter tuning
     * @param logger ROS2 logger for output
     * @throws std::invalid_argument if any noise term is negative or non-finite
     */
    explicit AdaptiveStateEstimator(
        const EstimatorConfig& config = EstimatorConfig(),
        rclcpp::Logger logger = rclcpp::get_logger("state_estimator"));

    /**
     * @brief Run one predict/update cycle
     * @param gps_measurement Absolute position fix [m]
     * @param imu_velocity Velocity derived from inertial measurement [m/s]
     * @param delta_t Time since last update [seconds]
     * @return true if the estimate was updated, false if the input was
     *         rejected or the innovation covariance was singular
     *
     * The first accepted measurement seeds the position directly.
     */
    bool update(const Vec3& gps_measurement, const Vec3& imu_velocity, double delta_t);

    Vec3 position() const override { return position_; }
    Vec3 velocity() const override { return velocity_; }
    double heading() const override { return heading_; }
    double getUncertainty() const override;
    double getCertainty() const override;
    bool isFaultDetected() const override { return raim_fault_ || numerical_fault_; }

    StateEstimate getStateEstimate() const;

    bool isRaimFaultDetected() const { return raim_fault_; }
    bool isNumericalFault() const { return numerical_fault_; }
    bool isDeadReckoning() const { return dead_reckoning_; }
    double covarianceTrace() const { return covariance_.trace(); }
    double lastResidual() const { return last_residual_; }
    uint64_t faultCount() const { return fault_count_; }
    Vec3 measurementNoiseScale() const { return measurement_noise_; }
    Vec3 processNoiseScale() const { return process_noise_; }

    /**
     * @brief Reset filter to its initial (unseeded) state
     */
    void reset();

private:
    // Adjust measurement noise from consistency of the fix with the estimate
    Vec3 tuneMeasurementNoise(const Vec3& gps_measurement) const;

    // Residual analysis; widens process noise on fault
    void checkRaim(double residual);

    void updateHeading();

    EstimatorConfig config_;

    // Current state
    Vec3 position_;
    Vec3 velocity_;
    double heading_;
    Mat3 covariance_;
    bool seeded_;

    // Adaptive noise
    Vec3 process_noise_;
    Vec3 measurement_noise_;

    // Integrity
    bool raim_fault_;
    bool numerical_fault_;
    bool dead_reckoning_;
    double last_residual_;
    uint64_t fault_count_;

    rclcpp::Logger logger_;
    std::shared_ptr<rclcpp::Clock> clock_;

    static constexpr double DEVIATION_HIGH = 1.0;     // [m] distrust the fix above this
    static constexpr double DEVIATION_LOW = 0.5;      // [m] trust the fix below this
    static constexpr double NOISE_GROWTH = 1.1;
    static constexpr double NOISE_DECAY = 0.95;
    static constexpr double MIN_NOISE = 0.01;
    static constexpr double MAX_MEASUREMENT_NOISE = 100.0;
    static constexpr double MAX_PROCESS_NOISE = 10.0;
    static constexpr double DEAD_RECKONING_GAIN = 2.0;
    static constexpr double MIN_HEADING_SPEED = 1e-3;  // [m/s]
};

}  // namespace navl

#endif // NAVL_STATE_ESTIMATOR_HPP
