#ifndef NAVL_SAFETY_CERTIFICATION_CORE_HPP
#define NAVL_SAFETY_CERTIFICATION_CORE_HPP

#include <optional>
#include <vector>
#include <rclcpp/rclcpp.hpp>

#include "barrier_verifier.hpp"
#include "certification_compiler.hpp"
#include "cognitive_rigor_scorer.hpp"
#include "lockdown_latch.hpp"
#include "safety_core_config.hpp"
#include "state_estimator.hpp"

namespace navl
{

/**
 * @brief Everything the core needs for one control tick
 */
struct CycleInput {
    Vec3 robot_position;              // Absolute fix [m]
    Vec3 robot_velocity;              // Inertial velocity [m/s]
    std::vector<Vec3> obstacles;      // Snapshot for this tick [m]
    std::optional<Vec3> goal;
    std::optional<double> model_intent;
    bool fatigue_trigger{false};
    double dt{0.0};                   // [seconds]
};

/**
 * @brief Result of one control tick
 */
struct CycleOutput {
    bool certified{false};            // barrier certified AND P >= threshold
    bool barrier_certified{false};
    double barrier_value{0.0};
    double barrier_derivative{0.0};
    double p_score{0.0};
    PScoreRecord sub_scores;
    double sim2val_estimate{0.0};
    double sigma{0.0};
    bool estimator_fault{false};
    std::size_t rejected_obstacles{0};  // non-finite positions dropped this tick
    bool lockdown_active{false};
    bool zero_velocity_requested{false};
    bool certificate_issued{false};
    std::optional<Certificate> certificate;
    StateEstimate state;
};

/**
 * @brief Synchronous tick orchestrator
 *
 * Runs Estimator -> Barrier Verifier -> Cognitive Scorer -> Certification
 * Compiler in dependency order. Compilation is rate-gated by accumulated
 * dt. The certificate sink is non-owning and may be null.
 *
 * Thread Safety: Not thread-safe (one tick at a time)
 */
class SafetyCertificationCore {
public:
    /**
     * @brief Constructor
     * @param config Validated configuration
     * @param sink Certificate sink (nullable)
     * @param clock Clock for certificate timestamps
     * @param logger ROS2 logger for output
     * @throws std::invalid_argument if config is malformed or clock is null
     */
    SafetyCertificationCore(const SafetyCoreConfig& config,
                            CertificateSink* sink,
                            rclcpp::Clock::SharedPtr clock,
                            rclcpp::Logger logger = rclcpp::get_logger("safety_certification_core"));

    CycleOutput tick(const CycleInput& input);

    /**
     * @brief Attempt to clear a latched P-score failure
     * @return false if P is still below threshold
     */
    bool resetFailure();

    const AdaptiveStateEstimator& estimator() const { return estimator_; }
    BarrierVerifier& verifier() { return verifier_; }
    const BarrierVerifier& verifier() const { return verifier_; }
    CognitiveRigorScorer& scorer() { return scorer_; }
    const CognitiveRigorScorer& scorer() const { return scorer_; }
    const CertificationCompiler& compiler() const { return compiler_; }
    LockdownLatch& lockdown() { return lockdown_; }
    const LockdownLatch& lockdown() const { return lockdown_; }
    const SafetyCoreConfig& config() const { return config_; }
    uint64_t tickCount() const { return tick_count_; }

private:
    bool compilationDue(double dt);

    SafetyCoreConfig config_;
    rclcpp::Logger logger_;
    rclcpp::Clock::SharedPtr throttle_clock_;

    // Declaration order is construction order: collaborators before users
    AdaptiveStateEstimator estimator_;
    BarrierVerifier verifier_;
    LockdownLatch lockdown_;
    CognitiveRigorScorer scorer_;
    CertificationCompiler compiler_;

    double since_last_compile_;
    bool compiled_once_;
    uint64_t tick_count_;
};

}  // namespace navl

#endif // NAVL_SAFETY_CERTIFICATION_CORE_HPP
