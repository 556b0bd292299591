#ifndef NAVL_COGNITIVE_RIGOR_SCORER_HPP
#define NAVL_COGNITIVE_RIGOR_SCORER_HPP

#include <optional>
#include <vector>
#include <rclcpp/rclcpp.hpp>

#include "barrier_verifier.hpp"
#include "linear_algebra.hpp"
#include "lockdown_latch.hpp"
#include "state_estimator.hpp"

namespace navl
{

/**
 * @brief Sub-scores and total of one P-score evaluation
 *
 * total == h_safety + goal_proximity + model_intent + consciousness
 */
struct PScoreRecord {
    double h_safety{0.0};        // [0, 100]
    double goal_proximity{0.0};  // [0, 1]
    double model_intent{0.0};    // [0, 1]
    double consciousness{0.0};   // [0, 1]
    double total{0.0};
    bool failure_latched{false};
};

/**
 * @brief Inputs pulled by the scorer for one cycle
 *
 * Missing goal or intent take neutral defaults rather than zero.
 */
struct ScoreInput {
    Vec3 position;
    std::optional<Vec3> goal;
    std::optional<double> model_intent;
    bool fatigue_trigger{false};
    std::vector<Vec3> obstacles;   // Only used when no verifier is wired
    double delta_t{0.0};           // [seconds]
};

struct ScorerConfig {
    double safety_threshold{50.0};
    double max_goal_distance{10.0};     // [m]
    double fatigue_decay_rate{0.1};     // [1/s]
    double recovery_rate{0.05};         // [1/s]
    bool enable_fatigue_simulation{true};
};

/**
 * @brief Cognitive rigor scorer
 *
 *   P = h_safety + g + i + c
 *
 * h_safety comes from the barrier value (h * 50 + 50, clamped to [0, 100]);
 * without a verifier it falls back to clamp(20 - min obstacle distance).
 * g is goal proximity, i model intent, c the consciousness level which
 * decays under fatigue and estimator faults and recovers otherwise.
 *
 * State machine:
 *   SAFE --(P < threshold)--> FAILURE (latched, lockdown asserted once)
 *   FAILURE --(P >= threshold && resetFailure())--> SAFE
 *
 * Collaborators are non-owning and may be null.
 */
class CognitiveRigorScorer {
public:
    /**
     * @brief Constructor
     * @param config Scoring parameters
     * @param verifier Barrier verifier providing h (nullable)
     * @param estimator Estimator providing the fault flag (nullable)
     * @param lockdown Lockdown side-channel (nullable)
     * @param logger ROS2 logger for output
     * @throws std::invalid_argument on non-positive goal distance or
     *         negative rates
     */
    CognitiveRigorScorer(const ScorerConfig& config,
                         const BarrierVerifier* verifier,
                         const StateEstimateSource* estimator,
                         LockdownSink* lockdown,
                         rclcpp::Logger logger = rclcpp::get_logger("cognitive_rigor"));

    /**
     * @brief Compute all sub-scores and update the failure latch
     * @param input Cycle inputs
     * @return Record of the sub-scores and the total
     */
    PScoreRecord evaluate(const ScoreInput& input);

    double getPScore() const { return last_.total; }
    double getTotalScore() const { return last_.total; }
    double getSafetyComponent() const { return last_.h_safety; }
    double getGoalProximity() const { return last_.goal_proximity; }
    double getModelIntent() const { return last_.model_intent; }
    double getConsciousness() const { return consciousness_; }
    bool isConsciousnessFailure() const { return failure_; }
    const PScoreRecord& lastRecord() const { return last_; }

    /**
     * @brief Zero velocity is demanded while the failure is latched
     */
    bool isZeroVelocityRequested() const { return failure_; }

    /**
     * @brief Override consciousness (clamped to [0, 1])
     */
    void setConsciousness(double value);

    /**
     * @brief Clear a latched failure
     * @return true if not latched or cleared; false if P is still below
     *         threshold (latch kept)
     */
    bool resetFailure();

    double safetyThreshold() const { return config_.safety_threshold; }

    static constexpr double DEFAULT_GOAL_PROXIMITY = 0.5;
    static constexpr double DEFAULT_MODEL_INTENT = 0.8;

private:
    double computeSafety(const ScoreInput& input) const;
    double computeGoalProximity(const ScoreInput& input) const;
    double computeModelIntent(const ScoreInput& input) const;
    void updateConsciousness(bool fatigue_trigger, double delta_t);
    void latchFailure(double p_score);

    ScorerConfig config_;
    const BarrierVerifier* verifier_;
    const StateEstimateSource* estimator_;
    LockdownSink* lockdown_;

    double consciousness_;
    bool failure_;
    PScoreRecord last_;

    rclcpp::Logger logger_;
    std::shared_ptr<rclcpp::Clock> clock_;

    static constexpr double FALLBACK_SAFETY_RANGE = 20.0;   // [m]
    static constexpr double NO_OBSTACLE_DISTANCE = 10.0;    // [m]
    static constexpr double FAULT_DECAY_GAIN = 2.0;
};

}  // namespace navl

#endif // NAVL_COGNITIVE_RIGOR_SCORER_HPP
