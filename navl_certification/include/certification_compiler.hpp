#ifndef NAVL_CERTIFICATION_COMPILER_HPP
#define NAVL_CERTIFICATION_COMPILER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <rclcpp/rclcpp.hpp>

#include "control_variate_window.hpp"

namespace navl
{

/**
 * @brief One compiled safety certificate (immutable once issued)
 */
struct Certificate {
    uint64_t sequence{0};
    std::string timestamp;       // ISO 8601 UTC, millisecond resolution
    std::string log_type;        // SYSTEM_INIT | VNC_CERTIFICATION
    std::string equation;
    double p_score{0.0};
    double h_safety{0.0};
    double goal_proximity{0.0};
    double model_intent{0.0};
    double consciousness{0.0};
    double margin{0.0};          // Closest obstacle distance minus safety margin [m]
    double sim2val_y{0.0};       // Near-miss indicator Y in [0, 1]
    double p_estimate{0.0};      // Control-variate corrected estimate
    double sigma{0.0};
    std::string status;          // VERIFIED_SAFE | FATIGUE | LOW_CERTAINTY | VNC_VIOLATION | UNSAFE
    bool verified{false};
};

/**
 * @brief Destination for issued certificates
 */
class CertificateSink {
public:
    virtual ~CertificateSink() = default;

    /**
     * @brief Persist one certificate
     * @return false if the record could not be written
     */
    virtual bool append(const Certificate& certificate) = 0;

    /**
     * @brief Number of records already held by the sink
     */
    virtual uint64_t recordCount() const = 0;
};

/**
 * @brief Per-cycle inputs of the compiler
 */
struct CompilationInput {
    double p_score{0.0};
    double h_safety{0.0};
    double goal_proximity{0.0};
    double model_intent{0.0};
    double consciousness{0.0};
    double safety_threshold{50.0};
    double margin{0.0};              // Closest obstacle distance minus safety margin [m]
    bool barrier_certified{true};
};

struct CertificateStats {
    uint64_t total_certificates{0};
    std::size_t window_size{0};
    double historical_mean{ControlVariateWindow::DEFAULT_RESCALED_MEAN};
    double current_variance{0.0};    // Var(Y) about mean Y
    double current_sigma{0.0};
};

struct CompilerConfig {
    std::size_t window_size{100};
    double beta{0.5};                // Fixed control-variate gain
    double near_miss_range{5.0};     // Margin [m] at which Y reaches 0
};

/**
 * @brief SIM2VAL statistical certification compiler
 *
 * Per compilation:
 *   Y      = clamp01(1 - margin / near_miss_range)
 *   X_bar  = mean(50 + 50 y) over the window
 *   p_hat  = X_bar + beta * (Y - Y_bar) * 50
 *   sigma  = population std-dev of 50 + 50 y
 *   verified = P >= threshold
 *
 * beta is a fixed gain and not the variance-optimal Cov(X,Y)/Var(Y).
 * Certificates are pushed to an optional sink; a sink failure is counted
 * and logged but never invalidates the returned certificate.
 */
class CertificationCompiler {
public:
    static constexpr const char* EQUATION = "P=h+g+i+c";
    static constexpr double FATIGUE_LIMIT = 0.3;
    static constexpr double CERTAINTY_LIMIT = 0.5;

    /**
     * @brief Constructor
     * @param config Window and gain settings
     * @param sink Persistence sink (nullable, non-owning)
     * @param clock Clock used for certificate timestamps
     * @param logger ROS2 logger for output
     * @throws std::invalid_argument if clock is null, window_size is 0 or
     *         near_miss_range <= 0
     *
     * A SYSTEM_INIT record is written when the sink is empty.
     */
    CertificationCompiler(const CompilerConfig& config,
                          CertificateSink* sink,
                          rclcpp::Clock::SharedPtr clock,
                          rclcpp::Logger logger = rclcpp::get_logger("certification_compiler"));

    /**
     * @brief Compile and issue one certificate
     */
    Certificate compileCertificate(const CompilationInput& input);

    /**
     * @brief Near-miss indicator for a margin
     */
    double nearMissIndicator(double margin) const;

    CertificateStats getStats() const;

    uint64_t certificateCount() const { return certificate_count_; }
    uint64_t persistenceFailures() const { return persistence_failures_; }
    const std::optional<Certificate>& lastCertificate() const { return last_; }
    const ControlVariateWindow& window() const { return window_; }

private:
    std::string breachReason(const CompilationInput& input) const;
    std::string currentTimestamp() const;
    void emit(const Certificate& certificate);

    CompilerConfig config_;
    CertificateSink* sink_;
    rclcpp::Clock::SharedPtr clock_;
    rclcpp::Logger logger_;

    ControlVariateWindow window_;
    double historical_mean_;
    uint64_t next_sequence_;
    uint64_t certificate_count_;
    uint64_t persistence_failures_;
    std::optional<Certificate> last_;
};

}  // namespace navl

#endif // NAVL_CERTIFICATION_COMPILER_HPP
