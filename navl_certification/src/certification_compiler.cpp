#include "certification_compiler.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace navl
{

CertificationCompiler::CertificationCompiler(const CompilerConfig& config,
                                             CertificateSink* sink,
                                             rclcpp::Clock::SharedPtr clock,
                                             rclcpp::Logger logger)
    : config_(config),
      sink_(sink),
      clock_(std::move(clock)),
      logger_(logger),
      window_(config.window_size),
      historical_mean_(ControlVariateWindow::DEFAULT_RESCALED_MEAN),
      next_sequence_(0),
      certificate_count_(0),
      persistence_failures_(0) {

    if (!clock_) {
        throw std::invalid_argument("CertificationCompiler requires a valid clock");
    }
    if (!std::isfinite(config_.near_miss_range) || config_.near_miss_range <= 0.0) {
        throw std::invalid_argument("near_miss_range must be > 0");
    }
    if (!std::isfinite(config_.beta)) {
        throw std::invalid_argument("Control-variate beta must be finite");
    }

    if (sink_ != nullptr) {
        next_sequence_ = sink_->recordCount();
        if (next_sequence_ == 0) {
            Certificate init;
            init.sequence = next_sequence_++;
            init.timestamp = currentTimestamp();
            init.log_type = "SYSTEM_INIT";
            init.equation = EQUATION;
            init.status = "INITIALIZED";
            init.verified = true;
            emit(init);
        }
    }

    RCLCPP_INFO(logger_, "Initialized - window=%zu, beta=%.2f, sink=%s",
                config_.window_size, config_.beta, sink_ ? "attached" : "none");
}

double CertificationCompiler::nearMissIndicator(double margin) const {
    if (!std::isfinite(margin)) {
        return 0.0;
    }
    return std::clamp(1.0 - (margin / config_.near_miss_range), 0.0, 1.0);
}

Certificate CertificationCompiler::compileCertificate(const CompilationInput& input) {
    // 1. Control variate for this cycle
    const double y = nearMissIndicator(input.margin);
    window_.push(y);

    // 2. Window statistics
    const double mean_x = window_.rescaledMean();
    historical_mean_ = mean_x;
    const double mean_y = window_.mean();
    const double sigma = std::sqrt(window_.rescaledVariance());

    // 3. Control-variate correction, scaled back to the P-score range
    const double p_estimate = mean_x + config_.beta * (y - mean_y) * 50.0;

    const bool verified = std::isfinite(input.p_score) &&
                          input.p_score >= input.safety_threshold;

    Certificate certificate;
    certificate.sequence = next_sequence_++;
    certificate.timestamp = currentTimestamp();
    certificate.log_type = "VNC_CERTIFICATION";
    certificate.equation = EQUATION;
    certificate.p_score = input.p_score;
    certificate.h_safety = input.h_safety;
    certificate.goal_proximity = input.goal_proximity;
    certificate.model_intent = input.model_intent;
    certificate.consciousness = input.consciousness;
    certificate.margin = input.margin;
    certificate.sim2val_y = y;
    certificate.p_estimate = p_estimate;
    certificate.sigma = sigma;
    certificate.verified = verified;
    certificate.status = verified ? "VERIFIED_SAFE" : breachReason(input);

    ++certificate_count_;
    emit(certificate);
    last_ = certificate;

    if (!verified) {
        RCLCPP_WARN_THROTTLE(logger_, *clock_, 1000,
            "Certificate #%lu UNSAFE (%s): P=%.2f < %.2f",
            static_cast<unsigned long>(certificate.sequence), certificate.status.c_str(),
            input.p_score, input.safety_threshold);
    }

    return certificate;
}

std::string CertificationCompiler::breachReason(const CompilationInput& input) const {
    if (input.consciousness < FATIGUE_LIMIT) {
        return "FATIGUE";
    }
    if (input.model_intent < CERTAINTY_LIMIT) {
        return "LOW_CERTAINTY";
    }
    if (!input.barrier_certified) {
        return "VNC_VIOLATION";
    }
    return "UNSAFE";
}

CertificateStats CertificationCompiler::getStats() const {
    CertificateStats stats;
    stats.total_certificates = certificate_count_;
    stats.window_size = window_.size();
    stats.historical_mean = historical_mean_;
    stats.current_variance = window_.variance();
    stats.current_sigma = std::sqrt(stats.current_variance);
    return stats;
}

void CertificationCompiler::emit(const Certificate& certificate) {
    if (sink_ == nullptr) {
        return;
    }
    if (!sink_->append(certificate)) {
        ++persistence_failures_;
        RCLCPP_WARN_THROTTLE(logger_, *clock_, 5000,
            "Failed to persist certificate #%lu (%lu failures so far)",
            static_cast<unsigned long>(certificate.sequence),
            static_cast<unsigned long>(persistence_failures_));
    }
}

std::string CertificationCompiler::currentTimestamp() const {
    const int64_t now_ns = clock_->now().nanoseconds();
    const std::time_t seconds = static_cast<std::time_t>(now_ns / 1000000000LL);
    const int64_t millis = (now_ns / 1000000LL) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

}  // namespace navl
