#include "safety_core_config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace navl
{

namespace
{
void requireFinite(double value, const char * name)
{
  if (!std::isfinite(value)) {
    throw std::invalid_argument(std::string(name) + " must be finite");
  }
}

void requirePositive(double value, const char * name)
{
  requireFinite(value, name);
  if (value <= 0.0) {
    throw std::invalid_argument(std::string(name) + " must be > 0");
  }
}

void requireNonNegative(double value, const char * name)
{
  requireFinite(value, name);
  if (value < 0.0) {
    throw std::invalid_argument(std::string(name) + " must be >= 0");
  }
}

Vec3 uniform(double value)
{
  return {value, value, value};
}
}  // namespace

SafetyCoreConfig SafetyCoreConfig::fromCertifiedParams(const CertifiedParamsValidator & params)
{
  SafetyCoreConfig config;

  config.estimator.initial_covariance =
    params.getParameterOr("initial_covariance", config.estimator.initial_covariance);
  config.estimator.process_noise =
    uniform(params.getParameterOr("process_noise", config.estimator.process_noise.x));
  config.estimator.measurement_noise =
    uniform(params.getParameterOr("measurement_noise", config.estimator.measurement_noise.x));
  config.estimator.raim_threshold =
    params.getParameterOr("raim_threshold", config.estimator.raim_threshold);

  config.barrier.alpha = params.getParameterOr("cbf_alpha", config.barrier.alpha);
  config.barrier.min_alpha = params.getParameterOr("cbf_min_alpha", config.barrier.min_alpha);
  config.barrier.max_alpha = params.getParameterOr("cbf_max_alpha", config.barrier.max_alpha);
  config.barrier.safety_margin =
    params.getParameterOr("safety_margin", config.barrier.safety_margin);

  config.scorer.safety_threshold =
    params.getParameterOr("p_score_threshold", config.scorer.safety_threshold);
  config.scorer.max_goal_distance =
    params.getParameterOr("max_goal_distance", config.scorer.max_goal_distance);
  config.scorer.fatigue_decay_rate =
    params.getParameterOr("fatigue_decay_rate", config.scorer.fatigue_decay_rate);
  config.scorer.recovery_rate =
    params.getParameterOr("recovery_rate", config.scorer.recovery_rate);

  const double window = params.getParameterOr(
    "sim2val_window_size", static_cast<double>(config.compiler.window_size));
  if (!std::isfinite(window) || window < 1.0 || window != std::floor(window)) {
    throw std::invalid_argument("sim2val_window_size must be a positive integer");
  }
  config.compiler.window_size = static_cast<std::size_t>(window);
  config.compiler.beta = params.getParameterOr("control_variate_beta", config.compiler.beta);
  config.compiler.near_miss_range =
    params.getParameterOr("near_miss_range", config.compiler.near_miss_range);

  config.validate();
  return config;
}

void SafetyCoreConfig::validate() const
{
  requireNonNegative(estimator.initial_covariance, "initial_covariance");
  if (!estimator.process_noise.isFinite() || !estimator.measurement_noise.isFinite()) {
    throw std::invalid_argument("estimator noise must be finite");
  }
  requireNonNegative(estimator.process_noise.x, "process_noise");
  requireNonNegative(estimator.process_noise.y, "process_noise");
  requireNonNegative(estimator.process_noise.z, "process_noise");
  requireNonNegative(estimator.measurement_noise.x, "measurement_noise");
  requireNonNegative(estimator.measurement_noise.y, "measurement_noise");
  requireNonNegative(estimator.measurement_noise.z, "measurement_noise");
  requirePositive(estimator.raim_threshold, "raim_threshold");

  requirePositive(barrier.safety_margin, "safety_margin");
  requireFinite(barrier.alpha, "cbf_alpha");
  requireNonNegative(barrier.min_alpha, "cbf_min_alpha");
  requireNonNegative(barrier.max_alpha, "cbf_max_alpha");
  if (barrier.min_alpha > barrier.max_alpha) {
    throw std::invalid_argument("cbf_min_alpha must not exceed cbf_max_alpha");
  }

  requireFinite(scorer.safety_threshold, "p_score_threshold");
  requirePositive(scorer.max_goal_distance, "max_goal_distance");
  requireNonNegative(scorer.fatigue_decay_rate, "fatigue_decay_rate");
  requireNonNegative(scorer.recovery_rate, "recovery_rate");

  if (compiler.window_size == 0) {
    throw std::invalid_argument("sim2val_window_size must be > 0");
  }
  requireFinite(compiler.beta, "control_variate_beta");
  requirePositive(compiler.near_miss_range, "near_miss_range");
  requireNonNegative(compilation_rate_hz, "compilation_rate_hz");
}

}  // namespace navl
