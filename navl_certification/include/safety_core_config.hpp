#ifndef NAVL_SAFETY_CORE_CONFIG_HPP
#define NAVL_SAFETY_CORE_CONFIG_HPP

#include "barrier_verifier.hpp"
#include "certification_compiler.hpp"
#include "certified_params_validator.hpp"
#include "cognitive_rigor_scorer.hpp"
#include "state_estimator.hpp"

namespace navl
{

/**
 * @brief Aggregated configuration of the certification core
 */
struct SafetyCoreConfig
{
  EstimatorConfig estimator;
  BarrierConfig barrier;
  ScorerConfig scorer;
  CompilerConfig compiler;
  double compilation_rate_hz{10.0};   // 0 = compile every tick

  /**
   * @brief Map certified parameters onto component configs.
   *
   * Parameters absent from the file keep their defaults.
   */
  static SafetyCoreConfig fromCertifiedParams(const CertifiedParamsValidator & params);

  /**
   * @throws std::invalid_argument on malformed values
   */
  void validate() const;
};

}  // namespace navl

#endif  // NAVL_SAFETY_CORE_CONFIG_HPP
