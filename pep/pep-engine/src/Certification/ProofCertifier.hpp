// Ticket: 0008_proof_certifier

#ifndef PEP_ENGINE_CERTIFICATION_PROOF_CERTIFIER_HPP
#define PEP_ENGINE_CERTIFICATION_PROOF_CERTIFIER_HPP

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "pep-engine/src/Solver/SdpProblem.hpp"
#include "pep-engine/src/Solver/SolverConfig.hpp"

namespace pep_engine
{

/**
 * @brief Numbers measured while checking a dual certificate
 */
struct CertificationReport
{
  static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

  /// sqrt(||C - Σ λ_k A_k + S||_F² + ||c - Σ λ_k a_k||²)
  double reconstructionError{kNaN};
  /// |tau - dualTau|, relative to 1 + |tau| when configured
  double dualityGap{kNaN};
  double psdDualMinEigenvalue{kNaN};
  double gramMinEigenvalue{kNaN};
  /// Smallest multiplier over inequality rows (+inf without inequalities)
  double minInequalityDual{std::numeric_limits<double>::infinity()};
  /// Largest violation of any row by the primal (G, F)
  double maxPrimalViolation{kNaN};
  /// |<G, S>| + Σ |λ_k · slack_k|
  double complementarySlackness{kNaN};
  /// Names of the checks that failed; empty when certified
  std::vector<std::string> failedChecks;

  [[nodiscard]] bool certified() const
  {
    return failedChecks.empty();
  }
};

/**
 * @brief Non-fatal notice attached to a SolveResult whose dual certificate
 * did not reproduce the primal bound within tolerance
 */
struct CertificationWarning
{
  std::string message;
  std::vector<std::string> failedChecks;
  double reconstructionError{CertificationReport::kNaN};
  double dualityGap{CertificationReport::kNaN};
};

/**
 * @brief Verifies that the solver's dual multipliers form a valid proof
 *
 * For the maximization form of SdpProblem, a certificate is a vector λ with
 * λ_k >= 0 on inequality rows and a matrix S ⪰ 0 such that
 *
 *   C - Σ λ_k A_k + S = 0   and   c - Σ λ_k a_k = 0
 *
 * Then b·λ (+ objectiveConstant) bounds the metric from above for every
 * feasible (G, F). The certifier recomputes every residual from the
 * problem data rather than trusting solver-reported numbers, and checks
 * primal feasibility and the duality gap alongside.
 *
 * The certifier never throws on a bad certificate; failures are collected
 * in CertificationReport::failedChecks.
 *
 * @ticket 0008_proof_certifier
 */
class ProofCertifier
{
public:
  explicit ProofCertifier(CertificationConfig config);

  /**
   * @brief Check a solution against its problem
   *
   * @throws std::invalid_argument if solution dimensions do not match the
   *         problem
   */
  [[nodiscard]] CertificationReport certify(const SdpProblem& problem,
                                            const SdpSolution& solution) const;

  /// Warning describing a failed report; empty when the report is certified
  [[nodiscard]] static std::optional<CertificationWarning> toWarning(
    const CertificationReport& report);

  [[nodiscard]] const CertificationConfig& config() const
  {
    return config_;
  }

private:
  CertificationConfig config_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_CERTIFICATION_PROOF_CERTIFIER_HPP
