// Ticket: 0008_proof_certifier

#include "pep-engine/src/Certification/ProofCertifier.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include "pep-engine/src/Solver/PsdUtils.hpp"

namespace pep_engine
{

ProofCertifier::ProofCertifier(CertificationConfig config)
  : config_{std::move(config)}
{
  config_.validate();
}

CertificationReport ProofCertifier::certify(const SdpProblem& problem,
                                            const SdpSolution& solution) const
{
  const Eigen::Index n = problem.gramSize;
  const Eigen::Index m = problem.valueSize;
  const auto p = static_cast<Eigen::Index>(problem.rows.size());

  if (solution.gram.rows() != n || solution.gram.cols() != n ||
      solution.psdDual.rows() != n || solution.psdDual.cols() != n ||
      solution.values.size() != m || solution.rowDuals.size() != p)
  {
    std::ostringstream oss;
    oss << "ProofCertifier::certify: solution dimensions (gram "
        << solution.gram.rows() << ", dual " << solution.psdDual.rows()
        << ", values " << solution.values.size() << ", multipliers "
        << solution.rowDuals.size() << ") do not match problem (" << n << ", "
        << m << ", " << p << ")";
    throw std::invalid_argument{oss.str()};
  }

  CertificationReport report;
  const Eigen::VectorXd& lambda = solution.rowDuals;

  // Step 1: Reconstruction residual R = C - Σ λ A + S, r = c - Σ λ a
  Eigen::MatrixXd gramResidual = Eigen::MatrixXd(problem.objective.gram);
  gramResidual += solution.psdDual;
  Eigen::VectorXd valueResidual = problem.objective.values;
  for (Eigen::Index k = 0; k < p; ++k)
  {
    const SdpRow& row = problem.rows[static_cast<std::size_t>(k)];
    gramResidual -= lambda(k) * Eigen::MatrixXd(row.form.gram);
    valueResidual -= lambda(k) * row.form.values;
  }
  report.reconstructionError =
    std::sqrt(gramResidual.squaredNorm() + valueResidual.squaredNorm());

  // Step 2: Dual cone membership
  report.psdDualMinEigenvalue =
    psd::minEigenvalue(psd::symmetrize(solution.psdDual));
  for (Eigen::Index k = 0; k < p; ++k)
  {
    if (problem.rows[static_cast<std::size_t>(k)].relation ==
        Relation::LessEqual)
    {
      report.minInequalityDual = std::min(report.minInequalityDual, lambda(k));
    }
  }

  // Step 3: Primal feasibility and complementary slackness
  report.gramMinEigenvalue = psd::minEigenvalue(psd::symmetrize(solution.gram));
  report.maxPrimalViolation = 0.0;
  report.complementarySlackness =
    std::abs(solution.gram.cwiseProduct(solution.psdDual).sum());
  for (Eigen::Index k = 0; k < p; ++k)
  {
    const SdpRow& row = problem.rows[static_cast<std::size_t>(k)];
    const double lhs = psd::frobenius(row.form.gram, solution.gram) +
                       row.form.values.dot(solution.values);
    const double slack = row.bound - lhs;
    const double violation =
      row.relation == Relation::LessEqual ? std::max(0.0, -slack)
                                          : std::abs(slack);
    report.maxPrimalViolation = std::max(report.maxPrimalViolation, violation);
    if (row.relation == Relation::LessEqual)
    {
      report.complementarySlackness += std::abs(lambda(k) * slack);
    }
  }

  // Step 4: Duality gap between the primal value and b·λ
  const double tau = psd::frobenius(problem.objective.gram, solution.gram) +
                     problem.objective.values.dot(solution.values) +
                     problem.objectiveConstant;
  double dualTau = problem.objectiveConstant;
  for (Eigen::Index k = 0; k < p; ++k)
  {
    dualTau += lambda(k) * problem.rows[static_cast<std::size_t>(k)].bound;
  }
  report.dualityGap = std::abs(tau - dualTau);
  if (config_.relativeGap)
  {
    report.dualityGap /= 1.0 + std::abs(tau);
  }

  // Step 5: Verdict
  if (!(report.reconstructionError <= config_.reconstructionTolerance))
  {
    report.failedChecks.emplace_back("reconstruction");
  }
  if (!(report.psdDualMinEigenvalue >= -config_.psdTolerance))
  {
    report.failedChecks.emplace_back("dual_psd");
  }
  if (!(report.minInequalityDual >= -config_.feasibilityTolerance))
  {
    report.failedChecks.emplace_back("dual_sign");
  }
  if (!(report.gramMinEigenvalue >= -config_.psdTolerance))
  {
    report.failedChecks.emplace_back("primal_psd");
  }
  if (!(report.maxPrimalViolation <= config_.feasibilityTolerance))
  {
    report.failedChecks.emplace_back("primal_feasibility");
  }
  if (!(report.dualityGap <= config_.dualityGapTolerance))
  {
    report.failedChecks.emplace_back("duality_gap");
  }

  return report;
}

std::optional<CertificationWarning> ProofCertifier::toWarning(
  const CertificationReport& report)
{
  if (report.certified())
  {
    return std::nullopt;
  }

  CertificationWarning warning;
  warning.failedChecks = report.failedChecks;
  warning.reconstructionError = report.reconstructionError;
  warning.dualityGap = report.dualityGap;
  warning.message = fmt::format(
    "dual certificate not confirmed (failed: {}; reconstruction error "
    "{:.3e}, duality gap {:.3e})",
    fmt::join(report.failedChecks, ", "),
    report.reconstructionError,
    report.dualityGap);
  return warning;
}

}  // namespace pep_engine
