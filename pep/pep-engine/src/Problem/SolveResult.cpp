// Ticket: 0005_problem_orchestrator
// Ticket: 0010_worst_case_instance

#include "pep-engine/src/Problem/SolveResult.hpp"

#include <iterator>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "pep-engine/src/Solver/PsdUtils.hpp"

namespace pep_engine
{

SolveResult::SolveResult(double tau,
                         double dualTau,
                         SolverStatus status,
                         std::string solverName,
                         int iterations,
                         ProblemDiagnostics diagnostics,
                         CertificationReport certification,
                         std::optional<CertificationWarning> warning,
                         std::vector<ConstraintDual> duals,
                         Eigen::MatrixXd gram,
                         Eigen::VectorXd values,
                         BasisRegistry registry)
  : tau_{tau},
    dualTau_{dualTau},
    status_{status},
    solverName_{std::move(solverName)},
    iterations_{iterations},
    diagnostics_{std::move(diagnostics)},
    certification_{std::move(certification)},
    warning_{std::move(warning)},
    duals_{std::move(duals)},
    gram_{std::move(gram)},
    values_{std::move(values)},
    gramFactor_{psd::gramFactor(gram_)},
    registry_{std::move(registry)}
{
}

Eigen::VectorXd SolveResult::evaluate(const Point& point) const
{
  Eigen::VectorXd coordinates = Eigen::VectorXd::Zero(gramFactor_.rows());
  for (const auto& [id, coefficient] : point.terms())
  {
    const auto row = static_cast<Eigen::Index>(registry_.pointRow(id));
    coordinates += coefficient * gramFactor_.col(row);
  }
  return coordinates;
}

double SolveResult::evaluate(const Expression& expression) const
{
  double result = expression.constantTerm();
  for (const auto& [id, coefficient] : expression.linearTerms())
  {
    result +=
      coefficient * values_(static_cast<Eigen::Index>(registry_.valueRow(id)));
  }
  for (const auto& [pair, coefficient] : expression.bilinearTerms())
  {
    const auto i = static_cast<Eigen::Index>(registry_.pointRow(pair.first));
    const auto j = static_cast<Eigen::Index>(registry_.pointRow(pair.second));
    result += coefficient * gram_(i, j);
  }
  return result;
}

std::string SolveResult::report() const
{
  std::string out = diagnostics_.toString();
  auto it = std::back_inserter(out);
  fmt::format_to(it,
                 "\nSolver {}: {} in {} iterations\n",
                 solverName_,
                 toString(status_),
                 iterations_);
  fmt::format_to(it, "Worst-case value tau = {:.10g}\n", tau_);
  fmt::format_to(it, "Dual bound = {:.10g}\n", dualTau_);
  fmt::format_to(it,
                 "Primal feasibility: min eig(G) {:.3e}, max violation {:.3e}\n",
                 certification_.gramMinEigenvalue,
                 certification_.maxPrimalViolation);
  fmt::format_to(it,
                 "Dual feasibility: min eig(S) {:.3e}, min multiplier {:.3e}\n",
                 certification_.psdDualMinEigenvalue,
                 certification_.minInequalityDual);
  fmt::format_to(it,
                 "Proof reconstruction error {:.3e}, duality gap {:.3e}",
                 certification_.reconstructionError,
                 certification_.dualityGap);
  if (warning_)
  {
    fmt::format_to(it, "\nWarning: {}", warning_->message);
  }
  return out;
}

}  // namespace pep_engine
