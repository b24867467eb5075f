// Ticket: 0005_problem_orchestrator
// Ticket: 0010_worst_case_instance

#ifndef PEP_ENGINE_PROBLEM_SOLVE_RESULT_HPP
#define PEP_ENGINE_PROBLEM_SOLVE_RESULT_HPP

#include <Eigen/Dense>

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "pep-engine/src/Basis/BasisRegistry.hpp"
#include "pep-engine/src/Certification/ProofCertifier.hpp"
#include "pep-engine/src/Problem/ProblemDiagnostics.hpp"
#include "pep-engine/src/Solver/SolverStatus.hpp"
#include "pep-engine/src/Symbolic/Constraint.hpp"
#include "pep-engine/src/Symbolic/Expression.hpp"
#include "pep-engine/src/Symbolic/Point.hpp"

namespace pep_engine
{

/// Multiplier of one ledger row, with the constraint that produced it
struct ConstraintDual
{
  ConstraintTag tag;
  double value{0.0};
};

/**
 * @brief Outcome of Problem::solve()
 *
 * `tau` is the worst-case value of the performance metric over the declared
 * function classes. The primal (G, F) describe a worst-case instance;
 * evaluate() maps Points and Expressions onto it. The Gram factor is
 * computed once on construction.
 *
 * The result keeps a copy of the basis registry it was solved with, so it
 * stays usable after Problem::reset().
 *
 * @ticket 0005_problem_orchestrator
 */
class SolveResult
{
public:
  SolveResult(double tau,
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
              BasisRegistry registry);

  /// Worst-case value (primal optimum)
  [[nodiscard]] double tau() const
  {
    return tau_;
  }

  /// Dual bound b·λ
  [[nodiscard]] double dualTau() const
  {
    return dualTau_;
  }

  [[nodiscard]] SolverStatus status() const
  {
    return status_;
  }

  [[nodiscard]] const std::string& solverName() const
  {
    return solverName_;
  }

  [[nodiscard]] int iterations() const
  {
    return iterations_;
  }

  [[nodiscard]] const ProblemDiagnostics& diagnostics() const
  {
    return diagnostics_;
  }

  [[nodiscard]] const CertificationReport& certification() const
  {
    return certification_;
  }

  [[nodiscard]] const std::optional<CertificationWarning>& warning() const
  {
    return warning_;
  }

  /// One entry per ledger row, in row order
  [[nodiscard]] const std::vector<ConstraintDual>& duals() const
  {
    return duals_;
  }

  [[nodiscard]] const Eigen::MatrixXd& gram() const
  {
    return gram_;
  }

  /// Value vector F (auxiliary τ excluded)
  [[nodiscard]] const Eigen::VectorXd& values() const
  {
    return values_;
  }

  /**
   * @brief Coordinates of a Point in the worst-case instance
   *
   * Uses the factorization G = Vᵀ·V, so ⟨evaluate(a), evaluate(b)⟩ equals
   * evaluate(innerProduct(a, b)) up to clipped negative eigenvalues.
   *
   * @throws UnresolvedReferenceError if the Point is not from this problem
   */
  [[nodiscard]] Eigen::VectorXd evaluate(const Point& point) const;

  /**
   * @brief Numeric value of an Expression on (G, F)
   * @throws UnresolvedReferenceError if the Expression is not from this problem
   */
  [[nodiscard]] double evaluate(const Expression& expression) const;

  /// Multi-line summary: diagnostics, solver status, certification
  [[nodiscard]] std::string report() const;

private:
  double tau_{std::numeric_limits<double>::quiet_NaN()};
  double dualTau_{std::numeric_limits<double>::quiet_NaN()};
  SolverStatus status_{SolverStatus::Error};
  std::string solverName_;
  int iterations_{0};
  ProblemDiagnostics diagnostics_;
  CertificationReport certification_;
  std::optional<CertificationWarning> warning_;
  std::vector<ConstraintDual> duals_;
  Eigen::MatrixXd gram_;
  Eigen::VectorXd values_;
  Eigen::MatrixXd gramFactor_;
  BasisRegistry registry_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_PROBLEM_SOLVE_RESULT_HPP
