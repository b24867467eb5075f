// Ticket: 0004_constraint_ledger

#ifndef PEP_ENGINE_PROBLEM_CONSTRAINT_LEDGER_HPP
#define PEP_ENGINE_PROBLEM_CONSTRAINT_LEDGER_HPP

#include <cstddef>
#include <vector>

#include "pep-engine/src/Symbolic/Constraint.hpp"
#include "pep-engine/src/Symbolic/Expression.hpp"

namespace pep_engine
{

/**
 * @brief Ordered store of everything that becomes a row or the objective
 *
 * Keeps four groups in insertion order: initial conditions, user
 * constraints, interpolation constraints and performance metrics. The
 * interpolation group is filled when a Problem is solved; lowering without
 * solving generates it on the fly and leaves the ledger untouched.
 *
 * Each added constraint is re-tagged with its origin, so callers never have
 * to set ConstraintTag::origin themselves.
 *
 * @ticket 0004_constraint_ledger
 */
class ConstraintLedger
{
public:
  ConstraintLedger() = default;

  void addInitialCondition(Constraint constraint);
  void addUserConstraint(Constraint constraint);
  void setInterpolationConstraints(std::vector<Constraint> constraints);
  void addPerformanceMetric(Expression metric);

  [[nodiscard]] const std::vector<Constraint>& initialConditions() const
  {
    return initialConditions_;
  }

  [[nodiscard]] const std::vector<Constraint>& userConstraints() const
  {
    return userConstraints_;
  }

  [[nodiscard]] const std::vector<Constraint>& interpolationConstraints() const
  {
    return interpolationConstraints_;
  }

  [[nodiscard]] const std::vector<Expression>& performanceMetrics() const
  {
    return performanceMetrics_;
  }

  /// Total number of constraints (metrics excluded)
  [[nodiscard]] std::size_t constraintCount() const
  {
    return initialConditions_.size() + userConstraints_.size() +
           interpolationConstraints_.size();
  }

  void clear();

private:
  std::vector<Constraint> initialConditions_;
  std::vector<Constraint> userConstraints_;
  std::vector<Constraint> interpolationConstraints_;
  std::vector<Expression> performanceMetrics_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_PROBLEM_CONSTRAINT_LEDGER_HPP
