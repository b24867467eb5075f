// Ticket: 0002_symbolic_algebra
// Ticket: 0004_constraint_ledger

#ifndef PEP_ENGINE_SYMBOLIC_CONSTRAINT_HPP
#define PEP_ENGINE_SYMBOLIC_CONSTRAINT_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "pep-engine/src/Symbolic/Expression.hpp"
#include "pep-engine/src/Symbolic/Relation.hpp"

namespace pep_engine
{

/// Which part of the problem a constraint came from
enum class ConstraintOrigin
{
  InitialCondition,
  User,
  Interpolation,
  PerformanceMetric
};

[[nodiscard]] std::string toString(ConstraintOrigin origin);

/**
 * @brief Provenance of a constraint, carried through lowering so dual values
 * can be reported against the constraint that produced them
 *
 * For interpolation constraints `function` is the declaring function index,
 * (i, j) the ordered pair of oracle triples and `rule` the inequality name.
 * For metric constraints `i` is the metric index.
 */
struct ConstraintTag
{
  ConstraintOrigin origin{ConstraintOrigin::User};
  std::optional<std::size_t> function;
  std::size_t i{0};
  std::size_t j{0};
  std::string rule;
};

/**
 * @brief A relation `expression (<= | ==) bound`
 *
 * Built only through leq(), geq() and eq(). The constant term of the
 * expression is folded into the bound when the constraint is lowered.
 *
 * @ticket 0002_symbolic_algebra
 */
struct Constraint
{
  Expression expression;
  Relation relation{Relation::LessEqual};
  double bound{0.0};
  ConstraintTag tag;

  [[nodiscard]] bool isInequality() const
  {
    return relation == Relation::LessEqual;
  }

  /// Copy with a replaced provenance tag
  [[nodiscard]] Constraint withTag(ConstraintTag newTag) const;
};

/// expression <= bound
[[nodiscard]] Constraint leq(const Expression& expression, double bound);

/// lhs <= rhs, stored as lhs - rhs <= 0
[[nodiscard]] Constraint leq(const Expression& lhs, const Expression& rhs);

/// expression >= bound, stored as -expression <= -bound
[[nodiscard]] Constraint geq(const Expression& expression, double bound);

/// lhs >= rhs, stored as rhs - lhs <= 0
[[nodiscard]] Constraint geq(const Expression& lhs, const Expression& rhs);

/// expression == bound
[[nodiscard]] Constraint eq(const Expression& expression, double bound);

/// lhs == rhs, stored as lhs - rhs == 0
[[nodiscard]] Constraint eq(const Expression& lhs, const Expression& rhs);

}  // namespace pep_engine

#endif  // PEP_ENGINE_SYMBOLIC_CONSTRAINT_HPP
