// Ticket: 0002_symbolic_algebra
// Ticket: 0004_constraint_ledger

#include "pep-engine/src/Symbolic/Constraint.hpp"

#include <utility>

#include "pep-engine/src/Symbolic/Algebra.hpp"

namespace pep_engine
{

std::string toString(ConstraintOrigin origin)
{
  switch (origin)
  {
    case ConstraintOrigin::InitialCondition:
      return "initial_condition";
    case ConstraintOrigin::User:
      return "user";
    case ConstraintOrigin::Interpolation:
      return "interpolation";
    case ConstraintOrigin::PerformanceMetric:
      return "performance_metric";
  }
  return "user";
}

Constraint Constraint::withTag(ConstraintTag newTag) const
{
  Constraint copy = *this;
  copy.tag = std::move(newTag);
  return copy;
}

Constraint leq(const Expression& expression, double bound)
{
  return Constraint{expression, Relation::LessEqual, bound, ConstraintTag{}};
}

Constraint leq(const Expression& lhs, const Expression& rhs)
{
  return leq(subtractExpressions(lhs, rhs), 0.0);
}

Constraint geq(const Expression& expression, double bound)
{
  return leq(negateExpression(expression), -bound);
}

Constraint geq(const Expression& lhs, const Expression& rhs)
{
  return leq(subtractExpressions(rhs, lhs), 0.0);
}

Constraint eq(const Expression& expression, double bound)
{
  return Constraint{expression, Relation::Equal, bound, ConstraintTag{}};
}

Constraint eq(const Expression& lhs, const Expression& rhs)
{
  return eq(subtractExpressions(lhs, rhs), 0.0);
}

}  // namespace pep_engine
