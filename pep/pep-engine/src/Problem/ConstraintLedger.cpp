// Ticket: 0004_constraint_ledger

#include "pep-engine/src/Problem/ConstraintLedger.hpp"

#include <utility>

namespace pep_engine
{

void ConstraintLedger::addInitialCondition(Constraint constraint)
{
  constraint.tag.origin = ConstraintOrigin::InitialCondition;
  constraint.tag.i = initialConditions_.size();
  initialConditions_.push_back(std::move(constraint));
}

void ConstraintLedger::addUserConstraint(Constraint constraint)
{
  constraint.tag.origin = ConstraintOrigin::User;
  constraint.tag.i = userConstraints_.size();
  userConstraints_.push_back(std::move(constraint));
}

void ConstraintLedger::setInterpolationConstraints(
  std::vector<Constraint> constraints)
{
  for (auto& constraint : constraints)
  {
    constraint.tag.origin = ConstraintOrigin::Interpolation;
  }
  interpolationConstraints_ = std::move(constraints);
}

void ConstraintLedger::addPerformanceMetric(Expression metric)
{
  performanceMetrics_.push_back(std::move(metric));
}

void ConstraintLedger::clear()
{
  initialConditions_.clear();
  userConstraints_.clear();
  interpolationConstraints_.clear();
  performanceMetrics_.clear();
}

}  // namespace pep_engine
