// Ticket: 0004_constraint_ledger

#include <gtest/gtest.h>

#include "pep-engine/src/Basis/BasisRegistry.hpp"
#include "pep-engine/src/Problem/ConstraintLedger.hpp"
#include "pep-engine/src/Symbolic/Algebra.hpp"
#include "pep-engine/src/Symbolic/Constraint.hpp"

using namespace pep_engine;

// ============================================================================
// Builders
// ============================================================================

TEST(ConstraintTest, LeqKeepsExpressionAndBound_0004)
{
  BasisRegistry registry;
  const Expression f = Expression::basis(registry.newValue(0));

  const Constraint c = leq(f, 1.5);
  EXPECT_TRUE(c.isInequality());
  EXPECT_DOUBLE_EQ(c.bound, 1.5);
  EXPECT_TRUE(c.expression.identicalTo(f));
  EXPECT_EQ(c.tag.origin, ConstraintOrigin::User);
}

TEST(ConstraintTest, GeqFlipsSign_0004)
{
  BasisRegistry registry;
  const BasisId id = registry.newValue(0);
  const Expression f = Expression::basis(id);

  const Constraint c = geq(f, 2.0);
  EXPECT_TRUE(c.isInequality());
  EXPECT_DOUBLE_EQ(c.bound, -2.0);
  EXPECT_DOUBLE_EQ(c.expression.linearCoefficient(id), -1.0);
}

TEST(ConstraintTest, TwoSidedBuildersMoveEverythingLeft_0004)
{
  BasisRegistry registry;
  const BasisId a = registry.newValue(0);
  const BasisId b = registry.newValue(0);
  const Expression fa = Expression::basis(a);
  const Expression fb = Expression::basis(b);

  const Constraint le = leq(fa, fb);
  EXPECT_DOUBLE_EQ(le.bound, 0.0);
  EXPECT_DOUBLE_EQ(le.expression.linearCoefficient(a), 1.0);
  EXPECT_DOUBLE_EQ(le.expression.linearCoefficient(b), -1.0);

  const Constraint ge = geq(fa, fb);
  EXPECT_DOUBLE_EQ(ge.expression.linearCoefficient(a), -1.0);
  EXPECT_DOUBLE_EQ(ge.expression.linearCoefficient(b), 1.0);

  const Constraint equal = eq(fa, addExpressions(fb, constantExpression(1.0)));
  EXPECT_FALSE(equal.isInequality());
  EXPECT_EQ(equal.relation, Relation::Equal);
  EXPECT_DOUBLE_EQ(equal.expression.constantTerm(), -1.0);
}

TEST(ConstraintTest, OriginNames_0004)
{
  EXPECT_EQ(toString(ConstraintOrigin::InitialCondition), "initial_condition");
  EXPECT_EQ(toString(ConstraintOrigin::User), "user");
  EXPECT_EQ(toString(ConstraintOrigin::Interpolation), "interpolation");
  EXPECT_EQ(toString(ConstraintOrigin::PerformanceMetric),
            "performance_metric");
}

// ============================================================================
// Ledger
// ============================================================================

TEST(ConstraintLedgerTest, TagsByOriginAndPosition_0004)
{
  BasisRegistry registry;
  const Expression f = Expression::basis(registry.newValue(0));

  ConstraintLedger ledger;
  ledger.addInitialCondition(leq(f, 1.0));
  ledger.addInitialCondition(leq(f, 2.0));
  ledger.addUserConstraint(geq(f, 0.0));
  ledger.addPerformanceMetric(f);

  ASSERT_EQ(ledger.initialConditions().size(), 2u);
  EXPECT_EQ(ledger.initialConditions()[0].tag.origin,
            ConstraintOrigin::InitialCondition);
  EXPECT_EQ(ledger.initialConditions()[1].tag.i, 1u);
  ASSERT_EQ(ledger.userConstraints().size(), 1u);
  EXPECT_EQ(ledger.userConstraints()[0].tag.origin, ConstraintOrigin::User);
  EXPECT_EQ(ledger.performanceMetrics().size(), 1u);
  EXPECT_EQ(ledger.constraintCount(), 3u);

  ledger.clear();
  EXPECT_EQ(ledger.constraintCount(), 0u);
  EXPECT_TRUE(ledger.performanceMetrics().empty());
}
