// Ticket: 0006_sdp_lowering

#include <gtest/gtest.h>

#include <Eigen/Dense>

#include <stdexcept>
#include <vector>

#include "pep-engine/src/Basis/BasisRegistry.hpp"
#include "pep-engine/src/Problem/Problem.hpp"
#include "pep-engine/src/Problem/SdpLowering.hpp"
#include "pep-engine/src/Steps/PrimitiveSteps.hpp"
#include "pep-engine/src/Symbolic/Algebra.hpp"
#include "pep-engine/test/Helpers/TestLogger.hpp"

using namespace pep_engine;

namespace
{

bool isSymmetric(const GramMatrix& m)
{
  const Eigen::MatrixXd dense(m);
  return (dense - dense.transpose()).cwiseAbs().maxCoeff() == 0.0;
}

// N gradient steps with step 1/L on an L-smooth convex function
LoweredProblem lowerGradientDescent(int steps)
{
  Problem problem{test::quietLogger()};
  const FunctionHandle f = problem.declareFunction(SmoothConvexParams{1.0});
  const Point xs = stationaryPoint(problem, {f});
  const Expression fs = problem.value(f, xs);

  Point x = problem.setInitialPoint();
  problem.setInitialCondition(
    leq(squaredNorm(subtractPoints(x, xs)), 1.0));
  for (int k = 0; k < steps; ++k)
  {
    x = subtractPoints(x, problem.gradient(f, x));
  }
  problem.setPerformanceMetric(subtractExpressions(problem.value(f, x), fs));
  return problem.lower();
}

}  // namespace

// ============================================================================
// Expressions
// ============================================================================

TEST(SdpLoweringTest, BilinearTermsSplitSymmetrically_0006)
{
  BasisRegistry registry;
  const BasisId a = registry.newPoint();
  const BasisId b = registry.newPoint();
  const BasisId f = registry.newValue(0);

  // 3<a,b> + 2<a,a> + 5 f + 7
  const Expression e = sumExpressions(
    {scaleExpression(innerProduct(Point::basis(a), Point::basis(b)), 3.0),
     scaleExpression(squaredNorm(Point::basis(a)), 2.0),
     scaleExpression(Expression::basis(f), 5.0),
     constantExpression(7.0)});

  const LinearForm form = SdpLowering::lowerExpression(e, registry, 1);
  const Eigen::MatrixXd gram(form.gram);
  EXPECT_DOUBLE_EQ(gram(0, 1), 1.5);
  EXPECT_DOUBLE_EQ(gram(1, 0), 1.5);
  EXPECT_DOUBLE_EQ(gram(0, 0), 2.0);
  EXPECT_DOUBLE_EQ(gram(1, 1), 0.0);
  ASSERT_EQ(form.values.size(), 1);
  EXPECT_DOUBLE_EQ(form.values(0), 5.0);
}

TEST(SdpLoweringTest, ConstantMovesToBound_0006)
{
  BasisRegistry registry;
  const BasisId f = registry.newValue(0);

  const Constraint c =
    leq(addExpressions(Expression::basis(f), constantExpression(2.0)), 5.0);
  const SdpRow row = SdpLowering::lowerConstraint(c, registry, 1);
  EXPECT_DOUBLE_EQ(row.bound, 3.0);
  EXPECT_EQ(row.relation, Relation::LessEqual);
}

// ============================================================================
// Full problems
// ============================================================================

TEST(SdpLoweringTest, RowsFollowLedgerOrder_0006)
{
  const LoweredProblem lowered = lowerGradientDescent(2);

  // Triples: xs, x0, x1, x2 -> 4 * 3 interpolation rows, plus 1 initial
  ASSERT_EQ(lowered.sdp.rows.size(), 13u);
  EXPECT_EQ(lowered.rowTags.front().origin, ConstraintOrigin::InitialCondition);
  for (std::size_t k = 1; k < lowered.rowTags.size(); ++k)
  {
    EXPECT_EQ(lowered.rowTags[k].origin, ConstraintOrigin::Interpolation);
  }
  EXPECT_FALSE(lowered.auxiliaryTau);

  EXPECT_EQ(lowered.diagnostics.interpolationConstraintCount, 12u);
  EXPECT_EQ(lowered.diagnostics.initialConditionCount, 1u);
  EXPECT_EQ(lowered.diagnostics.metricCount, 1u);
  ASSERT_EQ(lowered.diagnostics.functions.size(), 1u);
  EXPECT_EQ(lowered.diagnostics.functions[0].tripleCount, 4u);
  EXPECT_EQ(lowered.diagnostics.functions[0].interpolationConstraintCount, 12u);
}

TEST(SdpLoweringTest, GramFormsAreSymmetric_0006)
{
  const LoweredProblem lowered = lowerGradientDescent(3);

  EXPECT_TRUE(isSymmetric(lowered.sdp.objective.gram));
  for (const auto& row : lowered.sdp.rows)
  {
    EXPECT_EQ(row.form.gram.rows(), lowered.sdp.gramSize);
    EXPECT_EQ(row.form.values.size(), lowered.sdp.valueSize);
    EXPECT_TRUE(isSymmetric(row.form.gram));
  }
}

TEST(SdpLoweringTest, LoweringIsReproducible_0006)
{
  const LoweredProblem first = lowerGradientDescent(2);
  const LoweredProblem second = lowerGradientDescent(2);

  ASSERT_EQ(first.sdp.rows.size(), second.sdp.rows.size());
  EXPECT_EQ(first.sdp.gramSize, second.sdp.gramSize);
  EXPECT_EQ(first.sdp.valueSize, second.sdp.valueSize);
  EXPECT_TRUE(Eigen::MatrixXd(first.sdp.objective.gram)
                .isApprox(Eigen::MatrixXd(second.sdp.objective.gram)));
  EXPECT_TRUE(first.sdp.objective.values.isApprox(second.sdp.objective.values));
  for (std::size_t k = 0; k < first.sdp.rows.size(); ++k)
  {
    EXPECT_EQ(first.sdp.rows[k].bound, second.sdp.rows[k].bound);
    EXPECT_EQ((Eigen::MatrixXd(first.sdp.rows[k].form.gram) -
               Eigen::MatrixXd(second.sdp.rows[k].form.gram))
                .cwiseAbs()
                .sum(),
              0.0);
  }
}

TEST(SdpLoweringTest, LowerDoesNotCommitInterpolationConstraints_0006)
{
  Problem problem{test::quietLogger()};
  const FunctionHandle f = problem.declareFunction(ConvexParams{});
  const Point x0 = problem.setInitialPoint();
  const Point x1 = problem.newPoint();
  problem.setPerformanceMetric(
    subtractExpressions(problem.value(f, x1), problem.value(f, x0)));

  const LoweredProblem lowered = problem.lower();
  EXPECT_EQ(lowered.interpolationConstraints.size(), 2u);
  EXPECT_TRUE(problem.ledger().interpolationConstraints().empty());
}

TEST(SdpLoweringTest, SeveralMetricsUseAuxiliaryTau_0006)
{
  BasisRegistry registry;
  const BasisId a = registry.newValue(0);
  const BasisId b = registry.newValue(0);

  const std::vector<Expression> metrics{
    Expression::basis(a),
    addExpressions(Expression::basis(b), constantExpression(1.0))};
  const LoweredProblem lowered =
    SdpLowering::build(registry, {}, {}, {}, metrics);

  EXPECT_TRUE(lowered.auxiliaryTau);
  EXPECT_EQ(lowered.sdp.valueSize, 3);
  EXPECT_EQ(lowered.diagnostics.valueSize, 2u);
  ASSERT_EQ(lowered.sdp.rows.size(), 2u);

  // maximize tau
  EXPECT_DOUBLE_EQ(lowered.sdp.objective.values(2), 1.0);
  EXPECT_DOUBLE_EQ(lowered.sdp.objective.values(0), 0.0);

  // tau - (f_b + 1) <= 0  ->  tau - f_b <= 1
  const SdpRow& second = lowered.sdp.rows[1];
  EXPECT_DOUBLE_EQ(second.form.values(2), 1.0);
  EXPECT_DOUBLE_EQ(second.form.values(1), -1.0);
  EXPECT_DOUBLE_EQ(second.bound, 1.0);
  EXPECT_EQ(lowered.rowTags[1].origin, ConstraintOrigin::PerformanceMetric);
  EXPECT_EQ(lowered.rowTags[1].i, 1u);
}

TEST(SdpLoweringTest, BuildWithoutMetricThrows_0006)
{
  BasisRegistry registry;
  EXPECT_THROW(static_cast<void>(SdpLowering::build(registry, {}, {}, {}, {})),
               std::logic_error);
}
