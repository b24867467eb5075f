// Ticket: 0009_primitive_steps

#include <gtest/gtest.h>

#include <stdexcept>

#include "pep-engine/src/Problem/Problem.hpp"
#include "pep-engine/src/Steps/PrimitiveSteps.hpp"
#include "pep-engine/src/Symbolic/Algebra.hpp"
#include "pep-engine/test/Helpers/TestLogger.hpp"

using namespace pep_engine;

namespace
{

class PrimitiveStepsTest : public ::testing::Test
{
protected:
  PrimitiveStepsTest()
    : problem_{test::quietLogger()}
  {
  }

  Problem problem_;
};

}  // namespace

// ============================================================================
// Stationary point
// ============================================================================

TEST_F(PrimitiveStepsTest, SingleFunctionHasZeroGradient_0009)
{
  const FunctionHandle f = problem_.declareFunction(SmoothConvexParams{1.0});

  const Point xs = stationaryPoint(problem_, {f});
  EXPECT_TRUE(xs.isLeaf());
  EXPECT_TRUE(problem_.gradient(f, xs).isZero());
  EXPECT_EQ(problem_.function(f).triples().size(), 1u);
}

TEST_F(PrimitiveStepsTest, GradientsOfASumCancel_0009)
{
  const FunctionHandle f = problem_.declareFunction(ConvexParams{});
  const FunctionHandle g = problem_.declareFunction(ConvexParams{});
  const FunctionHandle h = problem_.declareFunction(ConvexIndicatorParams{});

  const Point xs = stationaryPoint(problem_, {f, g, h});
  const Point total = sumPoints({problem_.gradient(f, xs),
                                 problem_.gradient(g, xs),
                                 problem_.gradient(h, xs)});
  EXPECT_TRUE(total.isZero());
  EXPECT_TRUE(problem_.value(h, xs).isZero());
}

TEST_F(PrimitiveStepsTest, StationaryPointRejectsBadLists_0009)
{
  const FunctionHandle f = problem_.declareFunction(ConvexParams{});

  EXPECT_THROW(static_cast<void>(stationaryPoint(problem_, {})),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(stationaryPoint(problem_, {f, f})),
               std::invalid_argument);
}

TEST_F(PrimitiveStepsTest, KernelListedLastIsRejected_0009)
{
  const FunctionHandle h = problem_.declareFunction(ConvexParams{});
  const FunctionHandle f =
    problem_.declareFunction(RelativelySmoothParams{1.0, h});

  EXPECT_THROW(static_cast<void>(stationaryPoint(problem_, {f, h})),
               std::invalid_argument);
}

// ============================================================================
// Proximal steps
// ============================================================================

TEST_F(PrimitiveStepsTest, ProximalStepRecordsImplicitTriple_0009)
{
  const FunctionHandle f = problem_.declareFunction(ConvexParams{});
  const Point x0 = problem_.setInitialPoint();

  const StepResult step = proximalStep(problem_, x0, f, 0.5);

  // x = x0 - gamma g
  EXPECT_EQ(step.point, subtractPoints(x0, scalePoint(step.gradient, 0.5)));
  const OracleResult atX = problem_.oracle(f, step.point);
  EXPECT_EQ(atX.gradient, step.gradient);
  EXPECT_TRUE(atX.value.identicalTo(step.value));
  EXPECT_EQ(problem_.function(f).triples().size(), 1u);
}

TEST_F(PrimitiveStepsTest, ProximalStepRejectsNonPositiveStep_0009)
{
  const FunctionHandle f = problem_.declareFunction(ConvexParams{});
  const Point x0 = problem_.setInitialPoint();

  EXPECT_THROW(static_cast<void>(proximalStep(problem_, x0, f, 0.0)),
               std::invalid_argument);
}

// ============================================================================
// Bregman steps
// ============================================================================

TEST_F(PrimitiveStepsTest, BregmanGradientStepMatchesMirrorSubgradient_0009)
{
  const FunctionHandle h = problem_.declareFunction(ConvexParams{});
  const FunctionHandle d = problem_.declareFunction(ConvexIndicatorParams{});
  const FunctionHandle f = problem_.declareFunction(ConvexParams{});

  const Point x0 = problem_.setInitialPoint();
  const Point gx0 = problem_.gradient(f, x0);
  const Point sx0 = problem_.gradient(h, x0);

  const BregmanStepResult step =
    bregmanGradientStep(problem_, gx0, sx0, {h, d}, 0.25);

  EXPECT_EQ(step.mirrorGradient, subtractPoints(sx0, scalePoint(gx0, 0.25)));
  const Point total =
    addPoints(problem_.gradient(h, step.point), problem_.gradient(d, step.point));
  EXPECT_EQ(total, step.mirrorGradient);
  EXPECT_TRUE(step.mirrorValue.identicalTo(problem_.value(h, step.point)));
}

TEST_F(PrimitiveStepsTest, BregmanProximalStepLinksBothFunctions_0009)
{
  const FunctionHandle h = problem_.declareFunction(ConvexParams{});
  const FunctionHandle f = problem_.declareFunction(ConvexParams{});

  const Point x0 = problem_.setInitialPoint();
  const Point sx0 = problem_.gradient(h, x0);

  const BregmanStepResult step = bregmanProximalStep(problem_, sx0, {h}, f, 2.0);

  const Point g = problem_.gradient(f, step.point);
  EXPECT_EQ(step.mirrorGradient, subtractPoints(sx0, scalePoint(g, 2.0)));
  EXPECT_EQ(problem_.gradient(h, step.point), step.mirrorGradient);
  EXPECT_EQ(problem_.function(f).triples().size(), 1u);
}

TEST_F(PrimitiveStepsTest, BregmanProximalStepRejectsOverlap_0009)
{
  const FunctionHandle h = problem_.declareFunction(ConvexParams{});
  const Point x0 = problem_.setInitialPoint();
  const Point sx0 = problem_.gradient(h, x0);

  EXPECT_THROW(static_cast<void>(bregmanProximalStep(problem_, sx0, {h}, h, 1.0)),
               std::invalid_argument);
}

TEST_F(PrimitiveStepsTest, StepsAreClosedAfterSolve_0009)
{
  const FunctionHandle f = problem_.declareFunction(SmoothConvexParams{1.0});
  const Point xs = stationaryPoint(problem_, {f});
  const Point x0 = problem_.setInitialPoint();
  problem_.setInitialCondition(leq(squaredNorm(subtractPoints(x0, xs)), 1.0));
  const Point x1 = subtractPoints(x0, problem_.gradient(f, x0));
  problem_.setPerformanceMetric(
    subtractExpressions(problem_.value(f, x1), problem_.value(f, xs)));
  static_cast<void>(problem_.solve(SolveOptions{0}));

  EXPECT_THROW(static_cast<void>(stationaryPoint(problem_, {f})),
               std::logic_error);
}
