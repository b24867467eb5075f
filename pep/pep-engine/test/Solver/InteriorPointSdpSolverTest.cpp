// Ticket: 0007_interior_point_sdp_backend

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <cmath>
#include <stdexcept>

#include "pep-engine/src/Solver/InteriorPointSdpSolver.hpp"
#include "pep-engine/src/Solver/PsdUtils.hpp"
#include "pep-engine/test/Helpers/TestLogger.hpp"

using namespace pep_engine;

namespace
{

GramMatrix sparse(const Eigen::MatrixXd& dense)
{
  return dense.sparseView();
}

SdpRow makeRow(const Eigen::MatrixXd& gram,
               const Eigen::VectorXd& values,
               Relation relation,
               double bound)
{
  SdpRow row;
  row.form.gram = sparse(gram);
  row.form.values = values;
  row.relation = relation;
  row.bound = bound;
  return row;
}

// maximize G01 s.t. G00 <= 1, G11 <= 1, G psd; optimum G = ones, value 1
SdpProblem offDiagonalProblem()
{
  SdpProblem problem;
  problem.gramSize = 2;
  problem.valueSize = 0;

  Eigen::MatrixXd c = Eigen::MatrixXd::Zero(2, 2);
  c(0, 1) = 0.5;
  c(1, 0) = 0.5;
  problem.objective.gram = sparse(c);
  problem.objective.values = Eigen::VectorXd::Zero(0);

  Eigen::MatrixXd a0 = Eigen::MatrixXd::Zero(2, 2);
  a0(0, 0) = 1.0;
  Eigen::MatrixXd a1 = Eigen::MatrixXd::Zero(2, 2);
  a1(1, 1) = 1.0;
  problem.rows.push_back(
    makeRow(a0, Eigen::VectorXd::Zero(0), Relation::LessEqual, 1.0));
  problem.rows.push_back(
    makeRow(a1, Eigen::VectorXd::Zero(0), Relation::LessEqual, 1.0));
  return problem;
}

}  // namespace

// ============================================================================
// Optimal instances
// ============================================================================

TEST(InteriorPointSdpSolverTest, SolvesTwoByTwoSdp_0007)
{
  InteriorPointSdpSolver solver;
  const SdpProblem problem = offDiagonalProblem();

  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());

  ASSERT_EQ(solution.status, SolverStatus::Optimal);
  EXPECT_NEAR(solution.primalObjective, 1.0, 1e-6);
  EXPECT_NEAR(solution.dualObjective, 1.0, 1e-6);
  EXPECT_NEAR(solution.gram(0, 1), 1.0, 1e-5);
  EXPECT_NEAR(solution.rowDuals(0), 0.5, 1e-5);
  EXPECT_NEAR(solution.rowDuals(1), 0.5, 1e-5);
  EXPECT_GE(psd::minEigenvalue(psd::symmetrize(solution.psdDual)), -1e-7);
  EXPECT_EQ(solution.solverName, "interior-point-hkm");
  EXPECT_GT(solution.iterations, 0);
}

TEST(InteriorPointSdpSolverTest, HandlesFreeVariablesAndEqualities_0007)
{
  // maximize G00 + F0 s.t. G00 <= 2, F0 + F1 <= 3, F1 = 0
  SdpProblem problem;
  problem.gramSize = 1;
  problem.valueSize = 2;
  problem.objective.gram = sparse(Eigen::MatrixXd::Identity(1, 1));
  problem.objective.values = Eigen::Vector2d{1.0, 0.0};

  problem.rows.push_back(makeRow(Eigen::MatrixXd::Identity(1, 1),
                                 Eigen::VectorXd::Zero(2),
                                 Relation::LessEqual,
                                 2.0));
  problem.rows.push_back(makeRow(Eigen::MatrixXd::Zero(1, 1),
                                 Eigen::Vector2d{1.0, 1.0},
                                 Relation::LessEqual,
                                 3.0));
  problem.rows.push_back(makeRow(Eigen::MatrixXd::Zero(1, 1),
                                 Eigen::Vector2d{0.0, 1.0},
                                 Relation::Equal,
                                 0.0));

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());

  ASSERT_EQ(solution.status, SolverStatus::Optimal);
  EXPECT_NEAR(solution.primalObjective, 5.0, 1e-6);
  EXPECT_NEAR(solution.values(0), 3.0, 1e-5);
  EXPECT_NEAR(solution.values(1), 0.0, 1e-5);
  EXPECT_NEAR(solution.gram(0, 0), 2.0, 1e-5);
}

TEST(InteriorPointSdpSolverTest, ObjectiveConstantIsAdded_0007)
{
  SdpProblem problem = offDiagonalProblem();
  problem.objectiveConstant = -0.25;

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());

  ASSERT_EQ(solution.status, SolverStatus::Optimal);
  EXPECT_NEAR(solution.primalObjective, 0.75, 1e-6);
}

TEST(InteriorPointSdpSolverTest, UntouchedGramIndexIsZero_0007)
{
  // Index 2 appears in no row and not in the objective
  SdpProblem base = offDiagonalProblem();
  SdpProblem problem;
  problem.gramSize = 3;
  problem.valueSize = 0;
  Eigen::MatrixXd c = Eigen::MatrixXd::Zero(3, 3);
  c.topLeftCorner(2, 2) = Eigen::MatrixXd(base.objective.gram);
  problem.objective.gram = sparse(c);
  problem.objective.values = Eigen::VectorXd::Zero(0);
  for (const auto& row : base.rows)
  {
    Eigen::MatrixXd a = Eigen::MatrixXd::Zero(3, 3);
    a.topLeftCorner(2, 2) = Eigen::MatrixXd(row.form.gram);
    problem.rows.push_back(
      makeRow(a, Eigen::VectorXd::Zero(0), row.relation, row.bound));
  }

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());

  ASSERT_EQ(solution.status, SolverStatus::Optimal);
  EXPECT_NEAR(solution.primalObjective, 1.0, 1e-6);
  ASSERT_EQ(solution.gram.rows(), 3);
  EXPECT_DOUBLE_EQ(solution.gram(2, 2), 0.0);
}

TEST(InteriorPointSdpSolverTest, ValuesSeenOnlyThroughADifference_0007)
{
  // maximize G00 + F0 - F1 s.t. G00 <= 1, F0 - F1 <= 2; F0 + F1 moves no row
  SdpProblem problem;
  problem.gramSize = 1;
  problem.valueSize = 2;
  problem.objective.gram = sparse(Eigen::MatrixXd::Identity(1, 1));
  problem.objective.values = Eigen::Vector2d{1.0, -1.0};

  problem.rows.push_back(makeRow(Eigen::MatrixXd::Identity(1, 1),
                                 Eigen::VectorXd::Zero(2),
                                 Relation::LessEqual,
                                 1.0));
  problem.rows.push_back(makeRow(Eigen::MatrixXd::Zero(1, 1),
                                 Eigen::Vector2d{1.0, -1.0},
                                 Relation::LessEqual,
                                 2.0));
  problem.rows.push_back(makeRow(Eigen::MatrixXd::Zero(1, 1),
                                 Eigen::Vector2d{-1.0, 1.0},
                                 Relation::LessEqual,
                                 0.0));

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());

  ASSERT_EQ(solution.status, SolverStatus::Optimal);
  EXPECT_NEAR(solution.primalObjective, 3.0, 1e-6);
  EXPECT_NEAR(solution.values(0) - solution.values(1), 2.0, 1e-5);
  EXPECT_NEAR(solution.values(0) + solution.values(1), 0.0, 1e-8);
}

TEST(InteriorPointSdpSolverTest, LargeFeasibleSetIsNotUnbounded_0007)
{
  // maximize -G11 s.t. G00 <= 100; G11 and G01 have no upper bound but the
  // optimum is 0. The starting iterate already exceeds the threshold.
  SdpProblem problem;
  problem.gramSize = 2;
  problem.valueSize = 0;
  Eigen::MatrixXd c = Eigen::MatrixXd::Zero(2, 2);
  c(1, 1) = -1.0;
  problem.objective.gram = sparse(c);
  problem.objective.values = Eigen::VectorXd::Zero(0);

  Eigen::MatrixXd a = Eigen::MatrixXd::Zero(2, 2);
  a(0, 0) = 1.0;
  problem.rows.push_back(
    makeRow(a, Eigen::VectorXd::Zero(0), Relation::LessEqual, 100.0));

  SolverConfig config;
  config.divergenceThreshold = 20.0;

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, config, test::quietLogger());

  ASSERT_EQ(solution.status, SolverStatus::Optimal);
  EXPECT_NEAR(solution.primalObjective, 0.0, 1e-6);
  EXPECT_NEAR(solution.dualObjective, 0.0, 1e-6);
  EXPECT_LE(solution.gram(0, 0), 100.0 + 1e-6);
}

// ============================================================================
// Degenerate instances
// ============================================================================

TEST(InteriorPointSdpSolverTest, UnboundedFreeVariable_0007)
{
  SdpProblem problem = offDiagonalProblem();
  problem.valueSize = 1;
  problem.objective.values = Eigen::VectorXd::Ones(1);
  for (auto& row : problem.rows)
  {
    row.form.values = Eigen::VectorXd::Zero(1);
  }

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());
  EXPECT_EQ(solution.status, SolverStatus::Unbounded);
}

TEST(InteriorPointSdpSolverTest, ObjectiveAlongUnconstrainedDirection_0007)
{
  // Rows see only F0 - F1 but the objective rewards F0 + F1
  SdpProblem problem = offDiagonalProblem();
  problem.valueSize = 2;
  problem.objective.values = Eigen::Vector2d{1.0, 1.0};
  for (auto& row : problem.rows)
  {
    row.form.values = Eigen::VectorXd::Zero(2);
  }
  problem.rows.push_back(makeRow(Eigen::MatrixXd::Zero(2, 2),
                                 Eigen::Vector2d{1.0, -1.0},
                                 Relation::LessEqual,
                                 1.0));

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());
  EXPECT_EQ(solution.status, SolverStatus::Unbounded);
}

TEST(InteriorPointSdpSolverTest, NoRowsWithPositiveObjectiveIsUnbounded_0007)
{
  SdpProblem problem;
  problem.gramSize = 1;
  problem.valueSize = 0;
  problem.objective.gram = sparse(Eigen::MatrixXd::Identity(1, 1));
  problem.objective.values = Eigen::VectorXd::Zero(0);

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());
  EXPECT_EQ(solution.status, SolverStatus::Unbounded);
}

TEST(InteriorPointSdpSolverTest, NoRowsWithNegativeObjectiveIsOptimal_0007)
{
  SdpProblem problem;
  problem.gramSize = 1;
  problem.valueSize = 0;
  problem.objective.gram = sparse(-Eigen::MatrixXd::Identity(1, 1));
  problem.objective.values = Eigen::VectorXd::Zero(0);

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(problem, SolverConfig{}, test::quietLogger());
  ASSERT_EQ(solution.status, SolverStatus::Optimal);
  EXPECT_DOUBLE_EQ(solution.primalObjective, 0.0);
}

TEST(InteriorPointSdpSolverTest, IterationBudgetIsReported_0007)
{
  SolverConfig config;
  config.maxIterations = 1;

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(offDiagonalProblem(), config, test::quietLogger());
  EXPECT_EQ(solution.status, SolverStatus::IterationLimit);
  EXPECT_EQ(solution.iterations, 1);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(InteriorPointSdpSolverTest, RejectsMismatchedForms_0007)
{
  SdpProblem problem = offDiagonalProblem();
  problem.rows[0].form.values = Eigen::VectorXd::Zero(3);

  InteriorPointSdpSolver solver;
  EXPECT_THROW(solver.solve(problem, SolverConfig{}, test::quietLogger()),
               std::invalid_argument);
}

TEST(InteriorPointSdpSolverTest, BackendOptions_0007)
{
  SolverConfig config;
  config.backendOptions["kkt_regularization"] = "1e-10";
  config.backendOptions["unknown_key"] = "ignored";

  InteriorPointSdpSolver solver;
  const SdpSolution solution =
    solver.solve(offDiagonalProblem(), config, test::quietLogger());
  EXPECT_EQ(solution.status, SolverStatus::Optimal);

  config.backendOptions["kkt_regularization"] = "not-a-number";
  EXPECT_THROW(solver.solve(offDiagonalProblem(), config, test::quietLogger()),
               std::invalid_argument);
}

TEST(InteriorPointSdpSolverTest, RegularizationAppliesToOneCallOnly_0007)
{
  SolverConfig heavy;
  heavy.backendOptions["kkt_regularization"] = "1e6";

  InteriorPointSdpSolver solver;
  solver.solve(offDiagonalProblem(), heavy, test::quietLogger());

  const SdpSolution second =
    solver.solve(offDiagonalProblem(), SolverConfig{}, test::quietLogger());
  ASSERT_EQ(second.status, SolverStatus::Optimal);
  EXPECT_NEAR(second.primalObjective, 1.0, 1e-6);
  EXPECT_NEAR(second.rowDuals(0), 0.5, 1e-5);
}

TEST(InteriorPointSdpSolverTest, RejectsNegativeRegularization_0007)
{
  SolverConfig config;
  config.backendOptions["kkt_regularization"] = "-1e-8";

  InteriorPointSdpSolver solver;
  EXPECT_THROW(solver.solve(offDiagonalProblem(), config, test::quietLogger()),
               std::invalid_argument);
}

// ============================================================================
// PSD helpers
// ============================================================================

TEST(PsdUtilsTest, GramFactorReproducesPsdMatrix_0007)
{
  Eigen::MatrixXd v(2, 3);
  v << 1.0, 2.0, 0.0, -1.0, 0.5, 3.0;
  const Eigen::MatrixXd gram = v.transpose() * v;

  const Eigen::MatrixXd factor = psd::gramFactor(gram);
  EXPECT_TRUE((factor.transpose() * factor).isApprox(gram, 1e-10));
  EXPECT_NEAR(psd::minEigenvalue(gram), 0.0, 1e-10);
}

TEST(PsdUtilsTest, StepToBoundary_0007)
{
  const Eigen::MatrixXd x = Eigen::MatrixXd::Identity(2, 2);
  const Eigen::MatrixXd dx = -2.0 * Eigen::MatrixXd::Identity(2, 2);

  EXPECT_NEAR(psd::maxStepToBoundary(x, dx, 10.0), 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(
    psd::maxStepToBoundary(x, Eigen::MatrixXd::Identity(2, 2), 10.0), 10.0);
}
