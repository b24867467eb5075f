// Ticket: 0006_sdp_lowering
// Ticket: 0007_interior_point_sdp_backend

#ifndef PEP_ENGINE_SOLVER_SDP_PROBLEM_HPP
#define PEP_ENGINE_SOLVER_SDP_PROBLEM_HPP

#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include <limits>
#include <string>
#include <vector>

#include "pep-engine/src/Solver/SolverStatus.hpp"
#include "pep-engine/src/Symbolic/Relation.hpp"

namespace pep_engine
{

/// Symmetric sparse coefficient matrix over the Gram variable
using GramMatrix = Eigen::SparseMatrix<double>;

/**
 * @brief Affine form ⟨gram, G⟩ + values·F
 *
 * `gram` is symmetric (an off-diagonal bilinear coefficient c appears as c/2
 * at both (i, j) and (j, i)), so ⟨gram, G⟩ equals the symbolic bilinear part.
 */
struct LinearForm
{
  GramMatrix gram;
  Eigen::VectorXd values;
};

/**
 * @brief One scalar row: form (<= | ==) bound
 */
struct SdpRow
{
  LinearForm form;
  Relation relation{Relation::LessEqual};
  double bound{0.0};
};

/**
 * @brief Standard-form SDP handed to a solver adapter
 *
 *   optimize  ⟨C, G⟩ + c·F + objectiveConstant
 *   s.t.      ⟨A_k, G⟩ + a_k·F (<= | ==) b_k   for every row k
 *             G ⪰ 0, F free
 *
 * @ticket 0006_sdp_lowering
 */
struct SdpProblem
{
  Eigen::Index gramSize{0};
  Eigen::Index valueSize{0};
  LinearForm objective;
  double objectiveConstant{0.0};
  std::vector<SdpRow> rows;
  bool maximize{true};
};

/**
 * @brief What an adapter returns
 *
 * `rowDuals` holds one multiplier per row in row order (nonnegative for
 * inequality rows at optimality of a maximization), and `psdDual` is
 * S = Σ_k λ_k A_k - C. Objective values include `objectiveConstant`.
 *
 * @ticket 0007_interior_point_sdp_backend
 */
struct SdpSolution
{
  SolverStatus status{SolverStatus::Error};
  std::string solverName;
  double primalObjective{std::numeric_limits<double>::quiet_NaN()};
  double dualObjective{std::numeric_limits<double>::quiet_NaN()};
  Eigen::MatrixXd gram;
  Eigen::VectorXd values;
  Eigen::VectorXd rowDuals;
  Eigen::MatrixXd psdDual;
  int iterations{0};
  double primalInfeasibility{std::numeric_limits<double>::quiet_NaN()};
  double dualInfeasibility{std::numeric_limits<double>::quiet_NaN()};
  double relativeGap{std::numeric_limits<double>::quiet_NaN()};

  SdpSolution() = default;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_SOLVER_SDP_PROBLEM_HPP
