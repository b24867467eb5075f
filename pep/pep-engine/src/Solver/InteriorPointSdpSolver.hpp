// Ticket: 0007_interior_point_sdp_backend

#ifndef PEP_ENGINE_SOLVER_INTERIOR_POINT_SDP_SOLVER_HPP
#define PEP_ENGINE_SOLVER_INTERIOR_POINT_SDP_SOLVER_HPP

#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "pep-engine/src/Solver/SdpSolverAdapter.hpp"

namespace pep_engine
{

/**
 * @brief Built-in primal-dual interior-point SDP backend
 *
 * Solves the standard-form problem of SdpProblem with one PSD block (G), one
 * nonnegative block (a slack per inequality row) and free variables (F):
 *
 *   max ⟨C, X⟩ + c·f
 *   s.t. ⟨A_k, X⟩ + a_k·f + s_k = b_k   (s_k only on inequality rows)
 *        X ⪰ 0, s >= 0
 *
 * with dual
 *
 *   min b·y  s.t.  Z = Σ y_k A_k - C ⪰ 0,  z_k = y_k >= 0,  Bᵀy = c
 *
 * **Algorithm**: infeasible path-following method with the HKM search
 * direction and Mehrotra predictor-corrector. Each iteration assembles the
 * Schur complement M_ij = ⟨A_i, X A_j Z⁻¹⟩ (+ s/z on slack rows) and solves
 * the augmented system [M, -B; Bᵀ, 0] for (dy, df) with one LU
 * factorization shared by predictor and corrector. Primal and dual step
 * lengths are chosen separately from the Cholesky-based distance to the
 * PSD boundary, damped by SolverConfig::stepFraction.
 *
 * **Preprocessing**: Gram indices that no row and no objective touches are
 * fixed to zero. The free variables are restricted to the row space of their
 * constraint block B (f = V u), so directions that no row sees, such as a
 * common shift of function values appearing only in differences, are fixed
 * to zero; the problem is reported unbounded if the objective depends on
 * such a direction.
 *
 * **Termination**:
 * - optimal: relative primal infeasibility, dual infeasibility and gap all
 *   below SolverConfig::tolerance
 * - optimal at reduced accuracy: dual infeasibility and gap below
 *   100 * tolerance while the primal residual has stopped decreasing (the
 *   primal supremum is approached but not attained)
 * - infeasible: |y| exceeds SolverConfig::divergenceThreshold
 * - unbounded: the primal iterate exceeds SolverConfig::divergenceThreshold
 *   while the primal residual is small and the primal objective exceeds
 *   sqrt(divergenceThreshold)
 * - iteration_limit: budget exhausted
 * - error: non-finite direction or stalled steps far from optimality
 *
 * Recognized backendOptions: `kkt_regularization` (non-negative double,
 * default 1e-12), applied to the call that passes it.
 *
 * Thread safety: not thread-safe (owns its workspace).
 *
 * @ticket 0007_interior_point_sdp_backend
 */
class InteriorPointSdpSolver : public SdpSolverAdapter
{
public:
  InteriorPointSdpSolver() = default;
  ~InteriorPointSdpSolver() override = default;

  InteriorPointSdpSolver(const InteriorPointSdpSolver&) = delete;
  InteriorPointSdpSolver& operator=(const InteriorPointSdpSolver&) = delete;
  InteriorPointSdpSolver(InteriorPointSdpSolver&&) noexcept = default;
  InteriorPointSdpSolver& operator=(InteriorPointSdpSolver&&) noexcept = default;

  SdpSolution solve(const SdpProblem& problem,
                    const SolverConfig& config,
                    const std::shared_ptr<spdlog::logger>& logger) override;

  [[nodiscard]] std::string name() const override
  {
    return "interior-point-hkm";
  }

private:
  /// Problem restricted to the touched Gram indices and free variables
  struct Reduced
  {
    Eigen::Index n{0};
    Eigen::Index freeCount{0};
    Eigen::Index slackCount{0};
    std::vector<GramMatrix> A;
    Eigen::MatrixXd B;
    Eigen::VectorXd b;
    GramMatrix C;
    Eigen::VectorXd c;
    /// Per row: slack index, or -1 for equality rows
    std::vector<Eigen::Index> slackOf;
    /// Per slack: its row
    std::vector<Eigen::Index> rowOfSlack;
    /// Reduced Gram index -> original Gram index
    std::vector<Eigen::Index> gramIndex;
    /// Reduced free index -> original value index
    std::vector<Eigen::Index> valueIndex;
    /// Orthonormal basis of the row space of B over valueIndex; f = V u
    Eigen::MatrixXd freeBasis;
    double normB{0.0};
    double normC{0.0};
  };

  /// Iterate and residuals
  struct Workspace
  {
    Eigen::MatrixXd X;
    Eigen::MatrixXd Z;
    Eigen::MatrixXd Zinv;
    Eigen::VectorXd f;
    Eigen::VectorXd s;
    Eigen::VectorXd z;
    Eigen::VectorXd y;

    Eigen::VectorXd rp;
    Eigen::MatrixXd Rd;
    Eigen::VectorXd rd;
    Eigen::VectorXd rf;
    double mu{0.0};

    Eigen::MatrixXd kktMatrix;
    Eigen::PartialPivLU<Eigen::MatrixXd> kkt;
  };

  /// One Newton direction
  struct Direction
  {
    Eigen::MatrixXd dX;
    Eigen::MatrixXd dZ;
    Eigen::VectorXd df;
    Eigen::VectorXd ds;
    Eigen::VectorXd dz;
    Eigen::VectorXd dy;
  };

  static Reduced reduce(const SdpProblem& problem, bool& unboundedFree);

  void initialize(const Reduced& reduced);

  void computeResiduals(const Reduced& reduced);

  /// Build and factor the augmented Schur system; false on breakdown
  bool factorKkt(const Reduced& reduced, double regularization);

  Direction direction(const Reduced& reduced,
                      double sigma,
                      const Eigen::MatrixXd& corrX,
                      const Eigen::VectorXd& corrS) const;

  static double lpStep(const Eigen::VectorXd& v,
                       const Eigen::VectorXd& dv,
                       double cap);

  SdpSolution assemble(const SdpProblem& problem,
                       const Reduced& reduced,
                       SolverStatus status,
                       int iterations,
                       double relPrimal,
                       double relDual,
                       double relGap) const;

  Workspace ws_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_SOLVER_INTERIOR_POINT_SDP_SOLVER_HPP
