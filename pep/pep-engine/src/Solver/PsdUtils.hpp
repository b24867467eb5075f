// Ticket: 0007_interior_point_sdp_backend
// Ticket: 0010_worst_case_instance

#ifndef PEP_ENGINE_SOLVER_PSD_UTILS_HPP
#define PEP_ENGINE_SOLVER_PSD_UTILS_HPP

#include <Eigen/Dense>
#include <Eigen/SparseCore>

namespace pep_engine::psd
{

/// Smallest eigenvalue of a symmetric matrix (0 for an empty matrix)
[[nodiscard]] double minEigenvalue(const Eigen::MatrixXd& symmetric);

/// (M + Mᵀ) / 2
[[nodiscard]] Eigen::MatrixXd symmetrize(const Eigen::MatrixXd& m);

/// Frobenius inner product ⟨A, W⟩ = Σ A_rc W_rc with A sparse
[[nodiscard]] double frobenius(const Eigen::SparseMatrix<double>& a,
                               const Eigen::MatrixXd& w);

/**
 * @brief Largest alpha in [0, 1/fraction] keeping X + alpha·dX ⪰ 0
 *
 * Uses the Cholesky factor X = L·Lᵀ and the smallest eigenvalue of
 * L⁻¹·dX·L⁻ᵀ. Returns 0 if X is not numerically positive definite.
 *
 * @param x Current iterate, positive definite
 * @param dx Symmetric search direction
 * @param cap Returned when dX does not point towards the boundary
 */
[[nodiscard]] double maxStepToBoundary(const Eigen::MatrixXd& x,
                                       const Eigen::MatrixXd& dx,
                                       double cap);

/**
 * @brief Factor a PSD matrix as G = Vᵀ·V
 *
 * Eigen-decomposes G, clips negative eigenvalues to zero and returns
 * V = diag(sqrt(λ))·Uᵀ, one row per eigenvalue. Column k of V is the vector
 * whose pairwise inner products reproduce row k of G.
 */
[[nodiscard]] Eigen::MatrixXd gramFactor(const Eigen::MatrixXd& gram);

}  // namespace pep_engine::psd

#endif  // PEP_ENGINE_SOLVER_PSD_UTILS_HPP
