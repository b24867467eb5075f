// Ticket: 0007_interior_point_sdp_backend
// Ticket: 0010_worst_case_instance

#include "pep-engine/src/Solver/PsdUtils.hpp"

#include <Eigen/Eigenvalues>

#include <algorithm>

namespace pep_engine::psd
{

double minEigenvalue(const Eigen::MatrixXd& symmetric)
{
  if (symmetric.size() == 0)
  {
    return 0.0;
  }
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver{
    symmetric, Eigen::EigenvaluesOnly};
  return solver.eigenvalues().minCoeff();
}

Eigen::MatrixXd symmetrize(const Eigen::MatrixXd& m)
{
  return 0.5 * (m + m.transpose());
}

double frobenius(const Eigen::SparseMatrix<double>& a, const Eigen::MatrixXd& w)
{
  double sum{0.0};
  for (Eigen::Index k = 0; k < a.outerSize(); ++k)
  {
    for (Eigen::SparseMatrix<double>::InnerIterator it(a, k); it; ++it)
    {
      sum += it.value() * w(it.row(), it.col());
    }
  }
  return sum;
}

double maxStepToBoundary(const Eigen::MatrixXd& x,
                         const Eigen::MatrixXd& dx,
                         double cap)
{
  if (x.size() == 0)
  {
    return cap;
  }

  Eigen::LLT<Eigen::MatrixXd> llt{x};
  if (llt.info() != Eigen::Success)
  {
    return 0.0;
  }

  // W = L⁻¹ dX L⁻ᵀ
  Eigen::MatrixXd w = llt.matrixL().solve(dx);
  w = llt.matrixL().solve(w.transpose().eval());
  const double lambdaMin = minEigenvalue(symmetrize(w));
  if (lambdaMin >= 0.0)
  {
    return cap;
  }
  return std::min(cap, -1.0 / lambdaMin);
}

Eigen::MatrixXd gramFactor(const Eigen::MatrixXd& gram)
{
  if (gram.size() == 0)
  {
    return Eigen::MatrixXd(0, 0);
  }
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver{symmetrize(gram)};
  const Eigen::VectorXd roots =
    solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();
  return roots.asDiagonal() * solver.eigenvectors().transpose();
}

}  // namespace pep_engine::psd
