// Ticket: 0007_interior_point_sdp_backend

#include "pep-engine/src/Solver/InteriorPointSdpSolver.hpp"

#include <Eigen/Cholesky>
#include <Eigen/LU>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "pep-engine/src/Solver/PsdUtils.hpp"

namespace pep_engine
{

namespace
{

constexpr double kInfinity = std::numeric_limits<double>::infinity();
constexpr double kStallStep = 1e-10;
constexpr double kStallAcceptance = 100.0;
constexpr double kRankThreshold = 1e-10;
constexpr double kDefaultKktRegularization = 1e-12;
// Primal residual counts as stalled after this many iterations without a
// 5% decrease
constexpr int kPrimalStallWindow = 5;
constexpr double kPrimalProgress = 0.95;

GramMatrix remap(const GramMatrix& full,
                 const std::vector<Eigen::Index>& fullToReduced,
                 Eigen::Index n,
                 double scale)
{
  std::vector<Eigen::Triplet<double>> triplets;
  triplets.reserve(static_cast<std::size_t>(full.nonZeros()));
  for (Eigen::Index k = 0; k < full.outerSize(); ++k)
  {
    for (GramMatrix::InnerIterator it(full, k); it; ++it)
    {
      const Eigen::Index r = fullToReduced[static_cast<std::size_t>(it.row())];
      const Eigen::Index c = fullToReduced[static_cast<std::size_t>(it.col())];
      if (r >= 0 && c >= 0)
      {
        triplets.emplace_back(r, c, scale * it.value());
      }
    }
  }
  GramMatrix reduced(n, n);
  reduced.setFromTriplets(triplets.begin(), triplets.end());
  return reduced;
}

void markTouched(const GramMatrix& m, std::vector<bool>& touched)
{
  for (Eigen::Index k = 0; k < m.outerSize(); ++k)
  {
    for (GramMatrix::InnerIterator it(m, k); it; ++it)
    {
      if (it.value() != 0.0)
      {
        touched[static_cast<std::size_t>(it.row())] = true;
        touched[static_cast<std::size_t>(it.col())] = true;
      }
    }
  }
}

void checkForm(const LinearForm& form,
               Eigen::Index gramSize,
               Eigen::Index valueSize,
               const char* what)
{
  if (form.gram.rows() != gramSize || form.gram.cols() != gramSize ||
      form.values.size() != valueSize)
  {
    std::ostringstream oss;
    oss << "InteriorPointSdpSolver::solve: " << what << " has gram "
        << form.gram.rows() << " x " << form.gram.cols() << " and "
        << form.values.size() << " values, expected " << gramSize << " x "
        << gramSize << " and " << valueSize;
    throw std::invalid_argument{oss.str()};
  }
}

}  // namespace

// ===== Preprocessing =====

InteriorPointSdpSolver::Reduced InteriorPointSdpSolver::reduce(
  const SdpProblem& problem,
  bool& unboundedFree)
{
  const Eigen::Index gramSize = problem.gramSize;
  const Eigen::Index valueSize = problem.valueSize;

  checkForm(problem.objective, gramSize, valueSize, "objective");
  for (const auto& row : problem.rows)
  {
    checkForm(row.form, gramSize, valueSize, "row");
  }

  // Step 1: Gram indices touched by any row or the objective
  std::vector<bool> touched(static_cast<std::size_t>(gramSize), false);
  markTouched(problem.objective.gram, touched);
  for (const auto& row : problem.rows)
  {
    markTouched(row.form.gram, touched);
  }

  Reduced reduced;
  std::vector<Eigen::Index> fullToReduced(static_cast<std::size_t>(gramSize),
                                          -1);
  for (Eigen::Index k = 0; k < gramSize; ++k)
  {
    if (touched[static_cast<std::size_t>(k)])
    {
      fullToReduced[static_cast<std::size_t>(k)] = reduced.n++;
      reduced.gramIndex.push_back(k);
    }
  }

  // Step 2: free variables that appear in at least one row
  unboundedFree = false;
  for (Eigen::Index j = 0; j < valueSize; ++j)
  {
    const bool used = std::any_of(problem.rows.begin(),
                                  problem.rows.end(),
                                  [j](const SdpRow& row)
                                  { return row.form.values(j) != 0.0; });
    if (used)
    {
      reduced.valueIndex.push_back(j);
    }
    else if (problem.objective.values(j) != 0.0)
    {
      unboundedFree = true;
    }
  }
  // Step 3: rows, slacks and objective in reduced coordinates
  const double sign = problem.maximize ? 1.0 : -1.0;
  const auto p = static_cast<Eigen::Index>(problem.rows.size());
  const auto usedCount = static_cast<Eigen::Index>(reduced.valueIndex.size());
  reduced.A.reserve(problem.rows.size());
  Eigen::MatrixXd usedB = Eigen::MatrixXd::Zero(p, usedCount);
  reduced.b.resize(p);
  reduced.slackOf.assign(problem.rows.size(), -1);

  for (Eigen::Index k = 0; k < p; ++k)
  {
    const SdpRow& row = problem.rows[static_cast<std::size_t>(k)];
    reduced.A.push_back(remap(row.form.gram, fullToReduced, reduced.n, 1.0));
    for (Eigen::Index j = 0; j < usedCount; ++j)
    {
      usedB(k, j) =
        row.form.values(reduced.valueIndex[static_cast<std::size_t>(j)]);
    }
    reduced.b(k) = row.bound;
    if (row.relation == Relation::LessEqual)
    {
      reduced.slackOf[static_cast<std::size_t>(k)] = reduced.slackCount++;
      reduced.rowOfSlack.push_back(k);
    }
  }

  reduced.C = remap(problem.objective.gram, fullToReduced, reduced.n, sign);
  Eigen::VectorXd usedC(usedCount);
  for (Eigen::Index j = 0; j < usedCount; ++j)
  {
    usedC(j) = sign * problem.objective.values(
                        reduced.valueIndex[static_cast<std::size_t>(j)]);
  }

  // Step 4: restrict f to the row space of B; a null direction of B moves
  // no row, so the objective must not depend on it
  if (usedCount > 0)
  {
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(usedB, Eigen::ComputeFullV);
    svd.setThreshold(kRankThreshold);
    const Eigen::Index rank = svd.rank();
    reduced.freeBasis = svd.matrixV().leftCols(rank);
    const Eigen::VectorXd nullPart =
      svd.matrixV().rightCols(usedCount - rank).transpose() * usedC;
    if (nullPart.norm() > kRankThreshold * (1.0 + usedC.norm()))
    {
      unboundedFree = true;
    }
  }
  else
  {
    reduced.freeBasis = Eigen::MatrixXd::Zero(0, 0);
  }
  reduced.freeCount = reduced.freeBasis.cols();
  reduced.B = usedB * reduced.freeBasis;
  reduced.c = reduced.freeBasis.transpose() * usedC;

  reduced.normB = reduced.b.norm();
  reduced.normC = std::sqrt(reduced.C.squaredNorm() + reduced.c.squaredNorm());
  return reduced;
}

// ===== Iteration =====

void InteriorPointSdpSolver::initialize(const Reduced& reduced)
{
  const Eigen::Index n = reduced.n;
  const auto p = static_cast<Eigen::Index>(reduced.A.size());
  const double rootN = std::sqrt(static_cast<double>(n));

  // Scaled identity start: large enough that every row can be reached
  double xi = std::max(10.0, rootN);
  double eta = std::max({10.0, rootN, reduced.normC});
  for (Eigen::Index k = 0; k < p; ++k)
  {
    const double normA = std::sqrt(reduced.A[static_cast<std::size_t>(k)]
                                     .squaredNorm() +
                                   reduced.B.row(k).squaredNorm());
    xi = std::max(xi, rootN * (1.0 + std::abs(reduced.b(k))) / (1.0 + normA));
    eta = std::max(eta, normA);
  }

  ws_.X = xi * Eigen::MatrixXd::Identity(n, n);
  ws_.Z = eta * Eigen::MatrixXd::Identity(n, n);
  ws_.s = Eigen::VectorXd::Constant(reduced.slackCount, xi);
  ws_.z = Eigen::VectorXd::Constant(reduced.slackCount, eta);
  ws_.f = Eigen::VectorXd::Zero(reduced.freeCount);
  ws_.y = Eigen::VectorXd::Zero(p);
}

void InteriorPointSdpSolver::computeResiduals(const Reduced& reduced)
{
  const Eigen::Index n = reduced.n;
  const auto p = static_cast<Eigen::Index>(reduced.A.size());

  ws_.rp.resize(p);
  Eigen::MatrixXd aty = Eigen::MatrixXd::Zero(n, n);
  for (Eigen::Index k = 0; k < p; ++k)
  {
    const GramMatrix& a = reduced.A[static_cast<std::size_t>(k)];
    double lhs = psd::frobenius(a, ws_.X) + reduced.B.row(k).dot(ws_.f);
    const Eigen::Index slack = reduced.slackOf[static_cast<std::size_t>(k)];
    if (slack >= 0)
    {
      lhs += ws_.s(slack);
    }
    ws_.rp(k) = reduced.b(k) - lhs;
    aty += ws_.y(k) * a;
  }

  ws_.Rd = aty;
  ws_.Rd -= reduced.C;
  ws_.Rd -= ws_.Z;

  ws_.rd.resize(reduced.slackCount);
  for (Eigen::Index k = 0; k < reduced.slackCount; ++k)
  {
    ws_.rd(k) =
      ws_.y(reduced.rowOfSlack[static_cast<std::size_t>(k)]) - ws_.z(k);
  }

  ws_.rf = reduced.c - reduced.B.transpose() * ws_.y;

  const double complementarity =
    ws_.X.cwiseProduct(ws_.Z).sum() + ws_.s.dot(ws_.z);
  const auto cones = static_cast<double>(n + reduced.slackCount);
  ws_.mu = cones > 0.0 ? complementarity / cones : 0.0;
}

bool InteriorPointSdpSolver::factorKkt(const Reduced& reduced,
                                       double regularization)
{
  const Eigen::Index n = reduced.n;
  const auto p = static_cast<Eigen::Index>(reduced.A.size());
  const Eigen::Index mf = reduced.freeCount;

  if (n > 0)
  {
    Eigen::LLT<Eigen::MatrixXd> llt{ws_.Z};
    if (llt.info() != Eigen::Success)
    {
      return false;
    }
    ws_.Zinv = psd::symmetrize(llt.solve(Eigen::MatrixXd::Identity(n, n)));
  }
  else
  {
    ws_.Zinv.resize(0, 0);
  }

  // Schur complement M_ij = <A_i, X A_j Z^-1>
  Eigen::MatrixXd m = Eigen::MatrixXd::Zero(p, p);
  for (Eigen::Index j = 0; j < p; ++j)
  {
    const GramMatrix& aj = reduced.A[static_cast<std::size_t>(j)];
    if (aj.nonZeros() == 0)
    {
      continue;
    }
    const Eigen::MatrixXd xa = ws_.X * aj;
    const Eigen::MatrixXd t = xa * ws_.Zinv;
    for (Eigen::Index i = 0; i < p; ++i)
    {
      m(i, j) = psd::frobenius(reduced.A[static_cast<std::size_t>(i)], t);
    }
  }
  m = psd::symmetrize(m);
  for (Eigen::Index k = 0; k < reduced.slackCount; ++k)
  {
    const Eigen::Index row = reduced.rowOfSlack[static_cast<std::size_t>(k)];
    m(row, row) += ws_.s(k) / ws_.z(k);
  }

  const double scale =
    p > 0 ? std::max(1.0, m.diagonal().cwiseAbs().maxCoeff()) : 1.0;
  const double reg = regularization * scale;

  Eigen::MatrixXd kkt = Eigen::MatrixXd::Zero(p + mf, p + mf);
  kkt.topLeftCorner(p, p) = m;
  kkt.topLeftCorner(p, p).diagonal().array() += reg;
  kkt.topRightCorner(p, mf) = -reduced.B;
  kkt.bottomLeftCorner(mf, p) = reduced.B.transpose();
  kkt.bottomRightCorner(mf, mf).diagonal().array() -= reg;

  if (!kkt.allFinite())
  {
    return false;
  }
  ws_.kktMatrix = std::move(kkt);
  ws_.kkt.compute(ws_.kktMatrix);
  return true;
}

InteriorPointSdpSolver::Direction InteriorPointSdpSolver::direction(
  const Reduced& reduced,
  double sigma,
  const Eigen::MatrixXd& corrX,
  const Eigen::VectorXd& corrS) const
{
  const Eigen::Index n = reduced.n;
  const auto p = static_cast<Eigen::Index>(reduced.A.size());
  const Eigen::Index mf = reduced.freeCount;
  const double target = sigma * ws_.mu;

  // Right-hand side of the Schur system
  const Eigen::MatrixXd g =
    target * ws_.Zinv - ws_.X - (ws_.X * ws_.Rd + corrX) * ws_.Zinv;

  Eigen::VectorXd rhs(p + mf);
  for (Eigen::Index i = 0; i < p; ++i)
  {
    rhs(i) = psd::frobenius(reduced.A[static_cast<std::size_t>(i)], g) -
             ws_.rp(i);
  }
  for (Eigen::Index k = 0; k < reduced.slackCount; ++k)
  {
    const Eigen::Index row = reduced.rowOfSlack[static_cast<std::size_t>(k)];
    rhs(row) += (target - ws_.s(k) * ws_.z(k) - corrS(k) -
                 ws_.s(k) * ws_.rd(k)) /
                ws_.z(k);
  }
  rhs.tail(mf) = ws_.rf;

  // One step of iterative refinement against the factored matrix
  Eigen::VectorXd solution = ws_.kkt.solve(rhs);
  solution += ws_.kkt.solve(rhs - ws_.kktMatrix * solution);

  Direction d;
  d.dy = solution.head(p);
  d.df = solution.tail(mf);

  d.dZ = ws_.Rd;
  for (Eigen::Index k = 0; k < p; ++k)
  {
    d.dZ += d.dy(k) * reduced.A[static_cast<std::size_t>(k)];
  }
  d.dZ = psd::symmetrize(d.dZ);

  d.dX = target * ws_.Zinv - ws_.X -
         psd::symmetrize((ws_.X * d.dZ + corrX) * ws_.Zinv);
  if (n == 0)
  {
    d.dX.resize(0, 0);
  }

  d.dz.resize(reduced.slackCount);
  d.ds.resize(reduced.slackCount);
  for (Eigen::Index k = 0; k < reduced.slackCount; ++k)
  {
    const Eigen::Index row = reduced.rowOfSlack[static_cast<std::size_t>(k)];
    d.dz(k) = d.dy(row) + ws_.rd(k);
    d.ds(k) = (target - ws_.s(k) * ws_.z(k) - corrS(k) - ws_.s(k) * d.dz(k)) /
              ws_.z(k);
  }
  return d;
}

double InteriorPointSdpSolver::lpStep(const Eigen::VectorXd& v,
                                      const Eigen::VectorXd& dv,
                                      double cap)
{
  double alpha = cap;
  for (Eigen::Index k = 0; k < v.size(); ++k)
  {
    if (dv(k) < 0.0)
    {
      alpha = std::min(alpha, -v(k) / dv(k));
    }
  }
  return alpha;
}

// ===== Output =====

SdpSolution InteriorPointSdpSolver::assemble(const SdpProblem& problem,
                                             const Reduced& reduced,
                                             SolverStatus status,
                                             int iterations,
                                             double relPrimal,
                                             double relDual,
                                             double relGap) const
{
  const double sign = problem.maximize ? 1.0 : -1.0;

  SdpSolution solution;
  solution.status = status;
  solution.solverName = name();
  solution.iterations = iterations;
  solution.primalInfeasibility = relPrimal;
  solution.dualInfeasibility = relDual;
  solution.relativeGap = relGap;

  solution.gram = Eigen::MatrixXd::Zero(problem.gramSize, problem.gramSize);
  solution.psdDual = Eigen::MatrixXd::Zero(problem.gramSize, problem.gramSize);
  for (Eigen::Index a = 0; a < reduced.n; ++a)
  {
    for (Eigen::Index b = 0; b < reduced.n; ++b)
    {
      const Eigen::Index ra = reduced.gramIndex[static_cast<std::size_t>(a)];
      const Eigen::Index rb = reduced.gramIndex[static_cast<std::size_t>(b)];
      solution.gram(ra, rb) = ws_.X(a, b);
      solution.psdDual(ra, rb) = ws_.Z(a, b);
    }
  }

  solution.values = Eigen::VectorXd::Zero(problem.valueSize);
  if (reduced.freeCount > 0)
  {
    const Eigen::VectorXd used = reduced.freeBasis * ws_.f;
    for (Eigen::Index j = 0; j < used.size(); ++j)
    {
      solution.values(reduced.valueIndex[static_cast<std::size_t>(j)]) =
        used(j);
    }
  }
  solution.rowDuals = ws_.y;

  const double primal =
    psd::frobenius(reduced.C, ws_.X) + reduced.c.dot(ws_.f);
  const double dual = reduced.b.dot(ws_.y);
  solution.primalObjective = sign * primal + problem.objectiveConstant;
  solution.dualObjective = sign * dual + problem.objectiveConstant;
  return solution;
}

SdpSolution InteriorPointSdpSolver::solve(
  const SdpProblem& problem,
  const SolverConfig& config,
  const std::shared_ptr<spdlog::logger>& logger)
{
  config.validate();

  double kktRegularization = kDefaultKktRegularization;
  for (const auto& [key, value] : config.backendOptions)
  {
    if (key == "kkt_regularization")
    {
      try
      {
        kktRegularization = std::stod(value);
      }
      catch (const std::logic_error&)
      {
        throw std::invalid_argument{
          "InteriorPointSdpSolver::solve: kkt_regularization must be a "
          "number, got '" +
          value + "'"};
      }
      if (!(kktRegularization >= 0.0))
      {
        throw std::invalid_argument{
          "InteriorPointSdpSolver::solve: kkt_regularization must be "
          "non-negative, got '" +
          value + "'"};
      }
    }
    else
    {
      logger->warn("{}: ignoring unknown backend option '{}'", name(), key);
    }
  }

  bool unboundedFree{false};
  const Reduced reduced = reduce(problem, unboundedFree);
  initialize(reduced);

  if (unboundedFree)
  {
    logger->warn("{}: objective depends on a value that no constraint bounds",
                 name());
    return assemble(problem,
                    reduced,
                    SolverStatus::Unbounded,
                    0,
                    kInfinity,
                    kInfinity,
                    kInfinity);
  }

  const double tol = config.tolerance;
  const double loose = kStallAcceptance * tol;
  const double tau = config.stepFraction;

  // Without rows the optimum is X = 0 when C is negative semidefinite
  if (reduced.A.empty())
  {
    const Eigen::MatrixXd negC = -Eigen::MatrixXd(reduced.C);
    ws_.X = Eigen::MatrixXd::Zero(reduced.n, reduced.n);
    ws_.Z = negC;
    const bool bounded = psd::minEigenvalue(negC) >= -tol;
    logger->info("{}: problem has no constraints", name());
    return assemble(problem,
                    reduced,
                    bounded ? SolverStatus::Optimal : SolverStatus::Unbounded,
                    0,
                    0.0,
                    bounded ? 0.0 : kInfinity,
                    0.0);
  }
  double relPrimal{kInfinity};
  double relDual{kInfinity};
  double relGap{kInfinity};

  auto measure = [&]()
  {
    computeResiduals(reduced);
    const double primal =
      psd::frobenius(reduced.C, ws_.X) + reduced.c.dot(ws_.f);
    const double dual = reduced.b.dot(ws_.y);
    relPrimal = ws_.rp.norm() / (1.0 + reduced.normB);
    relDual = std::sqrt(ws_.Rd.squaredNorm() + ws_.rd.squaredNorm() +
                        ws_.rf.squaredNorm()) /
              (1.0 + reduced.normC);
    relGap =
      std::abs(primal - dual) / (1.0 + std::abs(primal) + std::abs(dual));
    return std::pair{primal, dual};
  };

  auto finish = [&](SolverStatus status, int iterations)
  {
    logger->info("{}: {} after {} iterations (pinf {:.2e}, dinf {:.2e}, "
                 "gap {:.2e})",
                 name(),
                 toString(status),
                 iterations,
                 relPrimal,
                 relDual,
                 relGap);
    return assemble(
      problem, reduced, status, iterations, relPrimal, relDual, relGap);
  };

  // The dual certificate has converged even though the primal residual has
  // not; happens when the primal supremum is not attained
  auto dualConverged = [&]() { return relDual < loose && relGap < loose; };

  double lastPrimalResidual{kInfinity};
  int primalStall{0};

  for (int iter = 0; iter < config.maxIterations; ++iter)
  {
    // Step 1: Residuals and stopping tests
    const auto [primal, dual] = measure();
    logger->debug("{} it {:3d}: pobj {:+.8e} dobj {:+.8e} pinf {:.2e} "
                  "dinf {:.2e} gap {:.2e} mu {:.2e}",
                  name(),
                  iter,
                  primal,
                  dual,
                  relPrimal,
                  relDual,
                  relGap,
                  ws_.mu);

    if (relPrimal < tol && relDual < tol && relGap < tol)
    {
      return finish(SolverStatus::Optimal, iter);
    }

    primalStall =
      relPrimal > kPrimalProgress * lastPrimalResidual ? primalStall + 1 : 0;
    lastPrimalResidual = relPrimal;
    if (primalStall >= kPrimalStallWindow && dualConverged())
    {
      logger->warn("{}: primal residual stalled at {:.2e}; accepting the "
                   "converged dual bound",
                   name(),
                   relPrimal);
      return finish(SolverStatus::Optimal, iter);
    }

    if (ws_.y.size() > 0 &&
        ws_.y.lpNorm<Eigen::Infinity>() > config.divergenceThreshold)
    {
      return finish(SolverStatus::Infeasible, iter);
    }
    double primalSize = 0.0;
    if (ws_.X.size() > 0)
    {
      primalSize = ws_.X.cwiseAbs().maxCoeff();
    }
    if (ws_.f.size() > 0)
    {
      primalSize = std::max(primalSize, ws_.f.lpNorm<Eigen::Infinity>());
    }
    if (ws_.s.size() > 0)
    {
      primalSize = std::max(primalSize, ws_.s.lpNorm<Eigen::Infinity>());
    }
    // Unbounded needs a nearly feasible iterate and a large objective
    if (primalSize > config.divergenceThreshold && relPrimal < loose &&
        primal > std::sqrt(config.divergenceThreshold))
    {
      return finish(SolverStatus::Unbounded, iter);
    }

    // Step 2: Factor the augmented Schur system
    if (!factorKkt(reduced, kktRegularization))
    {
      logger->warn("{}: dual iterate lost positive definiteness", name());
      return finish(dualConverged() ? SolverStatus::Optimal
                                    : SolverStatus::Error,
                    iter);
    }

    // Step 3: Predictor (affine scaling) direction
    const Direction affine = direction(reduced,
                                       0.0,
                                       Eigen::MatrixXd::Zero(reduced.n,
                                                             reduced.n),
                                       Eigen::VectorXd::Zero(reduced.slackCount));
    if (!affine.dy.allFinite() || !affine.df.allFinite() ||
        !affine.dX.allFinite())
    {
      logger->warn("{}: non-finite predictor direction", name());
      return finish(dualConverged() ? SolverStatus::Optimal
                                    : SolverStatus::Error,
                    iter);
    }

    const double alphaPAff =
      std::min({1.0,
                psd::maxStepToBoundary(ws_.X, affine.dX, kInfinity),
                lpStep(ws_.s, affine.ds, kInfinity)});
    const double alphaDAff =
      std::min({1.0,
                psd::maxStepToBoundary(ws_.Z, affine.dZ, kInfinity),
                lpStep(ws_.z, affine.dz, kInfinity)});

    // Step 4: Centering parameter sigma = (mu_aff / mu)^3
    double sigma = 0.0;
    const auto cones = static_cast<double>(reduced.n + reduced.slackCount);
    if (cones > 0.0 && ws_.mu > 0.0)
    {
      const Eigen::MatrixXd xAff = ws_.X + alphaPAff * affine.dX;
      const Eigen::MatrixXd zAff = ws_.Z + alphaDAff * affine.dZ;
      const Eigen::VectorXd sAff = ws_.s + alphaPAff * affine.ds;
      const Eigen::VectorXd zlAff = ws_.z + alphaDAff * affine.dz;
      const double muAff =
        (xAff.cwiseProduct(zAff).sum() + sAff.dot(zlAff)) / cones;
      sigma = std::clamp(std::pow(std::max(muAff, 0.0) / ws_.mu, 3.0), 0.0, 1.0);
    }

    // Step 5: Corrector direction with the second-order term
    const Direction step =
      direction(reduced,
                sigma,
                affine.dX * affine.dZ,
                affine.ds.cwiseProduct(affine.dz));
    if (!step.dy.allFinite() || !step.df.allFinite() || !step.dX.allFinite())
    {
      logger->warn("{}: non-finite corrector direction", name());
      return finish(dualConverged() ? SolverStatus::Optimal
                                    : SolverStatus::Error,
                    iter);
    }

    // Step 6: Damped step lengths, separate for primal and dual
    const double alphaP =
      std::min({1.0,
                tau * psd::maxStepToBoundary(ws_.X, step.dX, kInfinity),
                tau * lpStep(ws_.s, step.ds, kInfinity)});
    const double alphaD =
      std::min({1.0,
                tau * psd::maxStepToBoundary(ws_.Z, step.dZ, kInfinity),
                tau * lpStep(ws_.z, step.dz, kInfinity)});

    if (std::max(alphaP, alphaD) < kStallStep)
    {
      if (dualConverged())
      {
        logger->warn("{}: steps stalled, accepting solution at reduced "
                     "accuracy (pinf {:.2e})",
                     name(),
                     relPrimal);
        return finish(SolverStatus::Optimal, iter);
      }
      logger->warn("{}: steps stalled away from optimality", name());
      return finish(SolverStatus::Error, iter);
    }

    // Step 7: Update
    ws_.X = psd::symmetrize(ws_.X + alphaP * step.dX);
    ws_.f += alphaP * step.df;
    ws_.s += alphaP * step.ds;
    ws_.y += alphaD * step.dy;
    ws_.Z = psd::symmetrize(ws_.Z + alphaD * step.dZ);
    ws_.z += alphaD * step.dz;
  }

  measure();
  if (relPrimal < tol && relDual < tol && relGap < tol)
  {
    return finish(SolverStatus::Optimal, config.maxIterations);
  }
  if (primalStall >= kPrimalStallWindow && dualConverged())
  {
    logger->warn("{}: primal residual stalled at {:.2e}; accepting the "
                 "converged dual bound",
                 name(),
                 relPrimal);
    return finish(SolverStatus::Optimal, config.maxIterations);
  }
  return finish(SolverStatus::IterationLimit, config.maxIterations);
}

}  // namespace pep_engine
