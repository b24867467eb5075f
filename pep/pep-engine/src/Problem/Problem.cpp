// Ticket: 0005_problem_orchestrator

#include "pep-engine/src/Problem/Problem.hpp"

#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "pep-engine/src/Certification/ProofCertifier.hpp"
#include "pep-engine/src/Errors/PepErrors.hpp"
#include "pep-engine/src/Functions/InterpolationRules.hpp"
#include "pep-engine/src/Solver/InteriorPointSdpSolver.hpp"
#include "pep-engine/src/Utils/Logging.hpp"

namespace pep_engine
{

namespace
{

/// @throws SolverFailure when the backend output does not fit the SDP
void checkShape(const SdpProblem& sdp,
                const SdpSolution& solution,
                const std::string& backend)
{
  const Eigen::Index n = sdp.gramSize;
  const auto p = static_cast<Eigen::Index>(sdp.rows.size());
  if (solution.gram.rows() == n && solution.gram.cols() == n &&
      solution.psdDual.rows() == n && solution.psdDual.cols() == n &&
      solution.values.size() == sdp.valueSize &&
      solution.rowDuals.size() == p)
  {
    return;
  }
  std::ostringstream oss;
  oss << "Problem::solve: " << backend << " returned a solution of the wrong "
      << "shape (gram " << solution.gram.rows() << "x" << solution.gram.cols()
      << ", dual " << solution.psdDual.rows() << "x"
      << solution.psdDual.cols() << ", values " << solution.values.size()
      << ", multipliers " << solution.rowDuals.size() << "; expected gram "
      << n << ", values " << sdp.valueSize << ", multipliers " << p << ")";
  throw SolverFailure{oss.str(), SolverStatus::Error};
}

}  // namespace

Problem::Problem() : Problem{makeLogger()}
{
}

Problem::Problem(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"Problem: logger must not be null"};
  }
}

// ===== Declarations =====

FunctionHandle Problem::declareFunction(FunctionClassParams params)
{
  requireOpen("declareFunction");
  validate(params);

  if (const auto kernel = kernelOf(params))
  {
    if (kernel->index >= functions_.size())
    {
      std::ostringstream oss;
      oss << "Problem::declareFunction: kernel f" << kernel->index
          << " must be declared before the relatively smooth function";
      throw std::invalid_argument{oss.str()};
    }
  }

  const FunctionHandle handle{functions_.size()};
  logger_->debug("Declared f{}: {}", handle.index, describe(params));
  functions_.emplace_back(handle, std::move(params));
  return handle;
}

Point Problem::setInitialPoint()
{
  Point x0 = newPoint();
  initialPoint_ = x0;
  return x0;
}

Point Problem::newPoint()
{
  requireOpen("newPoint");
  return Point::basis(registry_.newPoint());
}

Point Problem::newGradient(FunctionHandle function)
{
  requireOpen("newGradient");
  resolve(function);
  return Point::basis(registry_.newGradient(function.index));
}

Expression Problem::newValue(FunctionHandle function)
{
  requireOpen("newValue");
  const Function& fn = resolve(function);
  if (!hasValueBasis(fn.params()))
  {
    return Expression{};
  }
  return Expression::basis(registry_.newValue(function.index));
}

void Problem::setInitialCondition(Constraint constraint)
{
  requireOpen("setInitialCondition");
  checkReferences(constraint.expression);
  ledger_.addInitialCondition(std::move(constraint));
}

void Problem::addConstraint(Constraint constraint)
{
  requireOpen("addConstraint");
  checkReferences(constraint.expression);
  ledger_.addUserConstraint(std::move(constraint));
}

void Problem::setPerformanceMetric(Expression metric)
{
  requireOpen("setPerformanceMetric");
  checkReferences(metric);
  ledger_.addPerformanceMetric(std::move(metric));
}

// ===== Oracle =====

OracleResult Problem::oracle(FunctionHandle function, const Point& point)
{
  requireOpen("oracle");
  checkReferences(point);
  Function& fn = resolve(function);

  if (const auto position = fn.find(point))
  {
    const OracleTriple& triple = fn.triples()[*position];
    return OracleResult{triple.gradient, triple.value};
  }

  OracleResult result{newGradient(function), newValue(function)};
  fn.record(OracleTriple{point, result.gradient, result.value});
  queryKernel(fn, point);
  return result;
}

Point Problem::gradient(FunctionHandle function, const Point& point)
{
  return oracle(function, point).gradient;
}

Expression Problem::value(FunctionHandle function, const Point& point)
{
  return oracle(function, point).value;
}

OracleResult Problem::recordTriple(FunctionHandle function,
                                   const Point& point,
                                   const Point& gradient,
                                   const Expression& value)
{
  requireOpen("recordTriple");
  checkReferences(point);
  checkReferences(gradient);
  checkReferences(value);
  Function& fn = resolve(function);

  if (const auto position = fn.find(point))
  {
    logger_->debug("f{} already holds a triple at this point; keeping it",
                   function.index);
    const OracleTriple& triple = fn.triples()[*position];
    return OracleResult{triple.gradient, triple.value};
  }

  if (!hasValueBasis(fn.params()) && !value.isZero())
  {
    std::ostringstream oss;
    oss << "Problem::recordTriple: f" << function.index
        << " is an indicator and its value must be the zero Expression";
    throw std::invalid_argument{oss.str()};
  }

  fn.record(OracleTriple{point, gradient, value});
  queryKernel(fn, point);
  return OracleResult{gradient, value};
}

void Problem::queryKernel(const Function& function, const Point& point)
{
  if (const auto kernel = kernelOf(function.params()))
  {
    oracle(*kernel, point);
  }
}

// ===== Lowering and solving =====

LoweredProblem Problem::lower() const
{
  if (ledger_.performanceMetrics().empty())
  {
    throw std::logic_error{
      "Problem::lower: a performance metric must be set before lowering"};
  }

  std::vector<Constraint> interpolation;
  std::vector<FunctionDiagnostics> functionDiagnostics;
  functionDiagnostics.reserve(functions_.size());
  for (const auto& fn : functions_)
  {
    std::vector<Constraint> generated =
      InterpolationRules::generate(fn, functions_);
    functionDiagnostics.push_back(FunctionDiagnostics{fn.handle().index,
                                                      describe(fn.params()),
                                                      fn.triples().size(),
                                                      generated.size()});
    interpolation.insert(interpolation.end(),
                         std::make_move_iterator(generated.begin()),
                         std::make_move_iterator(generated.end()));
  }

  LoweredProblem lowered =
    SdpLowering::build(registry_,
                       ledger_.initialConditions(),
                       ledger_.userConstraints(),
                       std::move(interpolation),
                       ledger_.performanceMetrics());
  lowered.diagnostics.functions = std::move(functionDiagnostics);
  return lowered;
}

SolveResult Problem::solve(const SolveOptions& options)
{
  InteriorPointSdpSolver solver;
  return solve(options, solver);
}

SolveResult Problem::solve(const SolveOptions& options,
                           SdpSolverAdapter& adapter)
{
  requireOpen("solve");
  options.solver.validate();
  const ProofCertifier certifier{options.certification};
  const ScopedLogLevel verbosity{logger_,
                                 levelForVerbosity(options.verbosity)};

  // Step 1: Lower and commit the interpolation constraints to the ledger
  LoweredProblem lowered = lower();
  ledger_.setInterpolationConstraints(lowered.interpolationConstraints);
  logger_->info("Setting up the problem:\n{}", lowered.diagnostics.toString());

  // Step 2: Hand the SDP to the backend
  solved_ = true;
  logger_->info("Solving with {}", adapter.name());
  const SdpSolution solution =
    adapter.solve(lowered.sdp, options.solver, logger_);

  if (solution.status == SolverStatus::Infeasible ||
      solution.status == SolverStatus::Unbounded)
  {
    std::ostringstream oss;
    oss << "Problem::solve: " << adapter.name() << " reported "
        << toString(solution.status) << " after " << solution.iterations
        << " iterations";
    throw InfeasibleError{oss.str(), solution.status};
  }
  if (solution.status != SolverStatus::Optimal)
  {
    std::ostringstream oss;
    oss << "Problem::solve: " << adapter.name() << " stopped with status "
        << toString(solution.status) << " after " << solution.iterations
        << " iterations";
    throw SolverFailure{oss.str(), solution.status};
  }

  // Step 3: Check the dual certificate
  checkShape(lowered.sdp, solution, adapter.name());
  CertificationReport report = certifier.certify(lowered.sdp, solution);
  std::optional<CertificationWarning> warning =
    ProofCertifier::toWarning(report);

  logger_->info("Solver status: {} (tau = {:.10g})",
                toString(solution.status),
                solution.primalObjective);
  logger_->info("Primal feasibility: min eig(G) {:.3e}, max violation {:.3e}",
                report.gramMinEigenvalue,
                report.maxPrimalViolation);
  logger_->info("Dual feasibility: min eig(S) {:.3e}, min multiplier {:.3e}",
                report.psdDualMinEigenvalue,
                report.minInequalityDual);
  logger_->info("Proof reconstruction error {:.3e}, duality gap {:.3e}",
                report.reconstructionError,
                report.dualityGap);
  if (warning)
  {
    logger_->warn("{}", warning->message);
  }

  // Step 4: Map multipliers back onto ledger rows
  std::vector<ConstraintDual> duals;
  duals.reserve(lowered.rowTags.size());
  for (std::size_t k = 0; k < lowered.rowTags.size(); ++k)
  {
    duals.push_back(ConstraintDual{
      lowered.rowTags[k], solution.rowDuals(static_cast<Eigen::Index>(k))});
  }

  const auto m = static_cast<Eigen::Index>(registry_.valueDimension());
  return SolveResult{solution.primalObjective,
                     solution.dualObjective,
                     solution.status,
                     solution.solverName,
                     solution.iterations,
                     std::move(lowered.diagnostics),
                     std::move(report),
                     std::move(warning),
                     std::move(duals),
                     solution.gram,
                     solution.values.head(m),
                     registry_};
}

void Problem::reset()
{
  registry_.clear();
  for (auto& fn : functions_)
  {
    fn.clearTriples();
  }
  ledger_.clear();
  initialPoint_.reset();
  solved_ = false;
  logger_->debug("Problem reset; {} declared functions kept",
                 functions_.size());
}

// ===== Inspection =====

const Function& Problem::function(FunctionHandle handle) const
{
  if (handle.index >= functions_.size())
  {
    std::ostringstream oss;
    oss << "Problem::function: f" << handle.index << " is not declared ("
        << functions_.size() << " functions)";
    throw UnresolvedReferenceError{oss.str()};
  }
  return functions_[handle.index];
}

// ===== Helpers =====

void Problem::requireOpen(const char* operation) const
{
  if (solved_)
  {
    std::ostringstream oss;
    oss << "Problem::" << operation
        << ": the problem has been solved; call reset() first";
    throw std::logic_error{oss.str()};
  }
}

Function& Problem::resolve(FunctionHandle handle)
{
  if (handle.index >= functions_.size())
  {
    std::ostringstream oss;
    oss << "Problem: f" << handle.index << " is not declared ("
        << functions_.size() << " functions)";
    throw UnresolvedReferenceError{oss.str()};
  }
  return functions_[handle.index];
}

void Problem::checkReferences(const Point& point) const
{
  for (const auto& [id, coefficient] : point.terms())
  {
    static_cast<void>(registry_.pointBasis(id));
  }
}

void Problem::checkReferences(const Expression& expression) const
{
  for (const auto& [id, coefficient] : expression.linearTerms())
  {
    static_cast<void>(registry_.valueBasis(id));
  }
  for (const auto& [pair, coefficient] : expression.bilinearTerms())
  {
    static_cast<void>(registry_.pointBasis(pair.first));
    static_cast<void>(registry_.pointBasis(pair.second));
  }
}

}  // namespace pep_engine
