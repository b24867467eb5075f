// Ticket: 0005_problem_orchestrator

#ifndef PEP_ENGINE_PROBLEM_PROBLEM_HPP
#define PEP_ENGINE_PROBLEM_PROBLEM_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "pep-engine/src/Basis/BasisRegistry.hpp"
#include "pep-engine/src/Functions/Function.hpp"
#include "pep-engine/src/Functions/FunctionClass.hpp"
#include "pep-engine/src/Functions/FunctionHandle.hpp"
#include "pep-engine/src/Problem/ConstraintLedger.hpp"
#include "pep-engine/src/Problem/SdpLowering.hpp"
#include "pep-engine/src/Problem/SolveResult.hpp"
#include "pep-engine/src/Solver/SdpSolverAdapter.hpp"
#include "pep-engine/src/Solver/SolverConfig.hpp"
#include "pep-engine/src/Symbolic/Constraint.hpp"
#include "pep-engine/src/Symbolic/Expression.hpp"
#include "pep-engine/src/Symbolic/Point.hpp"

namespace pep_engine
{

/// (gradient, value) returned by an oracle call
struct OracleResult
{
  Point gradient;
  Expression value;
};

/**
 * @brief A performance-estimation problem: declarations, oracle bookkeeping,
 * lowering to an SDP and solving
 *
 * Typical use:
 * @code
 * Problem problem;
 * FunctionHandle f = problem.declareFunction(SmoothConvexParams{1.0});
 * Point xs = stationaryPoint(problem, {f});
 * Expression fs = problem.value(f, xs);
 * Point x0 = problem.setInitialPoint();
 * problem.setInitialCondition(leq(squaredNorm(subtractPoints(x0, xs)), 1.0));
 * Point x1 = subtractPoints(x0, problem.gradient(f, x0));
 * problem.setPerformanceMetric(subtractExpressions(problem.value(f, x1), fs));
 * SolveResult result = problem.solve();
 * @endcode
 *
 * **Lifecycle**: once solve() has been called, every declaration, oracle
 * call, constraint and a second solve() throw std::logic_error until
 * reset() is called. reset() clears bases, triples, constraints, metrics and
 * the initial point; declared functions keep their handles and classes.
 *
 * **Memoization**: oracle() on a structurally equal Point returns the same
 * gradient and value without allocating bases.
 *
 * Thread safety: not thread-safe.
 *
 * @ticket 0005_problem_orchestrator
 */
class Problem
{
public:
  /// Problem logging through the shared "pep" logger
  Problem();

  /// Problem logging through an injected logger
  explicit Problem(std::shared_ptr<spdlog::logger> logger);

  ~Problem() = default;

  Problem(const Problem&) = delete;
  Problem& operator=(const Problem&) = delete;
  Problem(Problem&&) noexcept = default;
  Problem& operator=(Problem&&) noexcept = default;

  // ===== Declarations =====

  /**
   * @brief Declare a function of the given class
   * @throws std::invalid_argument for invalid class parameters or a kernel
   *         that is not an already declared function
   */
  FunctionHandle declareFunction(FunctionClassParams params);

  /**
   * @brief Create a fresh free point and remember it as the initial point
   *
   * May be called more than once; each call returns a new point and the
   * latest one is stored.
   */
  Point setInitialPoint();

  /// Fresh free point (step outputs, minimizers)
  Point newPoint();

  /// Fresh gradient basis owned by `function`
  Point newGradient(FunctionHandle function);

  /// Fresh value basis owned by `function`; zero for indicators
  Expression newValue(FunctionHandle function);

  void setInitialCondition(Constraint constraint);

  void addConstraint(Constraint constraint);

  /**
   * @brief Add a quantity to maximize in the worst case
   *
   * With several metrics the worst case of their minimum is computed.
   */
  void setPerformanceMetric(Expression metric);

  // ===== Oracle =====

  /**
   * @brief First-order oracle of `function` at `point`
   *
   * Memoized. A fresh call allocates a gradient basis and, except for
   * indicators, a value basis. For a relatively smooth function the kernel
   * is queried at the same point.
   *
   * @throws UnresolvedReferenceError for an unknown handle or Point
   * @throws std::logic_error after solve()
   */
  OracleResult oracle(FunctionHandle function, const Point& point);

  Point gradient(FunctionHandle function, const Point& point);

  Expression value(FunctionHandle function, const Point& point);

  /**
   * @brief Record an externally built triple (implicit optimality conditions)
   *
   * If `function` already holds a triple at `point`, that triple is returned
   * and the arguments are ignored.
   *
   * @throws std::invalid_argument if `value` is non-zero for an indicator
   */
  OracleResult recordTriple(FunctionHandle function,
                            const Point& point,
                            const Point& gradient,
                            const Expression& value);

  // ===== Lowering and solving =====

  /**
   * @brief Lower the current problem without mutating it
   * @throws std::logic_error without a performance metric
   */
  [[nodiscard]] LoweredProblem lower() const;

  /// Solve with the built-in interior-point backend
  SolveResult solve(const SolveOptions& options = SolveOptions{});

  /**
   * @brief Solve with a caller-supplied backend
   *
   * @throws InfeasibleError for an infeasible or unbounded program
   * @throws SolverFailure for any other non-optimal status
   * @throws std::logic_error when already solved or without a metric
   */
  SolveResult solve(const SolveOptions& options, SdpSolverAdapter& adapter);

  /// Back to an empty problem over the same declared functions
  void reset();

  // ===== Inspection =====

  [[nodiscard]] const Function& function(FunctionHandle handle) const;

  [[nodiscard]] std::size_t functionCount() const
  {
    return functions_.size();
  }

  [[nodiscard]] const BasisRegistry& registry() const
  {
    return registry_;
  }

  [[nodiscard]] const ConstraintLedger& ledger() const
  {
    return ledger_;
  }

  [[nodiscard]] const std::optional<Point>& initialPoint() const
  {
    return initialPoint_;
  }

  [[nodiscard]] bool isSolved() const
  {
    return solved_;
  }

  [[nodiscard]] std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

private:
  void requireOpen(const char* operation) const;

  Function& resolve(FunctionHandle handle);

  void checkReferences(const Point& point) const;
  void checkReferences(const Expression& expression) const;

  /// Query the kernel of a relatively smooth function at `point`
  void queryKernel(const Function& function, const Point& point);

  std::shared_ptr<spdlog::logger> logger_;
  BasisRegistry registry_;
  std::vector<Function> functions_;
  ConstraintLedger ledger_;
  std::optional<Point> initialPoint_;
  bool solved_{false};
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_PROBLEM_PROBLEM_HPP
