// Ticket: 0009_primitive_steps

#include "pep-engine/src/Steps/PrimitiveSteps.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "pep-engine/src/Symbolic/Algebra.hpp"

namespace pep_engine
{

namespace
{

void requirePositiveStep(const char* step, double gamma)
{
  if (!(gamma > 0.0))
  {
    std::ostringstream oss;
    oss << step << ": step size must be positive, got " << gamma;
    throw std::invalid_argument{oss.str()};
  }
}

void requireDistinct(const char* step,
                     const std::vector<FunctionHandle>& functions)
{
  if (functions.empty())
  {
    std::ostringstream oss;
    oss << step << ": at least one function is required";
    throw std::invalid_argument{oss.str()};
  }
  for (auto it = functions.begin(); it != functions.end(); ++it)
  {
    if (std::find(std::next(it), functions.end(), *it) != functions.end())
    {
      std::ostringstream oss;
      oss << step << ": f" << it->index << " appears more than once";
      throw std::invalid_argument{oss.str()};
    }
  }
}

/**
 * Give `total` as the subgradient of sum_k f_k at `x`: all components but the
 * last are queried, the last records the residual. Returns sum_k f_k(x).
 */
Expression distributeSubgradient(Problem& problem,
                                 const char* step,
                                 const std::vector<FunctionHandle>& functions,
                                 const Point& x,
                                 const Point& total)
{
  std::vector<Point> gradients;
  std::vector<Expression> values;
  gradients.reserve(functions.size());
  values.reserve(functions.size());

  // Step 1: Query every component except the last
  for (std::size_t k = 0; k + 1 < functions.size(); ++k)
  {
    OracleResult result = problem.oracle(functions[k], x);
    gradients.push_back(std::move(result.gradient));
    values.push_back(std::move(result.value));
  }

  // Step 2: The last component carries the residual
  const FunctionHandle last = functions.back();
  if (problem.function(last).find(x))
  {
    std::ostringstream oss;
    oss << step << ": f" << last.index
        << " was already queried at the new point (it is the kernel of an "
           "earlier function); list it before that function";
    throw std::invalid_argument{oss.str()};
  }
  const Point residual = subtractPoints(total, sumPoints(gradients));
  const OracleResult recorded =
    problem.recordTriple(last, x, residual, problem.newValue(last));
  values.push_back(recorded.value);

  return sumExpressions(values);
}

}  // namespace

Point stationaryPoint(Problem& problem,
                      const std::vector<FunctionHandle>& functions)
{
  requireDistinct("stationaryPoint", functions);

  Point xs = problem.newPoint();
  static_cast<void>(
    distributeSubgradient(problem, "stationaryPoint", functions, xs, zeroPoint()));
  problem.getLogger()->debug("Stationary point of {} function(s)",
                             functions.size());
  return xs;
}

StepResult proximalStep(Problem& problem,
                        const Point& x0,
                        FunctionHandle function,
                        double gamma)
{
  requirePositiveStep("proximalStep", gamma);

  Point g = problem.newGradient(function);
  Expression f = problem.newValue(function);
  Point x = subtractPoints(x0, scalePoint(g, gamma));
  const OracleResult recorded = problem.recordTriple(function, x, g, f);
  return StepResult{std::move(x), recorded.gradient, recorded.value};
}

BregmanStepResult bregmanGradientStep(Problem& problem,
                                      const Point& gx0,
                                      const Point& sx0,
                                      const std::vector<FunctionHandle>& mirrorMap,
                                      double gamma)
{
  requirePositiveStep("bregmanGradientStep", gamma);
  requireDistinct("bregmanGradientStep", mirrorMap);

  Point x = problem.newPoint();
  Point sx = subtractPoints(sx0, scalePoint(gx0, gamma));
  Expression hx =
    distributeSubgradient(problem, "bregmanGradientStep", mirrorMap, x, sx);
  return BregmanStepResult{std::move(x), std::move(sx), std::move(hx)};
}

BregmanStepResult bregmanProximalStep(Problem& problem,
                                      const Point& sx0,
                                      const std::vector<FunctionHandle>& mirrorMap,
                                      FunctionHandle function,
                                      double gamma)
{
  requirePositiveStep("bregmanProximalStep", gamma);
  requireDistinct("bregmanProximalStep", mirrorMap);
  if (std::find(mirrorMap.begin(), mirrorMap.end(), function) != mirrorMap.end())
  {
    std::ostringstream oss;
    oss << "bregmanProximalStep: f" << function.index
        << " cannot be both the proximal term and part of the mirror map";
    throw std::invalid_argument{oss.str()};
  }

  // Step 1: Unknown subgradient and value of the proximal term
  Point g = problem.newGradient(function);
  Expression f = problem.newValue(function);

  // Step 2: Optimality of x for gamma f + D_h(., x0)
  Point x = problem.newPoint();
  Point sx = subtractPoints(sx0, scalePoint(g, gamma));
  Expression hx =
    distributeSubgradient(problem, "bregmanProximalStep", mirrorMap, x, sx);

  // Step 3: (x, g, f) on the proximal term
  static_cast<void>(problem.recordTriple(function, x, g, f));
  return BregmanStepResult{std::move(x), std::move(sx), std::move(hx)};
}

}  // namespace pep_engine
