// Ticket: 0009_primitive_steps

#ifndef PEP_ENGINE_STEPS_PRIMITIVE_STEPS_HPP
#define PEP_ENGINE_STEPS_PRIMITIVE_STEPS_HPP

#include <vector>

#include "pep-engine/src/Functions/FunctionHandle.hpp"
#include "pep-engine/src/Problem/Problem.hpp"
#include "pep-engine/src/Symbolic/Expression.hpp"
#include "pep-engine/src/Symbolic/Point.hpp"

namespace pep_engine
{

/// Output of a proximal step: x and the (g, f) recorded on the function at x
struct StepResult
{
  Point point;
  Point gradient;
  Expression value;
};

/**
 * @brief Output of a Bregman step
 *
 * `mirrorGradient` is the subgradient s_x of the mirror map at `point` and
 * `mirrorValue` the sum of the mirror map components' values there.
 */
struct BregmanStepResult
{
  Point point;
  Point mirrorGradient;
  Expression mirrorValue;
};

/**
 * @brief Fresh point x_s with 0 in the subdifferential of sum_k f_k at x_s
 *
 * Every function except the last is queried at x_s; the last one receives
 * the gradient -sum of the others, so the stationarity condition is carried
 * by the oracle triples and enforced through interpolation.
 *
 * @throws std::invalid_argument for an empty or repeated list, or when the
 *         last function already holds a triple at x_s (it is the kernel of
 *         another function in the list; put it earlier)
 */
Point stationaryPoint(Problem& problem,
                      const std::vector<FunctionHandle>& functions);

/**
 * @brief x = prox_{gamma f}(x0), encoded as x = x0 - gamma g with (x, g, f(x))
 * recorded on `function`
 * @throws std::invalid_argument if gamma <= 0
 */
StepResult proximalStep(Problem& problem,
                        const Point& x0,
                        FunctionHandle function,
                        double gamma);

/**
 * @brief Mirror descent step with mirror map h = sum of `mirrorMap`
 *
 * x solves s_x = sx0 - gamma gx0 with s_x in the subdifferential of h at x,
 * where sx0 is a subgradient of h at the previous iterate.
 *
 * @throws std::invalid_argument if gamma <= 0 or for an invalid mirror map
 */
BregmanStepResult bregmanGradientStep(Problem& problem,
                                      const Point& gx0,
                                      const Point& sx0,
                                      const std::vector<FunctionHandle>& mirrorMap,
                                      double gamma);

/**
 * @brief Bregman proximal step: x minimizes gamma f(u) + D_h(u, x0)
 *
 * Fresh (g, f) for `function`, s_x = sx0 - gamma g given to the mirror map at
 * x, and (x, g, f) recorded on `function`. The triple of `function` is
 * available afterwards through Problem::oracle(function, result.point).
 *
 * @throws std::invalid_argument if gamma <= 0 or for an invalid mirror map
 */
BregmanStepResult bregmanProximalStep(Problem& problem,
                                      const Point& sx0,
                                      const std::vector<FunctionHandle>& mirrorMap,
                                      FunctionHandle function,
                                      double gamma);

}  // namespace pep_engine

#endif  // PEP_ENGINE_STEPS_PRIMITIVE_STEPS_HPP
