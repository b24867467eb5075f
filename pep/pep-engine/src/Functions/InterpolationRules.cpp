// Ticket: 0003_function_class_interpolation

#include "pep-engine/src/Functions/InterpolationRules.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "pep-engine/src/Errors/PepErrors.hpp"
#include "pep-engine/src/Symbolic/Algebra.hpp"

namespace pep_engine
{

namespace
{

Constraint ruleConstraint(const Expression& expression, const char* rule)
{
  Constraint constraint = leq(expression, 0.0);
  constraint.tag.origin = ConstraintOrigin::Interpolation;
  constraint.tag.rule = rule;
  return constraint;
}

}  // namespace

Expression InterpolationRules::convexityGap(const OracleTriple& ti,
                                            const OracleTriple& tj)
{
  // f_j - f_i + <g_j, x_i - x_j>
  const Point dx = subtractPoints(ti.point, tj.point);
  return addExpressions(subtractExpressions(tj.value, ti.value),
                        innerProduct(tj.gradient, dx));
}

std::vector<Constraint> InterpolationRules::interpolatePair(
  const FunctionClassParams& params,
  const OracleTriple& ti,
  const OracleTriple& tj,
  const OracleTriple* kernelI,
  const OracleTriple* kernelJ)
{
  std::vector<Constraint> constraints;
  constraints.reserve(constraintsPerPair(params));

  const Point dx = subtractPoints(ti.point, tj.point);
  const Point dg = subtractPoints(ti.gradient, tj.gradient);

  if (std::holds_alternative<ConvexParams>(params))
  {
    constraints.push_back(ruleConstraint(convexityGap(ti, tj), "convex"));
  }
  else if (const auto* smooth = std::get_if<SmoothConvexParams>(&params))
  {
    const Expression expr = addExpressions(
      convexityGap(ti, tj), scaleExpression(squaredNorm(dg), 0.5 / smooth->L));
    constraints.push_back(ruleConstraint(expr, "smooth_convex"));
  }
  else if (const auto* strong = std::get_if<StronglyConvexParams>(&params))
  {
    const Expression expr = addExpressions(
      convexityGap(ti, tj), scaleExpression(squaredNorm(dx), 0.5 * strong->mu));
    constraints.push_back(ruleConstraint(expr, "strongly_convex"));
  }
  else if (const auto* both = std::get_if<SmoothStronglyConvexParams>(&params))
  {
    const double L = both->L;
    const double mu = both->mu;
    const Point shifted = subtractPoints(dx, scalePoint(dg, 1.0 / L));
    const Expression expr = sumExpressions(
      {convexityGap(ti, tj),
       scaleExpression(squaredNorm(dg), 0.5 / L),
       scaleExpression(squaredNorm(shifted), mu / (2.0 * (1.0 - mu / L)))});
    constraints.push_back(ruleConstraint(expr, "smooth_strongly_convex"));
  }
  else if (const auto* indicator = std::get_if<ConvexIndicatorParams>(&params))
  {
    constraints.push_back(
      ruleConstraint(innerProduct(tj.gradient, dx), "indicator_normal_cone"));
    if (!std::isinf(indicator->D))
    {
      const Expression expr = subtractExpressions(
        squaredNorm(dx), constantExpression(indicator->D * indicator->D));
      constraints.push_back(ruleConstraint(expr, "indicator_diameter"));
    }
  }
  else if (const auto* relative = std::get_if<RelativelySmoothParams>(&params))
  {
    if (kernelI == nullptr || kernelJ == nullptr)
    {
      throw std::invalid_argument{
        "InterpolationRules::interpolatePair: relative smoothness needs the "
        "kernel triples at both points"};
    }
    constraints.push_back(
      ruleConstraint(convexityGap(ti, tj), "relative_convexity"));

    // D_h(x_i, x_j) = h_i - h_j - <gh_j, x_i - x_j>
    const Expression bregman =
      subtractExpressions(subtractExpressions(kernelI->value, kernelJ->value),
                          innerProduct(kernelJ->gradient, dx));
    // f_i - f_j - <g_j, dx> - L D_h(x_i, x_j)
    const Expression descent =
      subtractExpressions(negateExpression(convexityGap(ti, tj)),
                          scaleExpression(bregman, relative->L));
    constraints.push_back(ruleConstraint(descent, "relative_descent"));
  }

  return constraints;
}

std::vector<Constraint> InterpolationRules::generate(
  const Function& function,
  const std::vector<Function>& functions)
{
  const auto& triples = function.triples();
  const std::size_t m = triples.size();
  const std::size_t perPair = constraintsPerPair(function.params());

  std::vector<const OracleTriple*> kernelTriples(m, nullptr);
  if (const auto kernel = kernelOf(function.params()))
  {
    if (kernel->index >= functions.size())
    {
      std::ostringstream oss;
      oss << "InterpolationRules::generate: kernel f" << kernel->index
          << " of f" << function.handle().index << " is not declared";
      throw UnresolvedReferenceError{oss.str()};
    }
    const Function& kernelFunction = functions[kernel->index];
    for (std::size_t k = 0; k < m; ++k)
    {
      const auto position = kernelFunction.find(triples[k].point);
      if (!position)
      {
        std::ostringstream oss;
        oss << "InterpolationRules::generate: kernel f" << kernel->index
            << " has no oracle triple at point " << k << " of f"
            << function.handle().index;
        throw UnresolvedReferenceError{oss.str()};
      }
      kernelTriples[k] = &kernelFunction.triples()[*position];
    }
  }

  std::vector<Constraint> constraints;
  constraints.reserve(perPair * m * (m > 0 ? m - 1 : 0));

  for (std::size_t i = 0; i < m; ++i)
  {
    for (std::size_t j = 0; j < m; ++j)
    {
      if (i == j)
      {
        continue;
      }
      for (auto& constraint : interpolatePair(function.params(),
                                              triples[i],
                                              triples[j],
                                              kernelTriples[i],
                                              kernelTriples[j]))
      {
        constraint.tag.function = function.handle().index;
        constraint.tag.i = i;
        constraint.tag.j = j;
        constraints.push_back(std::move(constraint));
      }
    }
  }

  return constraints;
}

}  // namespace pep_engine
