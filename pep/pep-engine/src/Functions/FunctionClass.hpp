// Ticket: 0003_function_class_interpolation

#ifndef PEP_ENGINE_FUNCTIONS_FUNCTION_CLASS_HPP
#define PEP_ENGINE_FUNCTIONS_FUNCTION_CLASS_HPP

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <variant>

#include "pep-engine/src/Functions/FunctionHandle.hpp"

namespace pep_engine
{

/// Closed proper convex functions
struct ConvexParams
{
};

/// Convex functions with L-Lipschitz gradient
struct SmoothConvexParams
{
  double L{1.0};
};

/// mu-strongly convex functions
struct StronglyConvexParams
{
  double mu{0.0};
};

/// mu-strongly convex functions with L-Lipschitz gradient, 0 <= mu < L
struct SmoothStronglyConvexParams
{
  double L{1.0};
  double mu{0.0};
};

/// Indicator of a closed convex set of diameter D (infinite by default)
struct ConvexIndicatorParams
{
  double D{std::numeric_limits<double>::infinity()};
};

/**
 * @brief L-smooth relative to a convex kernel h
 *
 * Lh - f is convex. The kernel is another function declared on the same
 * problem, before this one.
 */
struct RelativelySmoothParams
{
  double L{1.0};
  FunctionHandle kernel;
};

/**
 * @brief Tagged variant over the supported function classes
 *
 * The set is closed: adding a class means adding an alternative here and a
 * rule generator in InterpolationRules.cpp.
 *
 * @ticket 0003_function_class_interpolation
 */
using FunctionClassParams = std::variant<ConvexParams,
                                         SmoothConvexParams,
                                         StronglyConvexParams,
                                         SmoothStronglyConvexParams,
                                         ConvexIndicatorParams,
                                         RelativelySmoothParams>;

/// Short class name used in diagnostics, e.g. "smooth_convex(L=1)"
[[nodiscard]] std::string describe(const FunctionClassParams& params);

/**
 * @brief Number of interpolation constraints generated per ordered pair
 *
 * 1 for every class except the finite-diameter indicator and relative
 * smoothness, which generate 2.
 */
[[nodiscard]] std::size_t constraintsPerPair(const FunctionClassParams& params);

/// False for indicators, whose value on the feasible set is the constant 0
[[nodiscard]] bool hasValueBasis(const FunctionClassParams& params);

/// Kernel of a relatively smooth class; empty for every other class
[[nodiscard]] std::optional<FunctionHandle> kernelOf(
  const FunctionClassParams& params);

/**
 * @brief Validate class parameters
 * @throws std::invalid_argument for L <= 0, mu < 0, mu >= L (smooth strongly
 *         convex), negative or NaN diameter
 */
void validate(const FunctionClassParams& params);

}  // namespace pep_engine

#endif  // PEP_ENGINE_FUNCTIONS_FUNCTION_CLASS_HPP
