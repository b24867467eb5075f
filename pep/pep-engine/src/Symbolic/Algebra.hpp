// Ticket: 0002_symbolic_algebra

#ifndef PEP_ENGINE_SYMBOLIC_ALGEBRA_HPP
#define PEP_ENGINE_SYMBOLIC_ALGEBRA_HPP

#include <vector>

#include "pep-engine/src/Symbolic/Expression.hpp"
#include "pep-engine/src/Symbolic/Point.hpp"

namespace pep_engine
{

/**
 * @file Algebra.hpp
 * @brief Explicit constructor functions of the symbolic algebra
 *
 * Every function is pure and returns a new immutable value. The closure
 * property is enforced here: the only degree-raising operation is
 * innerProduct(Point, Point), which yields bilinear terms. Any attempt to
 * multiply two non-constant scalars throws DegreeError.
 *
 * @ticket 0002_symbolic_algebra
 */

// ===== Points =====

/// The origin
[[nodiscard]] Point zeroPoint();

[[nodiscard]] Point addPoints(const Point& a, const Point& b);
[[nodiscard]] Point subtractPoints(const Point& a, const Point& b);
[[nodiscard]] Point scalePoint(const Point& p, double factor);
[[nodiscard]] Point negatePoint(const Point& p);

/// Sum of an arbitrary number of Points (the origin when empty)
[[nodiscard]] Point sumPoints(const std::vector<Point>& points);

/**
 * @brief Scale a Point by a scalar Expression
 * @throws DegreeError if `factor` is not a pure constant
 */
[[nodiscard]] Point scalePointBy(const Point& p, const Expression& factor);

// ===== Expressions =====

[[nodiscard]] Expression constantExpression(double value);

[[nodiscard]] Expression addExpressions(const Expression& a,
                                        const Expression& b);
[[nodiscard]] Expression subtractExpressions(const Expression& a,
                                             const Expression& b);
[[nodiscard]] Expression scaleExpression(const Expression& e, double factor);
[[nodiscard]] Expression negateExpression(const Expression& e);

/// Sum of an arbitrary number of Expressions (zero when empty)
[[nodiscard]] Expression sumExpressions(const std::vector<Expression>& terms);

/**
 * @brief Product of two scalar Expressions
 *
 * Allowed only when at least one operand is a pure constant, which keeps the
 * result affine in (G, F).
 *
 * @throws DegreeError if both operands depend on a basis
 */
[[nodiscard]] Expression multiply(const Expression& a, const Expression& b);

/**
 * @brief Bilinear form ⟨a, b⟩
 *
 * Expands both decompositions and accumulates each product of coefficients
 * on the canonical pair of bases, so ⟨a, b⟩ and ⟨b, a⟩ are identical.
 */
[[nodiscard]] Expression innerProduct(const Point& a, const Point& b);

/// ⟨p, p⟩
[[nodiscard]] Expression squaredNorm(const Point& p);

}  // namespace pep_engine

#endif  // PEP_ENGINE_SYMBOLIC_ALGEBRA_HPP
