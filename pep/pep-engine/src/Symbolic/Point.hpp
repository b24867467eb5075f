// Ticket: 0002_symbolic_algebra

#ifndef PEP_ENGINE_SYMBOLIC_POINT_HPP
#define PEP_ENGINE_SYMBOLIC_POINT_HPP

#include <cstddef>
#include <map>

#include "pep-engine/src/Basis/BasisVector.hpp"

namespace pep_engine
{

/**
 * @brief Symbolic element of the ambient space: a finite linear combination
 * of point-space basis vectors
 *
 * A Point is an immutable value. Its decomposition is an ordered map from
 * basis id to coefficient with zero coefficients removed, so two Points that
 * denote the same combination compare equal and iterate in the same order.
 * The default-constructed Point is the origin.
 *
 * Points are built with basis() and the free functions in Algebra.hpp.
 *
 * @ticket 0002_symbolic_algebra
 */
class Point
{
public:
  using Terms = std::map<BasisId, double>;

  Point() = default;

  /// Build from an explicit decomposition; zero coefficients are dropped
  explicit Point(Terms terms);

  /// Leaf Point consisting of a single basis with coefficient one
  static Point basis(BasisId id);

  [[nodiscard]] const Terms& terms() const
  {
    return terms_;
  }

  /// Coefficient of `id`, zero when absent
  [[nodiscard]] double coefficient(BasisId id) const;

  [[nodiscard]] bool isZero() const
  {
    return terms_.empty();
  }

  /// True when the Point is exactly one basis with coefficient one
  [[nodiscard]] bool isLeaf() const;

  [[nodiscard]] std::size_t size() const
  {
    return terms_.size();
  }

  /// Structural equality of decompositions (used for oracle memoization)
  bool operator==(const Point& other) const = default;

private:
  Terms terms_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_SYMBOLIC_POINT_HPP
