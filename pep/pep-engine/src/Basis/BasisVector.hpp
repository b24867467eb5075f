// Ticket: 0001_basis_registry

#ifndef PEP_ENGINE_BASIS_BASIS_VECTOR_HPP
#define PEP_ENGINE_BASIS_BASIS_VECTOR_HPP

#include <cstddef>
#include <optional>

namespace pep_engine
{

/// Process-wide unique identity of a basis vector
using BasisId = std::size_t;

/**
 * @brief What a basis vector stands for
 *
 * Point and Gradient bases share the Gram index space. Value bases live in
 * the separate function-value vector F.
 */
enum class BasisKind
{
  Point,
  Gradient,
  Value
};

/**
 * @brief One abstract leaf of the symbolic algebra
 *
 * A basis vector is created once by BasisRegistry and never mutated. Ids are
 * unique across every registry in the process, so a Point built by one
 * Problem (or before a reset) never aliases a basis of another. The dense
 * `row` is the Gram row (Point, Gradient) or the F slot (Value).
 *
 * @ticket 0001_basis_registry
 */
struct BasisVector
{
  BasisId id{0};
  std::size_t row{0};
  BasisKind kind{BasisKind::Point};
  /// Declaring function index; empty for free points
  std::optional<std::size_t> owner;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_BASIS_BASIS_VECTOR_HPP
