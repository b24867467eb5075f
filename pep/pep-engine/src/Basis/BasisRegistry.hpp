// Ticket: 0001_basis_registry

#ifndef PEP_ENGINE_BASIS_BASIS_REGISTRY_HPP
#define PEP_ENGINE_BASIS_BASIS_REGISTRY_HPP

#include <cstddef>
#include <vector>

#include "pep-engine/src/Basis/BasisVector.hpp"

namespace pep_engine
{

/**
 * @brief Allocates the fresh basis vectors a performance-estimation problem
 * is expressed in
 *
 * The registry owns two independent dense index spaces:
 * - point-space bases (free points and oracle gradients), which become the
 *   rows and columns of the Gram matrix G
 * - value bases (oracle function values), which become the entries of F
 *
 * Each basis also receives an id drawn from a process-wide counter. Symbolic
 * objects store ids, and the registry translates them back to dense rows at
 * lowering time. An id the registry did not allocate (stale after clear(),
 * or owned by another registry) fails to resolve.
 *
 * Thread safety: id allocation is atomic; everything else is not
 * thread-safe. A registry belongs to exactly one Problem.
 *
 * @ticket 0001_basis_registry
 */
class BasisRegistry
{
public:
  BasisRegistry() = default;
  ~BasisRegistry() = default;

  BasisRegistry(const BasisRegistry&) = default;
  BasisRegistry& operator=(const BasisRegistry&) = default;
  BasisRegistry(BasisRegistry&&) noexcept = default;
  BasisRegistry& operator=(BasisRegistry&&) noexcept = default;

  /**
   * @brief Create a free point basis (initial iterate, minimizer, step output)
   * @return Id of the new basis
   */
  BasisId newPoint();

  /**
   * @brief Create a gradient basis owned by a declared function
   * @param owner Index of the function whose oracle produced the gradient
   * @return Id of the new basis
   */
  BasisId newGradient(std::size_t owner);

  /**
   * @brief Create a function-value basis owned by a declared function
   * @param owner Index of the function whose oracle produced the value
   * @return Id of the new basis
   */
  BasisId newValue(std::size_t owner);

  /// Number of point-space bases (Gram dimension n)
  [[nodiscard]] std::size_t pointDimension() const
  {
    return pointBases_.size();
  }

  /// Number of value bases (F dimension m)
  [[nodiscard]] std::size_t valueDimension() const
  {
    return valueBases_.size();
  }

  [[nodiscard]] bool containsPoint(BasisId id) const;
  [[nodiscard]] bool containsValue(BasisId id) const;

  /**
   * @brief Look up a point-space basis
   * @throws UnresolvedReferenceError if this registry never allocated the id
   */
  [[nodiscard]] const BasisVector& pointBasis(BasisId id) const;

  /**
   * @brief Look up a value basis
   * @throws UnresolvedReferenceError if this registry never allocated the id
   */
  [[nodiscard]] const BasisVector& valueBasis(BasisId id) const;

  /// Gram row of a point-space basis; throws like pointBasis()
  [[nodiscard]] std::size_t pointRow(BasisId id) const
  {
    return pointBasis(id).row;
  }

  /// F slot of a value basis; throws like valueBasis()
  [[nodiscard]] std::size_t valueRow(BasisId id) const
  {
    return valueBasis(id).row;
  }

  [[nodiscard]] const std::vector<BasisVector>& pointBases() const
  {
    return pointBases_;
  }

  [[nodiscard]] const std::vector<BasisVector>& valueBases() const
  {
    return valueBases_;
  }

  /// Drop every basis. Ids handed out earlier stop resolving.
  void clear();

private:
  static BasisId allocateId();

  // Both vectors are sorted by id because ids grow monotonically
  static const BasisVector* find(const std::vector<BasisVector>& bases,
                                 BasisId id);

  std::vector<BasisVector> pointBases_;
  std::vector<BasisVector> valueBases_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_BASIS_BASIS_REGISTRY_HPP
