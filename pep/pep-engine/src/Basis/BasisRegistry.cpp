// Ticket: 0001_basis_registry

#include "pep-engine/src/Basis/BasisRegistry.hpp"

#include <algorithm>
#include <atomic>
#include <sstream>

#include "pep-engine/src/Errors/PepErrors.hpp"

namespace pep_engine
{

BasisId BasisRegistry::allocateId()
{
  static std::atomic<BasisId> nextId{0};
  return nextId.fetch_add(1, std::memory_order_relaxed);
}

const BasisVector* BasisRegistry::find(const std::vector<BasisVector>& bases,
                                       BasisId id)
{
  auto it = std::lower_bound(
    bases.begin(),
    bases.end(),
    id,
    [](const BasisVector& basis, BasisId key) { return basis.id < key; });
  if (it == bases.end() || it->id != id)
  {
    return nullptr;
  }
  return &(*it);
}

BasisId BasisRegistry::newPoint()
{
  const BasisId id = allocateId();
  pointBases_.push_back(
    BasisVector{id, pointBases_.size(), BasisKind::Point, std::nullopt});
  return id;
}

BasisId BasisRegistry::newGradient(std::size_t owner)
{
  const BasisId id = allocateId();
  pointBases_.push_back(
    BasisVector{id, pointBases_.size(), BasisKind::Gradient, owner});
  return id;
}

BasisId BasisRegistry::newValue(std::size_t owner)
{
  const BasisId id = allocateId();
  valueBases_.push_back(
    BasisVector{id, valueBases_.size(), BasisKind::Value, owner});
  return id;
}

bool BasisRegistry::containsPoint(BasisId id) const
{
  return find(pointBases_, id) != nullptr;
}

bool BasisRegistry::containsValue(BasisId id) const
{
  return find(valueBases_, id) != nullptr;
}

const BasisVector& BasisRegistry::pointBasis(BasisId id) const
{
  const BasisVector* basis = find(pointBases_, id);
  if (basis == nullptr)
  {
    std::ostringstream oss;
    oss << "BasisRegistry::pointBasis: point basis " << id
        << " is not registered with this problem";
    throw UnresolvedReferenceError{oss.str()};
  }
  return *basis;
}

const BasisVector& BasisRegistry::valueBasis(BasisId id) const
{
  const BasisVector* basis = find(valueBases_, id);
  if (basis == nullptr)
  {
    std::ostringstream oss;
    oss << "BasisRegistry::valueBasis: value basis " << id
        << " is not registered with this problem";
    throw UnresolvedReferenceError{oss.str()};
  }
  return *basis;
}

void BasisRegistry::clear()
{
  pointBases_.clear();
  valueBases_.clear();
}

}  // namespace pep_engine
