// Ticket: 0002_symbolic_algebra

#include "pep-engine/src/Symbolic/Point.hpp"

#include <utility>

namespace pep_engine
{

Point::Point(Terms terms) : terms_{std::move(terms)}
{
  std::erase_if(terms_, [](const auto& term) { return term.second == 0.0; });
}

Point Point::basis(BasisId id)
{
  return Point{Terms{{id, 1.0}}};
}

double Point::coefficient(BasisId id) const
{
  auto it = terms_.find(id);
  return it == terms_.end() ? 0.0 : it->second;
}

bool Point::isLeaf() const
{
  return terms_.size() == 1 && terms_.begin()->second == 1.0;
}

}  // namespace pep_engine
