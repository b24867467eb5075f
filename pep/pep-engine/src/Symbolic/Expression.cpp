// Ticket: 0002_symbolic_algebra

#include "pep-engine/src/Symbolic/Expression.hpp"

#include <utility>

namespace pep_engine
{

Expression::Expression(LinearTerms linear,
                       BilinearTerms bilinear,
                       double constant)
  : linear_{std::move(linear)},
    bilinear_{std::move(bilinear)},
    constant_{constant}
{
  std::erase_if(linear_, [](const auto& term) { return term.second == 0.0; });
  std::erase_if(bilinear_,
                [](const auto& term) { return term.second == 0.0; });
}

Expression Expression::constant(double value)
{
  return Expression{LinearTerms{}, BilinearTerms{}, value};
}

Expression Expression::basis(BasisId valueId)
{
  return Expression{LinearTerms{{valueId, 1.0}}, BilinearTerms{}, 0.0};
}

double Expression::linearCoefficient(BasisId id) const
{
  auto it = linear_.find(id);
  return it == linear_.end() ? 0.0 : it->second;
}

double Expression::bilinearCoefficient(BasisId a, BasisId b) const
{
  auto it = bilinear_.find(makeBasisPair(a, b));
  return it == bilinear_.end() ? 0.0 : it->second;
}

}  // namespace pep_engine
