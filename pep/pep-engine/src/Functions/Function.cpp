// Ticket: 0003_function_class_interpolation

#include "pep-engine/src/Functions/Function.hpp"

#include <utility>

namespace pep_engine
{

Function::Function(FunctionHandle handle, FunctionClassParams params)
  : handle_{handle}, params_{std::move(params)}
{
}

std::optional<std::size_t> Function::find(const Point& point) const
{
  for (std::size_t k = 0; k < triples_.size(); ++k)
  {
    if (triples_[k].point == point)
    {
      return k;
    }
  }
  return std::nullopt;
}

const OracleTriple& Function::record(OracleTriple triple)
{
  triples_.push_back(std::move(triple));
  return triples_.back();
}

}  // namespace pep_engine
