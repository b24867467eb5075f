// Ticket: 0003_function_class_interpolation

#ifndef PEP_ENGINE_FUNCTIONS_FUNCTION_HPP
#define PEP_ENGINE_FUNCTIONS_FUNCTION_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "pep-engine/src/Functions/FunctionClass.hpp"
#include "pep-engine/src/Functions/FunctionHandle.hpp"
#include "pep-engine/src/Symbolic/Expression.hpp"
#include "pep-engine/src/Symbolic/Point.hpp"

namespace pep_engine
{

/**
 * @brief One oracle sample (x, g, f) of a function
 *
 * g is a (sub)gradient of the function at x and f its value. For indicators
 * f is the constant zero Expression.
 */
struct OracleTriple
{
  Point point;
  Point gradient;
  Expression value;
};

/**
 * @brief A declared function: its class parameters and the ordered list of
 * oracle triples recorded on it
 *
 * Function does not allocate bases itself. Problem owns the registry and
 * decides when a fresh triple is needed; Function only memoizes by
 * structural Point equality and keeps the recording order, which fixes the
 * pair order of the interpolation constraints.
 *
 * @ticket 0003_function_class_interpolation
 */
class Function
{
public:
  Function(FunctionHandle handle, FunctionClassParams params);

  [[nodiscard]] FunctionHandle handle() const
  {
    return handle_;
  }

  [[nodiscard]] const FunctionClassParams& params() const
  {
    return params_;
  }

  [[nodiscard]] const std::vector<OracleTriple>& triples() const
  {
    return triples_;
  }

  /// Index of the triple recorded at a structurally equal point, if any
  [[nodiscard]] std::optional<std::size_t> find(const Point& point) const;

  /**
   * @brief Append a triple
   * @pre No triple is recorded at a structurally equal point
   * @return Reference to the stored triple (invalidated by the next record)
   */
  const OracleTriple& record(OracleTriple triple);

  void clearTriples()
  {
    triples_.clear();
  }

private:
  FunctionHandle handle_;
  FunctionClassParams params_;
  std::vector<OracleTriple> triples_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_FUNCTIONS_FUNCTION_HPP
