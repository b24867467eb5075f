// Ticket: 0003_function_class_interpolation

#ifndef PEP_ENGINE_FUNCTIONS_FUNCTION_HANDLE_HPP
#define PEP_ENGINE_FUNCTIONS_FUNCTION_HANDLE_HPP

#include <cstddef>

namespace pep_engine
{

/**
 * @brief Opaque reference to a function declared on a Problem
 *
 * The index is the declaration order. Handles stay valid across
 * Problem::reset().
 */
struct FunctionHandle
{
  std::size_t index{0};

  bool operator==(const FunctionHandle&) const = default;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_FUNCTIONS_FUNCTION_HANDLE_HPP
