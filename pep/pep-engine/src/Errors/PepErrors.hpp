// Ticket: 0002_symbolic_algebra
// Ticket: 0005_problem_orchestrator

#ifndef PEP_ENGINE_ERRORS_PEP_ERRORS_HPP
#define PEP_ENGINE_ERRORS_PEP_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "pep-engine/src/Solver/SolverStatus.hpp"

namespace pep_engine
{

/**
 * @brief Algebra misuse that would leave the affine-in-Gram fragment
 *
 * Thrown when two non-constant Expressions are multiplied, or when a Point
 * is scaled by a non-constant Expression. Always a bug in the caller's
 * algorithm description.
 */
class DegreeError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/**
 * @brief A Point, Expression or function handle names something the problem
 * does not know
 *
 * Typical causes: a Point created before Problem::reset(), a Point created
 * by another Problem, or a FunctionHandle that was never declared.
 */
class UnresolvedReferenceError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/**
 * @brief The solver adapter reported an infeasible or unbounded program
 */
class InfeasibleError : public std::runtime_error
{
public:
  InfeasibleError(const std::string& what, SolverStatus status)
    : std::runtime_error{what}, status_{status}
  {
  }

  [[nodiscard]] SolverStatus status() const
  {
    return status_;
  }

private:
  SolverStatus status_;
};

/**
 * @brief The solver adapter stopped without reaching an optimal status
 */
class SolverFailure : public std::runtime_error
{
public:
  SolverFailure(const std::string& what, SolverStatus status)
    : std::runtime_error{what}, status_{status}
  {
  }

  [[nodiscard]] SolverStatus status() const
  {
    return status_;
  }

private:
  SolverStatus status_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_ERRORS_PEP_ERRORS_HPP
