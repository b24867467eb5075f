// Ticket: 0007_interior_point_sdp_backend

#ifndef PEP_ENGINE_SOLVER_SOLVER_STATUS_HPP
#define PEP_ENGINE_SOLVER_SOLVER_STATUS_HPP

#include <string>

namespace pep_engine
{

/**
 * @brief Terminal status reported by an SDP solver adapter
 *
 * Optimal is the only status that lets Problem::solve() return normally.
 * Infeasible and Unbounded map to InfeasibleError, everything else to
 * SolverFailure.
 */
enum class SolverStatus
{
  Optimal,
  Infeasible,
  Unbounded,
  IterationLimit,
  Error
};

/// Lower-case status name used in logs and reports
[[nodiscard]] inline std::string toString(SolverStatus status)
{
  switch (status)
  {
    case SolverStatus::Optimal:
      return "optimal";
    case SolverStatus::Infeasible:
      return "infeasible";
    case SolverStatus::Unbounded:
      return "unbounded";
    case SolverStatus::IterationLimit:
      return "iteration_limit";
    case SolverStatus::Error:
      return "error";
  }
  return "error";
}

}  // namespace pep_engine

#endif  // PEP_ENGINE_SOLVER_SOLVER_STATUS_HPP
