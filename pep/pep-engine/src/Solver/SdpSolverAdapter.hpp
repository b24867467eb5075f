// Ticket: 0007_interior_point_sdp_backend

#ifndef PEP_ENGINE_SOLVER_SDP_SOLVER_ADAPTER_HPP
#define PEP_ENGINE_SOLVER_SDP_SOLVER_ADAPTER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "pep-engine/src/Solver/SdpProblem.hpp"
#include "pep-engine/src/Solver/SolverConfig.hpp"

namespace pep_engine
{

/**
 * @brief Narrow interface every SDP backend implements
 *
 * Problem never branches on the concrete backend. Anything backend-specific
 * travels in SolverConfig::backendOptions.
 *
 * Implementations report failures through SdpSolution::status and do not
 * throw for infeasible or unbounded programs.
 *
 * @ticket 0007_interior_point_sdp_backend
 */
class SdpSolverAdapter
{
public:
  virtual ~SdpSolverAdapter() = default;

  /**
   * @brief Solve a lowered problem
   *
   * @param problem Standard-form SDP
   * @param config Tolerances, iteration budget and passthrough options
   * @param logger Destination for progress output
   * @return Status, primal and dual solutions and objective values
   */
  virtual SdpSolution solve(const SdpProblem& problem,
                            const SolverConfig& config,
                            const std::shared_ptr<spdlog::logger>& logger) = 0;

  /// Backend name reported in SolveResult
  [[nodiscard]] virtual std::string name() const = 0;

protected:
  SdpSolverAdapter() = default;
  SdpSolverAdapter(const SdpSolverAdapter&) = default;
  SdpSolverAdapter& operator=(const SdpSolverAdapter&) = default;
  SdpSolverAdapter(SdpSolverAdapter&&) noexcept = default;
  SdpSolverAdapter& operator=(SdpSolverAdapter&&) noexcept = default;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_SOLVER_SDP_SOLVER_ADAPTER_HPP
