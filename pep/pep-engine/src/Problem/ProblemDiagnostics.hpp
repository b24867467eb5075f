// Ticket: 0005_problem_orchestrator

#ifndef PEP_ENGINE_PROBLEM_PROBLEM_DIAGNOSTICS_HPP
#define PEP_ENGINE_PROBLEM_PROBLEM_DIAGNOSTICS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace pep_engine
{

/// Per-function part of the set-up report
struct FunctionDiagnostics
{
  std::size_t index{0};
  std::string className;
  std::size_t tripleCount{0};
  std::size_t interpolationConstraintCount{0};
};

/**
 * @brief Size and constraint counts of a lowered problem
 *
 * Filled by SdpLowering; rendered by toString() and logged at info level
 * before the solver runs.
 *
 * @ticket 0005_problem_orchestrator
 */
struct ProblemDiagnostics
{
  std::size_t gramSize{0};
  std::size_t valueSize{0};
  std::size_t metricCount{0};
  std::size_t initialConditionCount{0};
  std::size_t userConstraintCount{0};
  std::size_t interpolationConstraintCount{0};
  std::size_t rowCount{0};
  std::vector<FunctionDiagnostics> functions;

  /// Multi-line human-readable report
  [[nodiscard]] std::string toString() const;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_PROBLEM_PROBLEM_DIAGNOSTICS_HPP
