// Ticket: 0005_problem_orchestrator

#include "pep-engine/src/Problem/ProblemDiagnostics.hpp"

#include <iterator>

#include <spdlog/fmt/fmt.h>

namespace pep_engine
{

std::string ProblemDiagnostics::toString() const
{
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "Gram matrix: {} x {}\n", gramSize, gramSize);
  fmt::format_to(it, "Function values: {}\n", valueSize);
  fmt::format_to(it, "Performance metrics: {}\n", metricCount);
  fmt::format_to(it, "Initial conditions: {}\n", initialConditionCount);
  fmt::format_to(it, "User constraints: {}\n", userConstraintCount);
  fmt::format_to(it,
                 "Interpolation constraints: {}\n",
                 interpolationConstraintCount);
  for (const auto& function : functions)
  {
    fmt::format_to(it,
                   "  f{} {}: {} oracle calls, {} constraints\n",
                   function.index,
                   function.className,
                   function.tripleCount,
                   function.interpolationConstraintCount);
  }
  fmt::format_to(it, "Rows handed to the solver: {}", rowCount);
  return out;
}

}  // namespace pep_engine
