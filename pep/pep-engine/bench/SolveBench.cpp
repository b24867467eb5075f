// Ticket: 0007_interior_point_sdp_backend
//
// Benchmarks for lowering and solving gradient descent instances of growing
// length. The Gram matrix grows by two rows per step.

#include <benchmark/benchmark.h>

#include <memory>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "pep-engine/src/Problem/Problem.hpp"
#include "pep-engine/src/Steps/PrimitiveSteps.hpp"
#include "pep-engine/src/Symbolic/Algebra.hpp"

using namespace pep_engine;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr double kSmoothness = 1.0;

std::shared_ptr<spdlog::logger> benchLogger()
{
  return std::make_shared<spdlog::logger>(
    "bench_logger", std::make_shared<spdlog::sinks::null_sink_mt>());
}

void buildGradientDescent(Problem& problem, int steps)
{
  const FunctionHandle f =
    problem.declareFunction(SmoothConvexParams{kSmoothness});
  const Point xs = stationaryPoint(problem, {f});
  const Expression fs = problem.value(f, xs);

  Point x = problem.setInitialPoint();
  problem.setInitialCondition(leq(squaredNorm(subtractPoints(x, xs)), 1.0));
  for (int k = 0; k < steps; ++k)
  {
    x = subtractPoints(
      x, scalePoint(problem.gradient(f, x), 1.0 / kSmoothness));
  }
  problem.setPerformanceMetric(subtractExpressions(problem.value(f, x), fs));
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

static void BM_Lower_GradientDescent(benchmark::State& state)
{
  const int steps = static_cast<int>(state.range(0));
  Problem problem{benchLogger()};
  buildGradientDescent(problem, steps);

  for (auto _ : state)
  {
    LoweredProblem lowered = problem.lower();
    benchmark::DoNotOptimize(lowered);
  }
  state.SetComplexityN(static_cast<long long>(steps));
}
BENCHMARK(BM_Lower_GradientDescent)->Arg(1)->Arg(5)->Arg(10)->Arg(20)->Complexity();

static void BM_Solve_GradientDescent(benchmark::State& state)
{
  const int steps = static_cast<int>(state.range(0));
  SolveOptions options;
  options.verbosity = 0;

  for (auto _ : state)
  {
    Problem problem{benchLogger()};
    buildGradientDescent(problem, steps);
    SolveResult result = problem.solve(options);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<long long>(steps));
}
BENCHMARK(BM_Solve_GradientDescent)->Arg(1)->Arg(3)->Arg(5)->Arg(10)->Complexity();

BENCHMARK_MAIN();
