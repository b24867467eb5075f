// Ticket: 0007_interior_point_sdp_backend
// Ticket: 0008_proof_certifier

#ifndef PEP_ENGINE_SOLVER_SOLVER_CONFIG_HPP
#define PEP_ENGINE_SOLVER_SOLVER_CONFIG_HPP

#include <map>
#include <string>

namespace pep_engine
{

/**
 * @brief Settings forwarded to the solver adapter
 *
 * `backendOptions` is passed through untouched; only the backend interprets
 * it. The built-in backend logs and ignores keys it does not know.
 */
struct SolverConfig
{
  double tolerance{1e-8};
  int maxIterations{100};
  double stepFraction{0.95};
  double divergenceThreshold{1e10};
  std::map<std::string, std::string> backendOptions;

  /// @throws std::invalid_argument on a nonpositive tolerance or budget
  void validate() const;
};

/**
 * @brief Thresholds deciding whether a dual certificate is accepted
 */
struct CertificationConfig
{
  double reconstructionTolerance{1e-6};
  double dualityGapTolerance{1e-6};
  double psdTolerance{1e-7};
  double feasibilityTolerance{1e-6};
  /// Measure the duality gap relative to 1 + |tau|
  bool relativeGap{true};

  /// @throws std::invalid_argument on a nonpositive tolerance
  void validate() const;
};

/**
 * @brief Options accepted by Problem::solve()
 *
 * verbosity 0 logs warnings only, 1 adds the set-up and result summary,
 * 2 adds per-iteration solver progress.
 */
struct SolveOptions
{
  int verbosity{1};
  SolverConfig solver;
  CertificationConfig certification;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_SOLVER_SOLVER_CONFIG_HPP
