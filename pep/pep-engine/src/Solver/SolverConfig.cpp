// Ticket: 0007_interior_point_sdp_backend
// Ticket: 0008_proof_certifier

#include "pep-engine/src/Solver/SolverConfig.hpp"

#include <sstream>
#include <stdexcept>

namespace pep_engine
{

namespace
{

void requirePositive(double value, const char* name)
{
  if (!(value > 0.0))
  {
    std::ostringstream oss;
    oss << name << " must be positive, got " << value;
    throw std::invalid_argument{oss.str()};
  }
}

}  // namespace

void SolverConfig::validate() const
{
  requirePositive(tolerance, "SolverConfig::tolerance");
  requirePositive(divergenceThreshold, "SolverConfig::divergenceThreshold");
  if (maxIterations <= 0)
  {
    std::ostringstream oss;
    oss << "SolverConfig::maxIterations must be positive, got "
        << maxIterations;
    throw std::invalid_argument{oss.str()};
  }
  if (!(stepFraction > 0.0 && stepFraction < 1.0))
  {
    std::ostringstream oss;
    oss << "SolverConfig::stepFraction must lie in (0, 1), got "
        << stepFraction;
    throw std::invalid_argument{oss.str()};
  }
}

void CertificationConfig::validate() const
{
  requirePositive(reconstructionTolerance,
                  "CertificationConfig::reconstructionTolerance");
  requirePositive(dualityGapTolerance,
                  "CertificationConfig::dualityGapTolerance");
  requirePositive(psdTolerance, "CertificationConfig::psdTolerance");
  requirePositive(feasibilityTolerance,
                  "CertificationConfig::feasibilityTolerance");
}

}  // namespace pep_engine
