// Ticket: 0006_sdp_lowering

#ifndef PEP_ENGINE_PROBLEM_SDP_LOWERING_HPP
#define PEP_ENGINE_PROBLEM_SDP_LOWERING_HPP

#include <Eigen/Dense>

#include <vector>

#include "pep-engine/src/Basis/BasisRegistry.hpp"
#include "pep-engine/src/Problem/ProblemDiagnostics.hpp"
#include "pep-engine/src/Solver/SdpProblem.hpp"
#include "pep-engine/src/Symbolic/Constraint.hpp"
#include "pep-engine/src/Symbolic/Expression.hpp"

namespace pep_engine
{

/**
 * @brief A Problem translated to standard form, plus the bookkeeping needed
 * to map solver output back onto constraints
 */
struct LoweredProblem
{
  SdpProblem sdp;
  /// Provenance of each row of `sdp.rows`, same order
  std::vector<ConstraintTag> rowTags;
  /// Interpolation constraints generated for this lowering
  std::vector<Constraint> interpolationConstraints;
  ProblemDiagnostics diagnostics;
  /// True when several metrics were combined through an auxiliary scalar
  bool auxiliaryTau{false};
};

/**
 * @brief Translates symbolic Expressions and Constraints into matrix form
 *
 * Gram coefficients: a bilinear term c·⟨b_i, b_j⟩ becomes c at (i, i) when
 * i == j and c/2 at both (i, j) and (j, i) otherwise, so every lowered
 * matrix is symmetric and ⟨A, G⟩ reproduces the Expression. Linear terms
 * land in the value vector at the F slot of their basis. The constant term
 * moves to the bound.
 *
 * Rows are emitted in ledger order: initial conditions, user constraints,
 * interpolation constraints, then metric constraints.
 *
 * **Objective**:
 * - one metric: maximize it directly
 * - several metrics: append an auxiliary value τ, maximize τ subject to
 *   τ - metric_k <= 0 for every k (worst case of the minimum metric)
 *
 * @ticket 0006_sdp_lowering
 */
class SdpLowering
{
public:
  /**
   * @brief Coefficient form of an Expression (constant term dropped)
   *
   * @param expression Expression to lower
   * @param registry Registry that resolves basis ids to rows
   * @param valueSize Length of the value vector (may exceed the registry's
   *        value dimension when an auxiliary τ is present)
   * @throws UnresolvedReferenceError if the Expression names a basis the
   *         registry does not hold
   */
  static LinearForm lowerExpression(const Expression& expression,
                                    const BasisRegistry& registry,
                                    Eigen::Index valueSize);

  /// Row for a constraint: form (<= | ==) bound - constant
  static SdpRow lowerConstraint(const Constraint& constraint,
                                const BasisRegistry& registry,
                                Eigen::Index valueSize);

  /**
   * @brief Lower a complete problem
   *
   * @param registry Basis registry
   * @param initialConditions Initial-condition constraints
   * @param userConstraints User constraints
   * @param interpolationConstraints Interpolation constraints, in function
   *        declaration order
   * @param metrics Performance metrics (at least one)
   * @throws std::logic_error if `metrics` is empty
   * @throws UnresolvedReferenceError as lowerExpression()
   */
  static LoweredProblem build(
    const BasisRegistry& registry,
    const std::vector<Constraint>& initialConditions,
    const std::vector<Constraint>& userConstraints,
    std::vector<Constraint> interpolationConstraints,
    const std::vector<Expression>& metrics);
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_PROBLEM_SDP_LOWERING_HPP
