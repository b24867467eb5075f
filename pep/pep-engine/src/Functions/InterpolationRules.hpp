// Ticket: 0003_function_class_interpolation

#ifndef PEP_ENGINE_FUNCTIONS_INTERPOLATION_RULES_HPP
#define PEP_ENGINE_FUNCTIONS_INTERPOLATION_RULES_HPP

#include <vector>

#include "pep-engine/src/Functions/Function.hpp"
#include "pep-engine/src/Functions/FunctionClass.hpp"
#include "pep-engine/src/Symbolic/Constraint.hpp"

namespace pep_engine
{

/**
 * @brief Generates the pairwise interpolation inequalities of a function class
 *
 * For a function with oracle triples t_0..t_{m-1}, every ordered pair
 * (i, j), i != j, yields constraintsPerPair(params) constraints, so a function
 * contributes r·m·(m-1) rows. Pairs are enumerated with i as the outer loop
 * and j as the inner loop, which makes the output order deterministic.
 *
 * All generated constraints are written as `expression <= 0` and every
 * expression is affine in (G, F):
 *
 * | Class                  | expression (<= 0), dx = x_i - x_j                      |
 * |------------------------|--------------------------------------------------------|
 * | convex                 | f_j - f_i + ⟨g_j, dx⟩                                  |
 * | smooth convex          | ... + 1/(2L) ||g_i - g_j||²                            |
 * | strongly convex        | ... + mu/2 ||dx||²                                     |
 * | smooth strongly convex | ... + 1/(2L)||g_i-g_j||² + mu/(2(1-mu/L))||dx-(g_i-g_j)/L||² |
 * | indicator              | ⟨g_j, dx⟩ ; ||dx||² - D² when D is finite              |
 * | relatively smooth      | convexity ; f_i - f_j - ⟨g_j, dx⟩ - L·D_h(x_i, x_j)    |
 *
 * where D_h(x_i, x_j) = h_i - h_j - ⟨gh_j, dx⟩ uses the kernel triples at the
 * same points.
 *
 * @ticket 0003_function_class_interpolation
 */
class InterpolationRules
{
public:
  /**
   * @brief All interpolation constraints of one function, tagged
   *
   * @param function Function whose triples are interpolated
   * @param functions Every declared function, indexed by handle (needed to
   *        resolve a relative-smoothness kernel)
   * @throws UnresolvedReferenceError if a relatively smooth function has a
   *         point where its kernel holds no triple
   */
  static std::vector<Constraint> generate(
    const Function& function,
    const std::vector<Function>& functions);

  /**
   * @brief Constraints for one ordered pair (untagged)
   *
   * @param params Class parameters
   * @param ti Triple i
   * @param tj Triple j
   * @param kernelI Kernel triple at x_i (relative smoothness only, else null)
   * @param kernelJ Kernel triple at x_j (relative smoothness only, else null)
   */
  static std::vector<Constraint> interpolatePair(
    const FunctionClassParams& params,
    const OracleTriple& ti,
    const OracleTriple& tj,
    const OracleTriple* kernelI = nullptr,
    const OracleTriple* kernelJ = nullptr);

private:
  static Expression convexityGap(const OracleTriple& ti,
                                 const OracleTriple& tj);
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_FUNCTIONS_INTERPOLATION_RULES_HPP
