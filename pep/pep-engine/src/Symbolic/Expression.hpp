// Ticket: 0002_symbolic_algebra

#ifndef PEP_ENGINE_SYMBOLIC_EXPRESSION_HPP
#define PEP_ENGINE_SYMBOLIC_EXPRESSION_HPP

#include <compare>
#include <map>

#include "pep-engine/src/Basis/BasisVector.hpp"

namespace pep_engine
{

/**
 * @brief Unordered pair of point-space bases, stored with first <= second
 *
 * Keys a bilinear term ⟨b_first, b_second⟩. Because the inner product is
 * symmetric, makeBasisPair(a, b) and makeBasisPair(b, a) produce the same key.
 */
struct BasisPair
{
  BasisId first{0};
  BasisId second{0};

  auto operator<=>(const BasisPair&) const = default;
};

/// Canonical (sorted) pair for a bilinear term
[[nodiscard]] inline BasisPair makeBasisPair(BasisId a, BasisId b)
{
  return a <= b ? BasisPair{a, b} : BasisPair{b, a};
}

/**
 * @brief Symbolic scalar, affine in the Gram matrix and the value vector
 *
 * An Expression is
 *
 *   constant + Σ linear[v]·F_v + Σ bilinear[(i,j)]·⟨b_i, b_j⟩
 *
 * where the linear part ranges over value bases and the bilinear part over
 * canonical pairs of point-space bases. Zero coefficients are never stored.
 * The default-constructed Expression is the constant zero.
 *
 * Expressions never evaluate to truth values. Relations between them are
 * built explicitly with leq(), geq() and eq() from Constraint.hpp.
 *
 * @ticket 0002_symbolic_algebra
 */
class Expression
{
public:
  using LinearTerms = std::map<BasisId, double>;
  using BilinearTerms = std::map<BasisPair, double>;

  Expression() = default;

  /// Build from explicit parts; zero coefficients are dropped
  Expression(LinearTerms linear, BilinearTerms bilinear, double constant);

  /// Constant Expression with no basis dependence
  static Expression constant(double value);

  /// Leaf Expression for a single value basis with coefficient one
  static Expression basis(BasisId valueId);

  [[nodiscard]] const LinearTerms& linearTerms() const
  {
    return linear_;
  }

  [[nodiscard]] const BilinearTerms& bilinearTerms() const
  {
    return bilinear_;
  }

  [[nodiscard]] double constantTerm() const
  {
    return constant_;
  }

  /// Coefficient of value basis `id`, zero when absent
  [[nodiscard]] double linearCoefficient(BasisId id) const;

  /// Coefficient of ⟨a, b⟩ in canonical form, zero when absent
  [[nodiscard]] double bilinearCoefficient(BasisId a, BasisId b) const;

  /// No linear and no bilinear part
  [[nodiscard]] bool isConstant() const
  {
    return linear_.empty() && bilinear_.empty();
  }

  /// Constant with value zero
  [[nodiscard]] bool isZero() const
  {
    return isConstant() && constant_ == 0.0;
  }

  /// Same constant and identical term maps
  [[nodiscard]] bool identicalTo(const Expression& other) const
  {
    return constant_ == other.constant_ && linear_ == other.linear_ &&
           bilinear_ == other.bilinear_;
  }

private:
  LinearTerms linear_;
  BilinearTerms bilinear_;
  double constant_{0.0};
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_SYMBOLIC_EXPRESSION_HPP
