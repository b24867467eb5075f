// Ticket: 0002_symbolic_algebra

#include "pep-engine/src/Symbolic/Algebra.hpp"

#include <sstream>
#include <utility>

#include "pep-engine/src/Errors/PepErrors.hpp"

namespace pep_engine
{

namespace
{

template <typename Key>
void accumulate(std::map<Key, double>& target,
                const std::map<Key, double>& source,
                double factor)
{
  for (const auto& [key, coefficient] : source)
  {
    target[key] += factor * coefficient;
  }
}

}  // namespace

// ===== Points =====

Point zeroPoint()
{
  return Point{};
}

Point addPoints(const Point& a, const Point& b)
{
  Point::Terms terms = a.terms();
  accumulate(terms, b.terms(), 1.0);
  return Point{std::move(terms)};
}

Point subtractPoints(const Point& a, const Point& b)
{
  Point::Terms terms = a.terms();
  accumulate(terms, b.terms(), -1.0);
  return Point{std::move(terms)};
}

Point scalePoint(const Point& p, double factor)
{
  Point::Terms terms;
  accumulate(terms, p.terms(), factor);
  return Point{std::move(terms)};
}

Point negatePoint(const Point& p)
{
  return scalePoint(p, -1.0);
}

Point sumPoints(const std::vector<Point>& points)
{
  Point::Terms terms;
  for (const auto& p : points)
  {
    accumulate(terms, p.terms(), 1.0);
  }
  return Point{std::move(terms)};
}

Point scalePointBy(const Point& p, const Expression& factor)
{
  if (!factor.isConstant())
  {
    std::ostringstream oss;
    oss << "scalePointBy: scaling a Point by an Expression with "
        << factor.linearTerms().size() << " linear and "
        << factor.bilinearTerms().size()
        << " bilinear terms leaves the quadratic fragment";
    throw DegreeError{oss.str()};
  }
  return scalePoint(p, factor.constantTerm());
}

// ===== Expressions =====

Expression constantExpression(double value)
{
  return Expression::constant(value);
}

Expression addExpressions(const Expression& a, const Expression& b)
{
  Expression::LinearTerms linear = a.linearTerms();
  Expression::BilinearTerms bilinear = a.bilinearTerms();
  accumulate(linear, b.linearTerms(), 1.0);
  accumulate(bilinear, b.bilinearTerms(), 1.0);
  return Expression{std::move(linear),
                    std::move(bilinear),
                    a.constantTerm() + b.constantTerm()};
}

Expression subtractExpressions(const Expression& a, const Expression& b)
{
  return addExpressions(a, negateExpression(b));
}

Expression scaleExpression(const Expression& e, double factor)
{
  Expression::LinearTerms linear;
  Expression::BilinearTerms bilinear;
  accumulate(linear, e.linearTerms(), factor);
  accumulate(bilinear, e.bilinearTerms(), factor);
  return Expression{
    std::move(linear), std::move(bilinear), factor * e.constantTerm()};
}

Expression negateExpression(const Expression& e)
{
  return scaleExpression(e, -1.0);
}

Expression sumExpressions(const std::vector<Expression>& terms)
{
  Expression::LinearTerms linear;
  Expression::BilinearTerms bilinear;
  double constant{0.0};
  for (const auto& e : terms)
  {
    accumulate(linear, e.linearTerms(), 1.0);
    accumulate(bilinear, e.bilinearTerms(), 1.0);
    constant += e.constantTerm();
  }
  return Expression{std::move(linear), std::move(bilinear), constant};
}

Expression multiply(const Expression& a, const Expression& b)
{
  if (a.isConstant())
  {
    return scaleExpression(b, a.constantTerm());
  }
  if (b.isConstant())
  {
    return scaleExpression(a, b.constantTerm());
  }
  throw DegreeError{
    "multiply: product of two non-constant Expressions is not affine in the "
    "Gram matrix"};
}

Expression innerProduct(const Point& a, const Point& b)
{
  Expression::BilinearTerms bilinear;
  for (const auto& [i, ai] : a.terms())
  {
    for (const auto& [j, bj] : b.terms())
    {
      bilinear[makeBasisPair(i, j)] += ai * bj;
    }
  }
  return Expression{Expression::LinearTerms{}, std::move(bilinear), 0.0};
}

Expression squaredNorm(const Point& p)
{
  return innerProduct(p, p);
}

}  // namespace pep_engine
