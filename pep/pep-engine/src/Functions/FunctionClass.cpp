// Ticket: 0003_function_class_interpolation

#include "pep-engine/src/Functions/FunctionClass.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace pep_engine
{

namespace
{

template <typename... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void requirePositive(double value, const char* name, const char* className)
{
  if (!(value > 0.0) || !std::isfinite(value))
  {
    std::ostringstream oss;
    oss << className << ": " << name << " must be positive and finite, got "
        << value;
    throw std::invalid_argument{oss.str()};
  }
}

void requireNonNegative(double value, const char* name, const char* className)
{
  if (!(value >= 0.0) || !std::isfinite(value))
  {
    std::ostringstream oss;
    oss << className << ": " << name << " must be non-negative and finite, got "
        << value;
    throw std::invalid_argument{oss.str()};
  }
}

}  // namespace

std::string describe(const FunctionClassParams& params)
{
  return std::visit(
    Overloaded{
      [](const ConvexParams&) { return std::string{"convex"}; },
      [](const SmoothConvexParams& p)
      { return fmt::format("smooth_convex(L={:g})", p.L); },
      [](const StronglyConvexParams& p)
      { return fmt::format("strongly_convex(mu={:g})", p.mu); },
      [](const SmoothStronglyConvexParams& p)
      { return fmt::format("smooth_strongly_convex(L={:g}, mu={:g})", p.L, p.mu); },
      [](const ConvexIndicatorParams& p)
      { return fmt::format("convex_indicator(D={:g})", p.D); },
      [](const RelativelySmoothParams& p)
      {
        return fmt::format(
          "relatively_smooth(L={:g}, kernel=f{})", p.L, p.kernel.index);
      }},
    params);
}

std::size_t constraintsPerPair(const FunctionClassParams& params)
{
  if (const auto* indicator = std::get_if<ConvexIndicatorParams>(&params))
  {
    return std::isinf(indicator->D) ? 1 : 2;
  }
  if (std::holds_alternative<RelativelySmoothParams>(params))
  {
    return 2;
  }
  return 1;
}

bool hasValueBasis(const FunctionClassParams& params)
{
  return !std::holds_alternative<ConvexIndicatorParams>(params);
}

std::optional<FunctionHandle> kernelOf(const FunctionClassParams& params)
{
  if (const auto* relative = std::get_if<RelativelySmoothParams>(&params))
  {
    return relative->kernel;
  }
  return std::nullopt;
}

void validate(const FunctionClassParams& params)
{
  std::visit(
    Overloaded{
      [](const ConvexParams&) {},
      [](const SmoothConvexParams& p)
      { requirePositive(p.L, "L", "SmoothConvexParams"); },
      [](const StronglyConvexParams& p)
      { requireNonNegative(p.mu, "mu", "StronglyConvexParams"); },
      [](const SmoothStronglyConvexParams& p)
      {
        requirePositive(p.L, "L", "SmoothStronglyConvexParams");
        requireNonNegative(p.mu, "mu", "SmoothStronglyConvexParams");
        if (p.mu >= p.L)
        {
          std::ostringstream oss;
          oss << "SmoothStronglyConvexParams: mu (" << p.mu
              << ") must be smaller than L (" << p.L << ")";
          throw std::invalid_argument{oss.str()};
        }
      },
      [](const ConvexIndicatorParams& p)
      {
        if (std::isnan(p.D) || p.D < 0.0)
        {
          std::ostringstream oss;
          oss << "ConvexIndicatorParams: diameter must be non-negative, got "
              << p.D;
          throw std::invalid_argument{oss.str()};
        }
      },
      [](const RelativelySmoothParams& p)
      { requirePositive(p.L, "L", "RelativelySmoothParams"); }},
    params);
}

}  // namespace pep_engine
