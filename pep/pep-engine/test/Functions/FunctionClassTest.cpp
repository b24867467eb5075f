// Ticket: 0003_function_class_interpolation

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "pep-engine/src/Functions/FunctionClass.hpp"

using namespace pep_engine;

TEST(FunctionClassTest, AcceptsValidParameters_0003)
{
  EXPECT_NO_THROW(validate(ConvexParams{}));
  EXPECT_NO_THROW(validate(SmoothConvexParams{2.0}));
  EXPECT_NO_THROW(validate(StronglyConvexParams{0.0}));
  EXPECT_NO_THROW(validate(SmoothStronglyConvexParams{1.0, 0.1}));
  EXPECT_NO_THROW(validate(ConvexIndicatorParams{}));
  EXPECT_NO_THROW(validate(ConvexIndicatorParams{0.0}));
  EXPECT_NO_THROW(validate(RelativelySmoothParams{1.0, FunctionHandle{0}}));
}

TEST(FunctionClassTest, RejectsInvalidParameters_0003)
{
  EXPECT_THROW(validate(SmoothConvexParams{0.0}), std::invalid_argument);
  EXPECT_THROW(validate(SmoothConvexParams{-1.0}), std::invalid_argument);
  EXPECT_THROW(
    validate(SmoothConvexParams{std::numeric_limits<double>::infinity()}),
    std::invalid_argument);
  EXPECT_THROW(validate(StronglyConvexParams{-0.5}), std::invalid_argument);
  EXPECT_THROW(validate(SmoothStronglyConvexParams{1.0, 1.0}),
               std::invalid_argument);
  EXPECT_THROW(validate(SmoothStronglyConvexParams{1.0, 2.0}),
               std::invalid_argument);
  EXPECT_THROW(validate(ConvexIndicatorParams{-1.0}), std::invalid_argument);
  EXPECT_THROW(validate(RelativelySmoothParams{0.0, FunctionHandle{0}}),
               std::invalid_argument);
}

TEST(FunctionClassTest, ConstraintsPerPair_0003)
{
  EXPECT_EQ(constraintsPerPair(ConvexParams{}), 1u);
  EXPECT_EQ(constraintsPerPair(SmoothConvexParams{}), 1u);
  EXPECT_EQ(constraintsPerPair(StronglyConvexParams{}), 1u);
  EXPECT_EQ(constraintsPerPair(SmoothStronglyConvexParams{}), 1u);
  EXPECT_EQ(constraintsPerPair(ConvexIndicatorParams{}), 1u);
  EXPECT_EQ(constraintsPerPair(ConvexIndicatorParams{3.0}), 2u);
  EXPECT_EQ(constraintsPerPair(RelativelySmoothParams{}), 2u);
}

TEST(FunctionClassTest, IndicatorsHaveNoValueBasis_0003)
{
  EXPECT_FALSE(hasValueBasis(ConvexIndicatorParams{}));
  EXPECT_TRUE(hasValueBasis(ConvexParams{}));
  EXPECT_TRUE(hasValueBasis(RelativelySmoothParams{}));
}

TEST(FunctionClassTest, KernelOnlyForRelativeSmoothness_0003)
{
  const auto kernel = kernelOf(RelativelySmoothParams{1.0, FunctionHandle{4}});
  ASSERT_TRUE(kernel.has_value());
  EXPECT_EQ(kernel->index, 4u);
  EXPECT_FALSE(kernelOf(SmoothConvexParams{}).has_value());
}

TEST(FunctionClassTest, DescribeNamesClassAndParameters_0003)
{
  EXPECT_EQ(describe(ConvexParams{}), "convex");
  EXPECT_EQ(describe(SmoothConvexParams{2.0}), "smooth_convex(L=2)");
  EXPECT_EQ(describe(ConvexIndicatorParams{}), "convex_indicator(D=inf)");
  EXPECT_EQ(describe(RelativelySmoothParams{1.0, FunctionHandle{0}}),
            "relatively_smooth(L=1, kernel=f0)");
}
