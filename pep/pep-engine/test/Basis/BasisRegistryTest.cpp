// Ticket: 0001_basis_registry

#include <gtest/gtest.h>

#include "pep-engine/src/Basis/BasisRegistry.hpp"
#include "pep-engine/src/Errors/PepErrors.hpp"

using namespace pep_engine;

// ============================================================================
// Allocation
// ============================================================================

TEST(BasisRegistryTest, AllocatesDenseRowsPerKind_0001)
{
  BasisRegistry registry;

  const BasisId x0 = registry.newPoint();
  const BasisId g0 = registry.newGradient(0);
  const BasisId f0 = registry.newValue(0);
  const BasisId x1 = registry.newPoint();

  EXPECT_EQ(registry.pointDimension(), 3u);
  EXPECT_EQ(registry.valueDimension(), 1u);

  EXPECT_EQ(registry.pointRow(x0), 0u);
  EXPECT_EQ(registry.pointRow(g0), 1u);
  EXPECT_EQ(registry.pointRow(x1), 2u);
  EXPECT_EQ(registry.valueRow(f0), 0u);
}

TEST(BasisRegistryTest, IdsAreUniqueAcrossKinds_0001)
{
  BasisRegistry registry;

  const BasisId a = registry.newPoint();
  const BasisId b = registry.newGradient(0);
  const BasisId c = registry.newValue(0);

  EXPECT_NE(a, b);
  EXPECT_NE(b, c);
  EXPECT_NE(a, c);
  EXPECT_LT(a, b);
  EXPECT_LT(b, c);
}

TEST(BasisRegistryTest, RecordsKindAndOwner_0001)
{
  BasisRegistry registry;

  const BasisId x = registry.newPoint();
  const BasisId g = registry.newGradient(3);
  const BasisId f = registry.newValue(3);

  EXPECT_EQ(registry.pointBasis(x).kind, BasisKind::Point);
  EXPECT_FALSE(registry.pointBasis(x).owner.has_value());

  EXPECT_EQ(registry.pointBasis(g).kind, BasisKind::Gradient);
  ASSERT_TRUE(registry.pointBasis(g).owner.has_value());
  EXPECT_EQ(*registry.pointBasis(g).owner, 3u);

  EXPECT_EQ(registry.valueBasis(f).kind, BasisKind::Value);
  ASSERT_TRUE(registry.valueBasis(f).owner.has_value());
  EXPECT_EQ(*registry.valueBasis(f).owner, 3u);
}

// ============================================================================
// Lookup failures
// ============================================================================

TEST(BasisRegistryTest, ValueIdIsNotAPoint_0001)
{
  BasisRegistry registry;
  const BasisId f = registry.newValue(0);
  const BasisId x = registry.newPoint();

  EXPECT_FALSE(registry.containsPoint(f));
  EXPECT_FALSE(registry.containsValue(x));
  EXPECT_THROW(static_cast<void>(registry.pointBasis(f)),
               UnresolvedReferenceError);
  EXPECT_THROW(static_cast<void>(registry.valueRow(x)),
               UnresolvedReferenceError);
}

TEST(BasisRegistryTest, IdsFromAnotherRegistryAreUnresolved_0001)
{
  BasisRegistry first;
  BasisRegistry second;

  const BasisId foreign = first.newPoint();
  static_cast<void>(second.newPoint());

  EXPECT_FALSE(second.containsPoint(foreign));
  EXPECT_THROW(static_cast<void>(second.pointRow(foreign)),
               UnresolvedReferenceError);
}

TEST(BasisRegistryTest, ClearInvalidatesEarlierIds_0001)
{
  BasisRegistry registry;
  const BasisId stale = registry.newPoint();

  registry.clear();
  EXPECT_EQ(registry.pointDimension(), 0u);

  const BasisId fresh = registry.newPoint();
  EXPECT_NE(stale, fresh);
  EXPECT_EQ(registry.pointRow(fresh), 0u);
  EXPECT_THROW(static_cast<void>(registry.pointBasis(stale)),
               UnresolvedReferenceError);
}

TEST(BasisRegistryTest, CopyKeepsLookups_0001)
{
  BasisRegistry registry;
  const BasisId x = registry.newPoint();
  const BasisId g = registry.newGradient(1);

  const BasisRegistry copy = registry;
  registry.clear();

  EXPECT_EQ(copy.pointRow(x), 0u);
  EXPECT_EQ(copy.pointRow(g), 1u);
  EXPECT_EQ(copy.pointBases().size(), 2u);
}
