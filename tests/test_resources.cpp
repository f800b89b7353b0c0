#include <gtest/gtest.h>

#include <limits>

#include "wsim/resources.hpp"

using wsim::Amount;
using wsim::ResourceKind;
using wsim::ResourcePool;

TEST(Resources, SplitPercentConservesEveryKind) {
  const auto p = ResourcePool::of(101, 7, 0, 33);
  const auto [a, b] = wsim::split_percent(p, 30);

  EXPECT_EQ(a[ResourceKind::Energy], 30);   // floor(101 * 0.3)
  EXPECT_EQ(b[ResourceKind::Energy], 71);
  EXPECT_EQ(a[ResourceKind::Bandwidth], 2);
  EXPECT_EQ(b[ResourceKind::Bandwidth], 5);
  EXPECT_EQ(a + b, p);
}

TEST(Resources, SplitAtTheEdges) {
  const auto p = ResourcePool::of(10, 20, 30, 40);
  EXPECT_EQ(wsim::split_percent(p, 0).second, p);
  EXPECT_TRUE(wsim::split_percent(p, 0).first.is_zero());
  EXPECT_EQ(wsim::split_percent(p, 100).first, p);
  EXPECT_TRUE(wsim::split_percent(p, 100).second.is_zero());
}

TEST(Resources, SplitOfHugeAmountsDoesNotOverflow) {
  constexpr Amount kMax = std::numeric_limits<Amount>::max();
  const auto p = ResourcePool::of(kMax, kMax - 1, 0, 0);
  const auto [a, b] = wsim::split_percent(p, 50);
  EXPECT_EQ(a[ResourceKind::Energy], kMax / 2);
  EXPECT_EQ(b[ResourceKind::Energy], kMax - kMax / 2);
  EXPECT_EQ(a + b, p);

  const auto [most, rest] = wsim::split_percent(p, 99);
  EXPECT_EQ(most[ResourceKind::Energy], (kMax / 100) * 99 + ((kMax % 100) * 99) / 100);
  EXPECT_EQ(most + rest, p);
}

TEST(Resources, ArithmeticSaturatesAtTheLimits) {
  constexpr Amount kMax = std::numeric_limits<Amount>::max();
  constexpr Amount kMin = std::numeric_limits<Amount>::min();
  EXPECT_EQ(wsim::saturating_add(kMax, 1000), kMax);
  EXPECT_EQ(wsim::saturating_add(kMin, -1), kMin);
  EXPECT_EQ(wsim::saturating_add(40, 2), 42);
  EXPECT_EQ(wsim::saturating_sub(10, kMin), kMax);
  EXPECT_EQ(wsim::saturating_sub(-10, kMax), kMin);

  auto pool = ResourcePool::of(kMax - 5, 1, 0, 0);
  pool += ResourcePool::of(1000, 1, 0, 0);
  EXPECT_EQ(pool, ResourcePool::of(kMax, 2, 0, 0));
  EXPECT_EQ(ResourcePool::of(kMax, kMax, 0, 0).total(), kMax);
}

TEST(Resources, ScaledRoundsHalfAwayFromZero) {
  const auto p = ResourcePool::of(5, 1, 3, 0);
  const auto s = wsim::scaled(p, 1.5);
  EXPECT_EQ(s, ResourcePool::of(8, 2, 5, 0));   // 7.5 -> 8, 1.5 -> 2, 4.5 -> 5
}

TEST(Resources, CoversComparesEveryKind) {
  const auto held = ResourcePool::of(10, 5, 0, 1);
  EXPECT_TRUE(held.covers(ResourcePool::of(10, 5, 0, 1)));
  EXPECT_FALSE(held.covers(ResourcePool::of(0, 0, 1, 0)));
  EXPECT_TRUE(held.non_negative());
  EXPECT_FALSE((held - ResourcePool::of(11, 0, 0, 0)).non_negative());
  EXPECT_EQ(held.total(), 16);
}

TEST(Resources, KindNamesRoundTrip) {
  for (auto k : wsim::kResourceKinds) {
    const auto parsed = wsim::parse_resource_kind(wsim::to_string(k));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, k);
  }
  EXPECT_FALSE(wsim::parse_resource_kind("gold").has_value());
}
