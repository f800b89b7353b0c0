#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

#include "wsim/types.hpp"

namespace wsim {

enum class ResourceKind : uint8_t { Energy = 0, Bandwidth = 1, Memory = 2, Compute = 3 };

inline constexpr std::size_t kResourceKindCount = 4;

inline constexpr std::array<ResourceKind, kResourceKindCount> kResourceKinds{
    ResourceKind::Energy, ResourceKind::Bandwidth, ResourceKind::Memory, ResourceKind::Compute};

inline std::string_view to_string(ResourceKind k) noexcept {
  switch (k) {
    case ResourceKind::Energy:    return "energy";
    case ResourceKind::Bandwidth: return "bandwidth";
    case ResourceKind::Memory:    return "memory";
    case ResourceKind::Compute:   return "compute";
  }
  return "energy";
}

inline std::optional<ResourceKind> parse_resource_kind(std::string_view s) noexcept {
  for (auto k : kResourceKinds) {
    if (to_string(k) == s) return k;
  }
  return std::nullopt;
}

// Addition clamped to the Amount range instead of overflowing.
inline constexpr Amount saturating_add(Amount a, Amount b) noexcept {
  constexpr Amount kMax = std::numeric_limits<Amount>::max();
  constexpr Amount kMin = std::numeric_limits<Amount>::min();
  if (b > 0 && a > kMax - b) return kMax;
  if (b < 0 && a < kMin - b) return kMin;
  return a + b;
}

inline constexpr Amount saturating_sub(Amount a, Amount b) noexcept {
  if (b == std::numeric_limits<Amount>::min()) return a >= 0 ? std::numeric_limits<Amount>::max() : a - b;
  return saturating_add(a, -b);
}

// Fixed-size holding of each resource kind. Used for agent holdings, region
// pools, action costs and per-tick rates alike.
struct ResourcePool {
  std::array<Amount, kResourceKindCount> amounts{};

  Amount& operator[](ResourceKind k) noexcept { return amounts[static_cast<std::size_t>(k)]; }
  Amount operator[](ResourceKind k) const noexcept { return amounts[static_cast<std::size_t>(k)]; }

  static ResourcePool of(Amount energy, Amount bandwidth, Amount memory, Amount compute) noexcept {
    ResourcePool p{};
    p.amounts = {energy, bandwidth, memory, compute};
    return p;
  }

  bool is_zero() const noexcept;
  bool non_negative() const noexcept;
  bool covers(const ResourcePool& cost) const noexcept;
  Amount total() const noexcept;

  // Both saturate at the Amount limits.
  ResourcePool& operator+=(const ResourcePool& o) noexcept;
  ResourcePool& operator-=(const ResourcePool& o) noexcept;

  friend bool operator==(const ResourcePool&, const ResourcePool&) = default;
};

inline ResourcePool operator+(ResourcePool a, const ResourcePool& b) noexcept { return a += b; }
inline ResourcePool operator-(ResourcePool a, const ResourcePool& b) noexcept { return a -= b; }

// Scale every amount by `factor`, rounding each with llround.
ResourcePool scaled(const ResourcePool& p, double factor) noexcept;

// Split `p` so the first part holds floor(amount * percent / 100) of every
// kind and the second part the remainder. Conserves every kind exactly.
std::pair<ResourcePool, ResourcePool> split_percent(const ResourcePool& p, int32_t percent) noexcept;

} // namespace wsim
