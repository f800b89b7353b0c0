#include "wsim/resources.hpp"

#include <cmath>
#include <utility>

namespace wsim {

bool ResourcePool::is_zero() const noexcept {
  for (auto a : amounts) {
    if (a != 0) return false;
  }
  return true;
}

bool ResourcePool::non_negative() const noexcept {
  for (auto a : amounts) {
    if (a < 0) return false;
  }
  return true;
}

bool ResourcePool::covers(const ResourcePool& cost) const noexcept {
  for (std::size_t i = 0; i < kResourceKindCount; ++i) {
    if (amounts[i] < cost.amounts[i]) return false;
  }
  return true;
}

Amount ResourcePool::total() const noexcept {
  Amount t = 0;
  for (auto a : amounts) t = saturating_add(t, a);
  return t;
}

ResourcePool& ResourcePool::operator+=(const ResourcePool& o) noexcept {
  for (std::size_t i = 0; i < kResourceKindCount; ++i) amounts[i] = saturating_add(amounts[i], o.amounts[i]);
  return *this;
}

ResourcePool& ResourcePool::operator-=(const ResourcePool& o) noexcept {
  for (std::size_t i = 0; i < kResourceKindCount; ++i) amounts[i] = saturating_sub(amounts[i], o.amounts[i]);
  return *this;
}

ResourcePool scaled(const ResourcePool& p, double factor) noexcept {
  ResourcePool out{};
  for (std::size_t i = 0; i < kResourceKindCount; ++i) {
    out.amounts[i] = static_cast<Amount>(std::llround(static_cast<double>(p.amounts[i]) * factor));
  }
  return out;
}

std::pair<ResourcePool, ResourcePool> split_percent(const ResourcePool& p, int32_t percent) noexcept {
  ResourcePool first{};
  ResourcePool second{};
  for (std::size_t i = 0; i < kResourceKindCount; ++i) {
    // integer math: no rounding drift between the two halves, and no
    // amount * percent product that could overflow
    const Amount a = p.amounts[i];
    first.amounts[i] = (a / 100) * percent + ((a % 100) * percent) / 100;
    second.amounts[i] = p.amounts[i] - first.amounts[i];
  }
  return {first, second};
}

} // namespace wsim
