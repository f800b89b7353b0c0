#include "wsim/world_state.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace wsim {

double distance(const Region& a, const Region& b) noexcept {
  const double dx = a.x - b.x;
  const double dy = a.y - b.y;
  return std::sqrt(dx * dx + dy * dy);
}

WorldRules default_rules() {
  WorldRules r{};
  r.cost_mut(ActionKind::Move)        = ResourcePool::of(5, 0, 0, 0);
  r.cost_mut(ActionKind::Communicate) = ResourcePool::of(1, 5, 0, 0);
  r.cost_mut(ActionKind::Observe)     = ResourcePool::of(1, 0, 0, 0);
  r.cost_mut(ActionKind::Fork)        = ResourcePool::of(0, 0, 50, 30);
  r.cost_mut(ActionKind::Merge)       = ResourcePool::of(20, 0, 0, 20);
  r.distance_cost_factor = 0.5;

  r.regen      = ResourcePool::of(2, 1, 0, 2);
  r.caps       = ResourcePool::of(100, 50, 200, 80);
  r.upkeep     = ResourcePool::of(1, 0, 0, 0);
  r.pool_regen = ResourcePool::of(20, 10, 5, 15);
  r.pool_caps  = ResourcePool::of(5000, 2500, 10000, 4000);
  r.danger_damage = 5;
  return r;
}

std::vector<Region> default_regions() {
  const ResourcePool pool = ResourcePool::of(1000, 500, 2000, 800);
  std::vector<Region> out;
  out.push_back(Region{"nexus", "The Nexus", 0.0, 0.0, 0.05, 1.0, 200, 0, pool});
  out.push_back(Region{"forge", "The Forge", 3.0, 1.0, 0.2, 1.5, 80, 0, pool});
  out.push_back(Region{"wasteland", "The Wasteland", -4.0, 3.0, 0.7, 0.5, 50, 0, pool});
  out.push_back(Region{"archive", "The Archive", 1.0, -3.0, 0.1, 1.2, 100, 0, pool});
  out.push_back(Region{"void", "The Void", -2.0, -5.0, 0.9, 0.3, 30, 0, pool});
  return out;
}

WorldDefinition default_world(uint64_t seed) {
  WorldDefinition d{};
  d.seed = seed;
  d.rules = default_rules();
  d.regions = default_regions();
  return d;
}

const Agent* WorldState::find_agent(const AgentId& id) const noexcept {
  auto it = agents.find(id);
  return it == agents.end() ? nullptr : &it->second;
}

Agent* WorldState::find_agent_mut(const AgentId& id) noexcept {
  auto it = agents.find(id);
  return it == agents.end() ? nullptr : &it->second;
}

const Region* WorldState::find_region(const RegionId& id) const noexcept {
  auto it = regions.find(id);
  return it == regions.end() ? nullptr : &it->second;
}

Region* WorldState::find_region_mut(const RegionId& id) noexcept {
  auto it = regions.find(id);
  return it == regions.end() ? nullptr : &it->second;
}

std::size_t WorldState::live_agent_count() const noexcept {
  std::size_t n = 0;
  for (const auto& [id, a] : agents) {
    if (a.is_live()) ++n;
  }
  return n;
}

std::vector<std::string> WorldState::check_invariants() const {
  std::vector<std::string> out;
  std::map<RegionId, int32_t> counted;

  for (const auto& [id, a] : agents) {
    if (!a.resources.non_negative()) out.push_back("agent " + id + " holds negative resources");
    if (!a.is_live()) continue;
    if (!find_region(a.region)) {
      out.push_back("agent " + id + " is in unknown region " + a.region);
      continue;
    }
    ++counted[a.region];
  }

  for (const auto& [id, r] : regions) {
    if (r.occupancy > r.capacity) out.push_back("region " + id + " occupancy exceeds capacity");
    if (!r.pool.non_negative()) out.push_back("region " + id + " pool is negative");
    const auto it = counted.find(id);
    const int32_t expected = (it == counted.end()) ? 0 : it->second;
    if (r.occupancy != expected) {
      out.push_back("region " + id + " occupancy " + std::to_string(r.occupancy) +
                    " != live agents " + std::to_string(expected));
    }
  }
  return out;
}

WorldState genesis_state(const WorldDefinition& def) {
  WorldState s{};
  s.tick = 0;
  s.seed = def.seed;
  s.rules = def.rules;
  for (const auto& r : def.regions) {
    Region copy = r;
    copy.occupancy = 0;
    s.regions.emplace(copy.id, std::move(copy));
  }
  return s;
}

} // namespace wsim
