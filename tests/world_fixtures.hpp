#pragma once
#include <string>

#include "wsim/resources.hpp"
#include "wsim/world_state.hpp"

namespace wsim::fixtures {

// The reference world with every passive effect switched off, so holdings
// only change through actions.
inline WorldDefinition quiet_world(uint64_t seed = 7) {
  WorldDefinition def = default_world(seed);
  def.rules.regen = ResourcePool{};
  def.rules.upkeep = ResourcePool{};
  def.rules.pool_regen = ResourcePool{};
  for (auto& r : def.regions) r.danger = 0.0;
  return def;
}

inline WorldState quiet_state(uint64_t seed = 7) {
  return genesis_state(quiet_world(seed));
}

// Drops an agent straight into the state, keeping occupancy consistent.
inline Agent& place_agent(WorldState& s, const AgentId& id, const RegionId& region, ResourcePool held,
                          AgentStatus status = AgentStatus::Claimed) {
  Agent a{};
  a.id = id;
  a.status = status;
  a.region = region;
  a.resources = held;
  a.claim_ref = "ref-" + id;
  auto& slot = s.agents[id];
  slot = a;
  if (!is_retired(status)) s.regions.at(region).occupancy++;
  return slot;
}

inline ResourcePool energy(Amount e) {
  return ResourcePool::of(e, 0, 0, 0);
}

} // namespace wsim::fixtures
