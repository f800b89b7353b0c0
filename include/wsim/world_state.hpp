#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "wsim/actions.hpp"
#include "wsim/resources.hpp"
#include "wsim/types.hpp"

namespace wsim {

struct Region {
  RegionId id{};
  std::string name{};
  double x{0.0};
  double y{0.0};
  double danger{0.0};            // probability of a danger strike per agent per tick
  double resource_multiplier{1.0};
  int32_t capacity{100};
  int32_t occupancy{0};
  ResourcePool pool{};           // the region's own resource pool

  bool has_room(int32_t extra = 1) const noexcept { return occupancy + extra <= capacity; }
};

double distance(const Region& a, const Region& b) noexcept;

struct Agent {
  AgentId id{};
  AgentStatus status{AgentStatus::Pending};
  RegionId region{};
  ResourcePool resources{};
  Tick created_tick{0};
  Tick last_action_tick{0};
  Tick retired_tick{-1};
  std::string claim_ref{};
  AgentId parent{};

  bool is_live() const noexcept { return !is_retired(status); }
};

// Everything that governs how actions cost and how the world evolves per
// tick. Fixed at genesis and carried in every snapshot so replay never
// depends on the current process configuration.
struct WorldRules {
  std::array<ResourcePool, std::variant_size_v<ActionPayload>> action_costs{};
  double distance_cost_factor{0.5};    // MOVE/COMMUNICATE cost x (1 + factor * distance)

  ResourcePool regen{};                // per agent per tick, scaled by region multiplier
  ResourcePool caps{};                 // regeneration never lifts holdings above this
  ResourcePool upkeep{};               // per agent per tick, returned to the region pool
  ResourcePool pool_regen{};           // per region per tick, scaled by region multiplier
  ResourcePool pool_caps{};

  Amount danger_damage{5};             // energy destroyed by one danger strike

  const ResourcePool& cost(ActionKind k) const noexcept {
    return action_costs[static_cast<std::size_t>(k)];
  }
  ResourcePool& cost_mut(ActionKind k) noexcept {
    return action_costs[static_cast<std::size_t>(k)];
  }

  bool operator==(const WorldRules&) const = default;
};

WorldRules default_rules();

// Inputs of the genesis tick.
struct WorldDefinition {
  uint64_t seed{1};
  WorldRules rules{};
  std::vector<Region> regions{};
};

// The five regions of the reference world (nexus is the spawn point).
std::vector<Region> default_regions();
WorldDefinition default_world(uint64_t seed);

struct WorldState {
  Tick tick{-1};                       // -1 until genesis has been applied
  uint64_t seed{0};
  WorldRules rules{};
  std::map<RegionId, Region> regions{};
  std::map<AgentId, Agent> agents{};

  bool initialized() const noexcept { return tick >= 0; }

  const Agent* find_agent(const AgentId& id) const noexcept;
  Agent* find_agent_mut(const AgentId& id) noexcept;
  const Region* find_region(const RegionId& id) const noexcept;
  Region* find_region_mut(const RegionId& id) noexcept;

  std::size_t live_agent_count() const noexcept;

  // Returns one message per violated invariant; empty when consistent.
  std::vector<std::string> check_invariants() const;
};

WorldState genesis_state(const WorldDefinition& def);

} // namespace wsim
