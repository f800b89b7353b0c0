#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "wsim/actions.hpp"
#include "wsim/events.hpp"
#include "wsim/rules.hpp"
#include "wsim/world_state.hpp"

namespace wsim {

struct Rejection {
  Action action{};
  RejectReason reason{RejectReason::None};
};

// Everything one tick produced. `events` always ends with the tick_commit record.
struct TickOutcome {
  Tick tick{0};
  std::vector<Event> events{};
  std::vector<Rejection> rejections{};
  std::size_t accepted{0};
  std::string state_hash{};
};

// Owns one copy of the world and is the only code that mutates it.
// The live scheduler and the replay engine run the same class, so a replayed
// tick goes through exactly the code path that produced it.
class WorldEngine {
public:
  WorldEngine() = default;
  explicit WorldEngine(WorldState s) : state_(std::move(s)) {}

  const WorldState& state() const noexcept { return state_; }

  // Tick 0. Requires an uninitialized state.
  TickOutcome genesis(const WorldDefinition& def);

  // Advances to state().tick + 1: validates and applies `actions` in the given
  // order, then runs passive physics and produces the commit record.
  // Throws IntegrityError if the resulting state breaks an invariant.
  TickOutcome advance(const std::vector<Action>& actions);

  // Applies one already validated action at the current tick.
  Event apply(const Action& action);

private:
  struct PhysicsTotals {
    ResourcePool upkeep{};
    ResourcePool regen{};
    ResourcePool pool_regen{};
  };

  WorldState state_{};

  std::vector<Event> apply_physics(PhysicsTotals& totals);
  void retire(Agent& a, AgentStatus to);
  ResourcePool release_to_region(Agent& a);
  Event commit_record(std::size_t events_in_tick, const PhysicsTotals& totals) const;
};

} // namespace wsim
