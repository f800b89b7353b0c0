#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "wsim/actions.hpp"
#include "wsim/resources.hpp"
#include "wsim/world_state.hpp"

namespace wsim {

enum class RejectReason : uint8_t {
  None = 0,
  InsufficientResources,
  RegionFull,
  AgentNotClaimed,
  AgentRetired,
  InvalidTarget,
  UnknownAgent
};

inline std::string_view to_string(RejectReason r) noexcept {
  switch (r) {
    case RejectReason::None:                  return "NONE";
    case RejectReason::InsufficientResources: return "INSUFFICIENT_RESOURCES";
    case RejectReason::RegionFull:            return "REGION_FULL";
    case RejectReason::AgentNotClaimed:       return "AGENT_NOT_CLAIMED";
    case RejectReason::AgentRetired:          return "AGENT_RETIRED";
    case RejectReason::InvalidTarget:         return "INVALID_TARGET";
    case RejectReason::UnknownAgent:          return "UNKNOWN_AGENT";
  }
  return "NONE";
}

struct Decision {
  bool accept{true};
  RejectReason reason{RejectReason::None};

  static Decision reject(RejectReason r) noexcept { return Decision{false, r}; }
};

// Pure: never mutates `state`, never does I/O.
Decision validate(const WorldState& state, const Action& action);

// Cost charged to the acting agent. Distance-scaled for MOVE and COMMUNICATE.
// Callers must have checked that the referenced regions/agents exist.
ResourcePool action_cost(const WorldState& state, const Action& action);

// Ids given to fork children when the action leaves them empty.
AgentId default_child_id(const AgentId& parent, Tick tick, char suffix);

} // namespace wsim
