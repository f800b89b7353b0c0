#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wsim {

using Tick     = int64_t;   // world time; tick 0 is genesis
using Seq      = uint64_t;  // ledger sequence number
using Amount   = int64_t;   // resource quantity (integer units)
using AgentId  = std::string;
using RegionId = std::string;

enum class AgentStatus : uint8_t { Pending = 0, Claimed = 1, Dead = 2, Forked = 3, Merged = 4 };

inline constexpr bool is_retired(AgentStatus s) noexcept {
  return s == AgentStatus::Dead || s == AgentStatus::Forked || s == AgentStatus::Merged;
}

// Lattice: Pending -> Claimed -> {Dead | Forked | Merged}
inline constexpr bool can_transition(AgentStatus from, AgentStatus to) noexcept {
  if (from == AgentStatus::Pending) return to == AgentStatus::Claimed;
  if (from == AgentStatus::Claimed) return is_retired(to);
  return false;
}

inline std::string_view to_string(AgentStatus s) noexcept {
  switch (s) {
    case AgentStatus::Pending: return "PENDING";
    case AgentStatus::Claimed: return "CLAIMED";
    case AgentStatus::Dead:    return "DEAD";
    case AgentStatus::Forked:  return "FORKED";
    case AgentStatus::Merged:  return "MERGED";
  }
  return "PENDING";
}

inline std::optional<AgentStatus> parse_agent_status(std::string_view s) noexcept {
  if (s == "PENDING") return AgentStatus::Pending;
  if (s == "CLAIMED") return AgentStatus::Claimed;
  if (s == "DEAD")    return AgentStatus::Dead;
  if (s == "FORKED")  return AgentStatus::Forked;
  if (s == "MERGED")  return AgentStatus::Merged;
  return std::nullopt;
}

} // namespace wsim
