#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "wsim/types.hpp"

namespace wsim {

enum class EventType : uint8_t {
  Genesis = 0,
  Register,
  Claim,
  Move,
  Trade,
  Communicate,
  Fork,
  Merge,
  Die,
  Observe,
  DangerStrike,
  Exhaustion,
  TickCommit
};

std::string_view to_string(EventType t) noexcept;
std::optional<EventType> parse_event_type(std::string_view s) noexcept;

// Events produced by applying an agent action (as opposed to physics,
// genesis and commit records).
bool is_action_event(EventType t) noexcept;

// A committed state transition, before the ledger stamps it.
struct Event {
  Tick tick{0};
  EventType type{EventType::TickCommit};
  std::vector<AgentId> agent_ids{};
  nlohmann::json payload = nlohmann::json::object();

  bool names(const AgentId& id) const noexcept;

  // Content equality; used by replay to compare regenerated events.
  friend bool operator==(const Event& a, const Event& b) {
    return a.tick == b.tick && a.type == b.type && a.agent_ids == b.agent_ids && a.payload == b.payload;
  }
};

// One line of the ledger file.
struct LedgerRecord {
  Seq sequence{0};
  int64_t timestamp_ms{0};   // wall clock, informational only
  Event event{};
};

} // namespace wsim
