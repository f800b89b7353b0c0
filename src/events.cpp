#include "wsim/events.hpp"

#include <algorithm>

namespace wsim {

std::string_view to_string(EventType t) noexcept {
  switch (t) {
    case EventType::Genesis:      return "genesis";
    case EventType::Register:     return "register";
    case EventType::Claim:        return "claim";
    case EventType::Move:         return "move";
    case EventType::Trade:        return "trade";
    case EventType::Communicate:  return "communicate";
    case EventType::Fork:         return "fork";
    case EventType::Merge:        return "merge";
    case EventType::Die:          return "die";
    case EventType::Observe:      return "observe";
    case EventType::DangerStrike: return "danger_strike";
    case EventType::Exhaustion:   return "exhaustion";
    case EventType::TickCommit:   return "tick_commit";
  }
  return "tick_commit";
}

std::optional<EventType> parse_event_type(std::string_view s) noexcept {
  for (uint8_t i = 0; i <= static_cast<uint8_t>(EventType::TickCommit); ++i) {
    const auto t = static_cast<EventType>(i);
    if (to_string(t) == s) return t;
  }
  return std::nullopt;
}

bool is_action_event(EventType t) noexcept {
  return t >= EventType::Register && t <= EventType::Observe;
}

bool Event::names(const AgentId& id) const noexcept {
  return std::find(agent_ids.begin(), agent_ids.end(), id) != agent_ids.end();
}

} // namespace wsim
