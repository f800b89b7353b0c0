#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "wsim/resources.hpp"
#include "wsim/types.hpp"

namespace wsim {

// Engine-side end of the external registration flow.
struct Register {
  RegionId region{};
  ResourcePool initial{};
};

// Engine-side end of the external claim-verification flow.
struct Claim {
  std::string claim_ref{};
};

struct Move {
  RegionId destination{};
};

struct ResourceAmount {
  ResourceKind kind{ResourceKind::Energy};
  Amount amount{0};
};

// Two-sided swap. An empty counterparty trades against the subject's region pool.
struct Trade {
  AgentId counterparty{};
  ResourceAmount offer{};
  ResourceAmount request{};
};

struct Communicate {
  AgentId target{};
  std::string content{};
};

struct Fork {
  AgentId child_a{};   // empty => "<parent>.<tick>.a"
  AgentId child_b{};   // empty => "<parent>.<tick>.b"
  int32_t split_percent{50};
};

struct Merge {
  AgentId absorbed{};
};

struct Die {
  std::string cause{"voluntary"};
};

struct Observe {};

using ActionPayload =
    std::variant<Register, Claim, Move, Trade, Communicate, Fork, Merge, Die, Observe>;

enum class ActionKind : uint8_t { Register, Claim, Move, Trade, Communicate, Fork, Merge, Die, Observe };

inline ActionKind kind_of(const ActionPayload& p) noexcept {
  return static_cast<ActionKind>(p.index()); // relies on variant order above
}

inline std::string_view to_string(ActionKind k) noexcept {
  switch (k) {
    case ActionKind::Register:    return "register";
    case ActionKind::Claim:       return "claim";
    case ActionKind::Move:        return "move";
    case ActionKind::Trade:       return "trade";
    case ActionKind::Communicate: return "communicate";
    case ActionKind::Fork:        return "fork";
    case ActionKind::Merge:       return "merge";
    case ActionKind::Die:         return "die";
    case ActionKind::Observe:     return "observe";
  }
  return "observe";
}

std::optional<ActionKind> parse_action_kind(std::string_view s) noexcept;

struct Action {
  AgentId agent{};
  Tick submitted_tick{0};
  uint64_t arrival{0};   // assigned by ActionQueue::submit
  ActionPayload payload{Observe{}};

  ActionKind kind() const noexcept { return kind_of(payload); }

  static Action of(AgentId agent, ActionPayload p, Tick submitted = 0) {
    Action a{};
    a.agent = std::move(agent);
    a.submitted_tick = submitted;
    a.payload = std::move(p);
    return a;
  }
};

} // namespace wsim
