#include "wsim/rules.hpp"

#include <string>
#include <type_traits>

#include "wsim/codec.hpp"

namespace wsim {

namespace {

// Counterpart of TRADE / MERGE / COMMUNICATE.
Decision check_counterpart(const WorldState& state, const AgentId& self, const AgentId& other) {
  if (other == self) return Decision::reject(RejectReason::InvalidTarget);
  const Agent* a = state.find_agent(other);
  if (!a) return Decision::reject(RejectReason::UnknownAgent);
  if (is_retired(a->status)) return Decision::reject(RejectReason::AgentRetired);
  if (a->status != AgentStatus::Claimed) return Decision::reject(RejectReason::AgentNotClaimed);
  return {};
}

bool is_amount_valid(const ResourceAmount& r) noexcept { return r.amount >= 0; }

ResourcePool as_pool(const ResourceAmount& r) noexcept {
  ResourcePool p{};
  p[r.kind] = r.amount;
  return p;
}

// Every string an action carries ends up in the ledger, so it must encode.
bool payload_text_is_valid(const ActionPayload& payload) {
  return std::visit([](const auto& p) {
    using T = std::decay_t<decltype(p)>;

    if constexpr (std::is_same_v<T, Register>) {
      return is_valid_utf8(p.region);
    } else if constexpr (std::is_same_v<T, Claim>) {
      return is_valid_utf8(p.claim_ref);
    } else if constexpr (std::is_same_v<T, Move>) {
      return is_valid_utf8(p.destination);
    } else if constexpr (std::is_same_v<T, Trade>) {
      return is_valid_utf8(p.counterparty);
    } else if constexpr (std::is_same_v<T, Communicate>) {
      return is_valid_utf8(p.target) && is_valid_utf8(p.content);
    } else if constexpr (std::is_same_v<T, Fork>) {
      return is_valid_utf8(p.child_a) && is_valid_utf8(p.child_b);
    } else if constexpr (std::is_same_v<T, Merge>) {
      return is_valid_utf8(p.absorbed);
    } else if constexpr (std::is_same_v<T, Die>) {
      return is_valid_utf8(p.cause);
    } else {
      return true;
    }
  }, payload);
}

} // namespace

AgentId default_child_id(const AgentId& parent, Tick tick, char suffix) {
  return parent + "." + std::to_string(tick) + "." + suffix;
}

ResourcePool action_cost(const WorldState& state, const Action& action) {
  const ActionKind k = action.kind();
  const ResourcePool& base = state.rules.cost(k);
  const Agent* self = state.find_agent(action.agent);
  if (!self) return base;

  const Region* from = state.find_region(self->region);
  const Region* to = nullptr;
  if (const auto* m = std::get_if<Move>(&action.payload)) {
    to = state.find_region(m->destination);
  } else if (const auto* c = std::get_if<Communicate>(&action.payload)) {
    if (const Agent* target = state.find_agent(c->target)) to = state.find_region(target->region);
  }

  if (!from || !to) return base;
  return scaled(base, 1.0 + state.rules.distance_cost_factor * distance(*from, *to));
}

Decision validate(const WorldState& state, const Action& action) {
  const Agent* self = state.find_agent(action.agent);

  // REGISTER is the only action whose subject must not exist yet.
  if (const auto* reg = std::get_if<Register>(&action.payload)) {
    if (action.agent.empty() || self || !is_valid_utf8(action.agent)) {
      return Decision::reject(RejectReason::InvalidTarget);
    }
    const Region* r = state.find_region(reg->region);
    if (!r) return Decision::reject(RejectReason::InvalidTarget);
    // starting holdings are bounded by the regeneration caps
    if (!reg->initial.non_negative() || !state.rules.caps.covers(reg->initial)) {
      return Decision::reject(RejectReason::InvalidTarget);
    }
    if (!r->has_room()) return Decision::reject(RejectReason::RegionFull);
    return {};
  }

  if (!self) return Decision::reject(RejectReason::UnknownAgent);
  if (is_retired(self->status)) return Decision::reject(RejectReason::AgentRetired);

  if (const auto* claim = std::get_if<Claim>(&action.payload)) {
    if (self->status != AgentStatus::Pending) return Decision::reject(RejectReason::InvalidTarget);
    if (claim->claim_ref.empty()) return Decision::reject(RejectReason::InvalidTarget);
    if (!payload_text_is_valid(action.payload)) return Decision::reject(RejectReason::InvalidTarget);
    return {};
  }

  if (self->status != AgentStatus::Claimed) return Decision::reject(RejectReason::AgentNotClaimed);
  if (!payload_text_is_valid(action.payload)) return Decision::reject(RejectReason::InvalidTarget);

  Decision d{};
  ResourcePool extra_need{};   // beyond the action cost (offered side of a trade)

  std::visit([&](const auto& p) {
    using T = std::decay_t<decltype(p)>;

    if constexpr (std::is_same_v<T, Move>) {
      const Region* dest = state.find_region(p.destination);
      if (!dest || p.destination == self->region) {
        d = Decision::reject(RejectReason::InvalidTarget);
      } else if (!dest->has_room()) {
        d = Decision::reject(RejectReason::RegionFull);
      }
    } else if constexpr (std::is_same_v<T, Trade>) {
      if (!is_amount_valid(p.offer) || !is_amount_valid(p.request) ||
          (p.offer.amount == 0 && p.request.amount == 0)) {
        d = Decision::reject(RejectReason::InvalidTarget);
        return;
      }
      if (!p.counterparty.empty()) {
        d = check_counterpart(state, self->id, p.counterparty);
        if (!d.accept) return;
        const Agent* other = state.find_agent(p.counterparty);
        if (!other->resources.covers(as_pool(p.request))) {
          d = Decision::reject(RejectReason::InsufficientResources);
          return;
        }
      } else {
        const Region* home = state.find_region(self->region);
        if (!home) {
          d = Decision::reject(RejectReason::InvalidTarget);
          return;
        }
        if (!home->pool.covers(as_pool(p.request))) {
          d = Decision::reject(RejectReason::InsufficientResources);
          return;
        }
      }
      extra_need = as_pool(p.offer);
    } else if constexpr (std::is_same_v<T, Communicate>) {
      d = check_counterpart(state, self->id, p.target);
    } else if constexpr (std::is_same_v<T, Fork>) {
      if (p.split_percent < 0 || p.split_percent > 100) {
        d = Decision::reject(RejectReason::InvalidTarget);
        return;
      }
      const AgentId a = p.child_a.empty() ? default_child_id(self->id, state.tick, 'a') : p.child_a;
      const AgentId b = p.child_b.empty() ? default_child_id(self->id, state.tick, 'b') : p.child_b;
      if (a == b || state.find_agent(a) || state.find_agent(b)) {
        d = Decision::reject(RejectReason::InvalidTarget);
        return;
      }
      const Region* home = state.find_region(self->region);
      if (!home) {
        d = Decision::reject(RejectReason::InvalidTarget);
      } else if (!home->has_room(1)) {
        // parent leaves, two children enter: one net extra slot
        d = Decision::reject(RejectReason::RegionFull);
      }
    } else if constexpr (std::is_same_v<T, Merge>) {
      d = check_counterpart(state, self->id, p.absorbed);
    } else if constexpr (std::is_same_v<T, Die> || std::is_same_v<T, Observe>) {
      // no target
    } else {
      // Register / Claim handled above
      d = Decision::reject(RejectReason::InvalidTarget);
    }
  }, action.payload);

  if (!d.accept) return d;

  const ResourcePool need = action_cost(state, action) + extra_need;
  if (!self->resources.covers(need)) return Decision::reject(RejectReason::InsufficientResources);
  return d;
}

} // namespace wsim
