#include "wsim/engine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>

#include "wsim/codec.hpp"
#include "wsim/errors.hpp"
#include "wsim/rng.hpp"

namespace wsim {

using nlohmann::json;

namespace {

EventType event_type_for(ActionKind k) noexcept {
  // ActionKind and the action range of EventType share their order.
  return static_cast<EventType>(static_cast<uint8_t>(EventType::Register) + static_cast<uint8_t>(k));
}

} // namespace

TickOutcome WorldEngine::genesis(const WorldDefinition& def) {
  if (state_.initialized()) throw std::logic_error("genesis on an initialized world");

  state_ = genesis_state(def);

  TickOutcome out{};
  out.tick = 0;

  Event ev{};
  ev.tick = 0;
  ev.type = EventType::Genesis;
  ev.payload = def;
  out.events.push_back(std::move(ev));

  out.events.push_back(commit_record(out.events.size(), PhysicsTotals{}));
  out.state_hash = out.events.back().payload.at("state_hash").get<std::string>();
  return out;
}

TickOutcome WorldEngine::advance(const std::vector<Action>& actions) {
  if (!state_.initialized()) throw std::logic_error("advance before genesis");

  state_.tick += 1;

  TickOutcome out{};
  out.tick = state_.tick;

  for (const auto& a : actions) {
    const Decision d = validate(state_, a);
    if (!d.accept) {
      out.rejections.push_back(Rejection{a, d.reason});
      continue;
    }
    out.events.push_back(apply(a));
    out.accepted++;
  }

  PhysicsTotals totals{};
  auto physics = apply_physics(totals);
  for (auto& ev : physics) out.events.push_back(std::move(ev));

  const auto problems = state_.check_invariants();
  if (!problems.empty()) {
    throw IntegrityError("invariant violated at tick " + std::to_string(state_.tick) + ": " + problems.front());
  }

  out.events.push_back(commit_record(out.events.size(), totals));
  out.state_hash = out.events.back().payload.at("state_hash").get<std::string>();
  return out;
}

Event WorldEngine::apply(const Action& action) {
  const Tick t = state_.tick;

  Event ev{};
  ev.tick = t;
  ev.type = event_type_for(action.kind());
  ev.agent_ids.push_back(action.agent);

  json delta = json::object();

  // Register creates the subject; everything else acts on an existing agent.
  if (const auto* reg = std::get_if<Register>(&action.payload)) {
    Agent a{};
    a.id = action.agent;
    a.status = AgentStatus::Pending;
    a.region = reg->region;
    a.resources = reg->initial;
    a.created_tick = t;
    a.last_action_tick = t;
    state_.agents.emplace(a.id, a);
    if (Region* r = state_.find_region_mut(reg->region)) r->occupancy++;
    delta["region"] = reg->region;
    ev.payload = json{{"action", payload_to_json(action.payload)}, {"delta", delta}};
    return ev;
  }

  Agent* self = state_.find_agent_mut(action.agent);
  if (!self) throw std::logic_error("apply: unknown agent " + action.agent);

  const ResourcePool cost = action_cost(state_, action);
  const bool charged = !std::holds_alternative<Claim>(action.payload);
  if (charged) {
    self->resources -= cost;
    delta["cost"] = cost;
  }
  self->last_action_tick = t;

  std::visit([&](const auto& p) {
    using T = std::decay_t<decltype(p)>;

    if constexpr (std::is_same_v<T, Claim>) {
      self->status = AgentStatus::Claimed;
      self->claim_ref = p.claim_ref;
    } else if constexpr (std::is_same_v<T, Move>) {
      Region* from = state_.find_region_mut(self->region);
      Region* to = state_.find_region_mut(p.destination);
      if (from) from->occupancy--;
      if (to) to->occupancy++;
      delta["from"] = self->region;
      delta["to"] = p.destination;
      self->region = p.destination;
    } else if constexpr (std::is_same_v<T, Trade>) {
      ResourcePool give{};
      give[p.offer.kind] = p.offer.amount;
      ResourcePool take{};
      take[p.request.kind] = p.request.amount;

      self->resources -= give;
      self->resources += take;
      if (!p.counterparty.empty()) {
        Agent* other = state_.find_agent_mut(p.counterparty);
        other->resources += give;
        other->resources -= take;
        ev.agent_ids.push_back(p.counterparty);
      } else {
        Region* home = state_.find_region_mut(self->region);
        home->pool += give;
        home->pool -= take;
        delta["region"] = self->region;
      }
    } else if constexpr (std::is_same_v<T, Communicate>) {
      const Agent* target = state_.find_agent(p.target);
      delta["sender_region"] = self->region;
      delta["receiver_region"] = target->region;
      delta["delivered"] = true;
      ev.agent_ids.push_back(p.target);
    } else if constexpr (std::is_same_v<T, Fork>) {
      const AgentId id_a = p.child_a.empty() ? default_child_id(self->id, t, 'a') : p.child_a;
      const AgentId id_b = p.child_b.empty() ? default_child_id(self->id, t, 'b') : p.child_b;
      const auto [share_a, share_b] = split_percent(self->resources, p.split_percent);

      Agent child{};
      child.status = AgentStatus::Claimed;
      child.region = self->region;
      child.created_tick = t;
      child.last_action_tick = t;
      child.claim_ref = self->claim_ref;
      child.parent = self->id;

      child.id = id_a;
      child.resources = share_a;
      state_.agents.emplace(id_a, child);
      child.id = id_b;
      child.resources = share_b;
      state_.agents.emplace(id_b, child);
      if (Region* r = state_.find_region_mut(self->region)) r->occupancy += 2;

      self->resources = ResourcePool{};
      retire(*self, AgentStatus::Forked);

      ev.agent_ids.push_back(id_a);
      ev.agent_ids.push_back(id_b);
      delta["children"] = json::array({id_a, id_b});
      delta["shares"] = json::array({json(share_a), json(share_b)});
    } else if constexpr (std::is_same_v<T, Merge>) {
      Agent* absorbed = state_.find_agent_mut(p.absorbed);
      delta["absorbed_resources"] = absorbed->resources;
      self->resources += absorbed->resources;
      absorbed->resources = ResourcePool{};
      retire(*absorbed, AgentStatus::Merged);
      ev.agent_ids.push_back(p.absorbed);
    } else if constexpr (std::is_same_v<T, Die>) {
      delta["region"] = self->region;
      delta["released"] = release_to_region(*self);
      retire(*self, AgentStatus::Dead);
    } else if constexpr (std::is_same_v<T, Observe>) {
      const Region* here = state_.find_region(self->region);
      delta["region"] = self->region;
      delta["visible_agents"] = here ? here->occupancy : 0;
    } else if constexpr (std::is_same_v<T, Register>) {
      // handled above
    }
  }, action.payload);

  ev.payload = json{{"action", payload_to_json(action.payload)}, {"delta", delta}};
  return ev;
}

void WorldEngine::retire(Agent& a, AgentStatus to) {
  a.status = to;
  a.retired_tick = state_.tick;
  if (Region* r = state_.find_region_mut(a.region)) r->occupancy--;
}

// Death policy: everything the agent still holds goes back to its region's pool.
ResourcePool WorldEngine::release_to_region(Agent& a) {
  const ResourcePool released = a.resources;
  if (Region* r = state_.find_region_mut(a.region)) r->pool += released;
  a.resources = ResourcePool{};
  return released;
}

std::vector<Event> WorldEngine::apply_physics(PhysicsTotals& totals) {
  std::vector<Event> out;
  const WorldRules& rules = state_.rules;
  Rng rng = Rng::for_tick(state_.seed, state_.tick);

  // std::map iteration: agents in identifier order
  for (auto& [id, a] : state_.agents) {
    if (a.status != AgentStatus::Claimed) continue;
    Region* r = state_.find_region_mut(a.region);
    if (!r) continue;

    for (auto k : kResourceKinds) {
      const Amount take = std::min(rules.upkeep[k], a.resources[k]);
      if (take <= 0) continue;
      a.resources[k] -= take;
      r->pool[k] = saturating_add(r->pool[k], take);
      totals.upkeep[k] = saturating_add(totals.upkeep[k], take);
    }

    for (auto k : kResourceKinds) {
      const Amount want = static_cast<Amount>(std::llround(static_cast<double>(rules.regen[k]) * r->resource_multiplier));
      const Amount room = std::max<Amount>(0, saturating_sub(rules.caps[k], a.resources[k]));
      const Amount gain = std::min({want, room, r->pool[k]});
      if (gain <= 0) continue;
      a.resources[k] += gain;
      r->pool[k] -= gain;
      totals.regen[k] = saturating_add(totals.regen[k], gain);
    }

    // one roll per claimed agent, hit or not, so the stream only depends on the roster
    const double roll = rng.uniform01();
    if (roll < r->danger) {
      const Amount dmg = std::min(rules.danger_damage, a.resources[ResourceKind::Energy]);
      a.resources[ResourceKind::Energy] -= dmg;

      Event ev{};
      ev.tick = state_.tick;
      ev.type = EventType::DangerStrike;
      ev.agent_ids.push_back(id);
      ev.payload = json{{"region", r->id}, {"damage", dmg}};
      out.push_back(std::move(ev));
    }

    if (a.resources[ResourceKind::Energy] <= 0) {
      Event ev{};
      ev.tick = state_.tick;
      ev.type = EventType::Exhaustion;
      ev.agent_ids.push_back(id);
      const RegionId where = a.region;
      const ResourcePool released = release_to_region(a);
      retire(a, AgentStatus::Dead);
      ev.payload = json{{"region", where}, {"released", released}};
      out.push_back(std::move(ev));
    }
  }

  for (auto& [rid, r] : state_.regions) {
    for (auto k : kResourceKinds) {
      const Amount want = static_cast<Amount>(std::llround(static_cast<double>(rules.pool_regen[k]) * r.resource_multiplier));
      const Amount room = std::max<Amount>(0, saturating_sub(rules.pool_caps[k], r.pool[k]));
      const Amount gain = std::min(want, room);
      if (gain <= 0) continue;
      r.pool[k] += gain;
      totals.pool_regen[k] = saturating_add(totals.pool_regen[k], gain);
    }
  }

  return out;
}

Event WorldEngine::commit_record(std::size_t events_in_tick, const PhysicsTotals& totals) const {
  Event ev{};
  ev.tick = state_.tick;
  ev.type = EventType::TickCommit;
  ev.payload = json{{"state_hash", state_hash(state_)},
                    {"events", events_in_tick},
                    {"live_agents", state_.live_agent_count()},
                    {"physics", json{{"upkeep", totals.upkeep},
                                     {"regen", totals.regen},
                                     {"pool_regen", totals.pool_regen}}}};
  return ev;
}

} // namespace wsim
