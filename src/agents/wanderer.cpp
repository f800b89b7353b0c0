#include "wsim/agents/wanderer.hpp"

#include <algorithm>

namespace wsim::agents {

RegionId Wanderer::pick_region_(const WorldState& view, const RegionId& not_this) {
  std::vector<const Region*> options;
  for (const auto& [rid, r] : view.regions) {
    if (rid != not_this && r.has_room()) options.push_back(&r);
  }
  if (options.empty()) return not_this;
  return options[static_cast<std::size_t>(rng_.uniform_int(0, static_cast<int64_t>(options.size()) - 1))]->id;
}

const Agent* Wanderer::pick_peer_(const WorldState& view, const Agent& self, bool same_region) {
  std::vector<const Agent*> options;
  for (const auto& [aid, a] : view.agents) {
    if (aid == self.id || a.status != AgentStatus::Claimed) continue;
    if (same_region && a.region != self.region) continue;
    options.push_back(&a);
  }
  if (options.empty()) return nullptr;
  return options[static_cast<std::size_t>(rng_.uniform_int(0, static_cast<int64_t>(options.size()) - 1))];
}

// Offers some of its most plentiful resource for some of its scarcest one.
ActionPayload Wanderer::pick_trade_(const WorldState& view, const Agent& self) {
  ResourceKind rich = ResourceKind::Energy;
  ResourceKind poor = ResourceKind::Energy;
  for (auto k : kResourceKinds) {
    if (self.resources[k] > self.resources[rich]) rich = k;
    if (self.resources[k] < self.resources[poor]) poor = k;
  }
  if (rich == poor) return Observe{};

  Trade t{};
  t.offer = ResourceAmount{rich, std::max<Amount>(1, std::min(cfg_.max_trade, self.resources[rich] / 4))};
  t.request = ResourceAmount{poor, std::max<Amount>(1, rng_.uniform_int(1, cfg_.max_trade))};

  // half of the time deal with a neighbour, otherwise with the region pool
  if (rng_.chance(0.5)) {
    if (const Agent* peer = pick_peer_(view, self, /*same_region*/ true)) t.counterparty = peer->id;
  }
  return t;
}

std::vector<Action> Wanderer::step(const WorldState& view) {
  std::vector<Action> out;
  const Tick now = view.tick;

  const Agent* self = view.find_agent(id_);
  if (!self) {
    out.push_back(Action::of(id_, Register{home_, cfg_.initial}, now));
    return out;
  }
  if (self->status == AgentStatus::Pending) {
    out.push_back(Action::of(id_, Claim{"wanderer:" + id_}, now));
    return out;
  }
  if (self->status != AgentStatus::Claimed) return out;

  if (!rng_.chance(cfg_.intensity_per_tick)) return out;

  const double total = cfg_.w_move + cfg_.w_trade + cfg_.w_communicate + cfg_.w_observe + cfg_.w_fork +
                       cfg_.w_merge + cfg_.w_die;
  double roll = rng_.uniform01() * total;

  ActionPayload p = Observe{};
  if ((roll -= cfg_.w_move) < 0) {
    const RegionId dest = pick_region_(view, self->region);
    if (dest != self->region) p = Move{dest};
  } else if ((roll -= cfg_.w_trade) < 0) {
    p = pick_trade_(view, *self);
  } else if ((roll -= cfg_.w_communicate) < 0) {
    if (const Agent* peer = pick_peer_(view, *self, /*same_region*/ false)) {
      p = Communicate{peer->id, "ping from " + id_ + " at tick " + std::to_string(now)};
    }
  } else if ((roll -= cfg_.w_observe) < 0) {
    p = Observe{};
  } else if ((roll -= cfg_.w_fork) < 0) {
    Fork f{};
    f.split_percent = static_cast<int32_t>(rng_.uniform_int(30, 70));
    p = f;
  } else if ((roll -= cfg_.w_merge) < 0) {
    if (const Agent* peer = pick_peer_(view, *self, /*same_region*/ true)) p = Merge{peer->id};
  } else {
    p = Die{"wanderer gave up"};
  }

  out.push_back(Action::of(id_, std::move(p), now));
  return out;
}

} // namespace wsim::agents
