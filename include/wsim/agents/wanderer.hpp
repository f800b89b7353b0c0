#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "wsim/actions.hpp"
#include "wsim/resources.hpp"
#include "wsim/rng.hpp"
#include "wsim/types.hpp"
#include "wsim/world_state.hpp"

namespace wsim::agents {

struct WandererConfig {
  // Probability of acting at all on a tick, once claimed
  double intensity_per_tick{0.6};

  // Relative weights of the action mix
  double w_move{4.0};
  double w_trade{2.0};
  double w_communicate{2.0};
  double w_observe{1.5};
  double w_fork{0.2};
  double w_merge{0.2};
  double w_die{0.02};

  // Resources brought in at registration
  ResourcePool initial{ResourcePool::of(60, 30, 120, 50)};

  // Largest quantity offered in one trade
  Amount max_trade{10};
};

// Synthetic agent driving the world in the CLI and gateway demo. It only
// reads the last committed view and proposes actions; the validator decides.
class Wanderer final {
public:
  Wanderer(AgentId id, RegionId home, WandererConfig cfg = {})
    : id_(std::move(id)), home_(std::move(home)), cfg_(cfg) {}

  const AgentId& id() const noexcept { return id_; }

  void seed(uint64_t s) noexcept { rng_ = Rng(s); }

  std::vector<Action> step(const WorldState& view);

private:
  AgentId id_{};
  RegionId home_{};
  WandererConfig cfg_{};
  Rng rng_{0};

  RegionId pick_region_(const WorldState& view, const RegionId& not_this);
  const Agent* pick_peer_(const WorldState& view, const Agent& self, bool same_region);
  ActionPayload pick_trade_(const WorldState& view, const Agent& self);
};

} // namespace wsim::agents
