#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "wsim/actions.hpp"
#include "wsim/events.hpp"
#include "wsim/ledger.hpp"
#include "wsim/snapshot_store.hpp"
#include "wsim/world_state.hpp"

namespace wsim {

struct VerifyReport {
  std::size_t records{0};
  Tick last_tick{-1};
  std::string state_hash{};
};

// Rebuilds past world states from the ledger (and snapshots, when a store is
// given) by re-running the live tick function. Any disagreement with what the
// ledger recorded throws IntegrityError naming the tick.
class ReplayEngine {
public:
  explicit ReplayEngine(const Ledger& ledger, const SnapshotStore* snapshots = nullptr)
      : ledger_(ledger), snapshots_(snapshots) {}

  // Throws std::out_of_range if `target` is not a committed tick.
  WorldState replay(Tick target) const;

  // Continues from `base` (a state at base.tick, or an uninitialized state
  // to start at genesis) through `target`.
  WorldState replay_from(WorldState base, Tick target) const;

  // Full replay from genesis without snapshots, plus sequence checks.
  VerifyReport verify() const;

private:
  const Ledger& ledger_;
  const SnapshotStore* snapshots_{nullptr};
};

// The accepted actions recorded in one tick's batch, in commit order.
std::vector<Action> actions_from_batch(const std::vector<LedgerRecord>& batch);

} // namespace wsim
