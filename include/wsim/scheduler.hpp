#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "wsim/action_queue.hpp"
#include "wsim/engine.hpp"
#include "wsim/ledger.hpp"
#include "wsim/snapshot_store.hpp"
#include "wsim/world_state.hpp"

namespace wsim {

struct SchedulerOptions {
  std::chrono::milliseconds tick_interval{5000};
  int64_t snapshot_every{100};   // 0 disables
};

struct TickStats {
  Tick tick{-1};
  std::size_t drained{0};
  std::size_t accepted{0};
  std::size_t rejected{0};
  std::size_t events{0};
  std::string state_hash{};
};

// The single writer of world state. Each tick drains the queue, advances a
// private copy of the engine, commits the batch to the ledger and only then
// promotes the copy and publishes an immutable view.
//
// The constructor recovers: an empty ledger gets the genesis batch of `def`,
// otherwise the state is rebuilt from the latest snapshot plus the ledger tail.
class Scheduler {
public:
  Scheduler(Ledger& ledger, ActionQueue& queue, WorldDefinition def, SchedulerOptions opts = {},
            SnapshotStore* snapshots = nullptr, RejectionJournal* journal = nullptr);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void start();
  void stop();
  bool running() const noexcept { return running_.load(); }

  // Runs one tick on the calling thread. Returns nullopt once halted.
  std::optional<TickStats> run_tick();

  // Last committed state; never blocks on a tick in progress.
  std::shared_ptr<const WorldState> view() const;

  // Set when a tick could not be committed; no further ticks run.
  std::optional<std::string> fault() const;
  bool halted() const { return fault().has_value(); }

  TickStats last_stats() const;

private:
  void loop_();
  void publish_locked_();
  void halt_(const std::string& why);
  void recover_(const WorldDefinition& def);

  Ledger& ledger_;
  ActionQueue& queue_;
  SnapshotStore* snapshots_{nullptr};
  RejectionJournal* journal_{nullptr};
  SchedulerOptions opts_{};

  // tick processing: one at a time
  std::mutex tick_mu_;
  WorldEngine engine_{};

  mutable std::mutex view_mu_;
  std::shared_ptr<const WorldState> view_{};
  std::optional<std::string> fault_{};
  TickStats last_{};

  // worker lifecycle
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::mutex wake_mu_;
  std::condition_variable wake_;
};

} // namespace wsim
