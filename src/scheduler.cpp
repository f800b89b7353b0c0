#include "wsim/scheduler.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wsim/codec.hpp"
#include "wsim/errors.hpp"
#include "wsim/replay.hpp"

namespace wsim {

Scheduler::Scheduler(Ledger& ledger, ActionQueue& queue, WorldDefinition def, SchedulerOptions opts,
                     SnapshotStore* snapshots, RejectionJournal* journal)
  : ledger_(ledger), queue_(queue), snapshots_(snapshots), journal_(journal), opts_(opts) {
  recover_(def);
}

Scheduler::~Scheduler() {
  stop();
}

void Scheduler::recover_(const WorldDefinition& def) {
  const auto last = ledger_.last_tick();

  if (!last) {
    TickOutcome out = engine_.genesis(def);
    ledger_.append_batch(out.tick, out.events);   // LedgerWriteError: startup fails
    spdlog::info("genesis: {} regions, seed {}, state {}", def.regions.size(), def.seed, out.state_hash);
    if (snapshots_ && opts_.snapshot_every > 0) snapshots_->save(engine_.state());
  } else {
    const auto genesis = ledger_.at_tick(0);
    if (!genesis.empty() && genesis.front().event.payload != nlohmann::json(def)) {
      spdlog::warn("configured world definition differs from the ledger genesis; using the ledger");
    }

    ReplayEngine replay(ledger_, snapshots_);
    engine_ = WorldEngine(replay.replay(*last));
    spdlog::info("recovered tick {} ({} ledger records, {} live agents, state {})", *last, ledger_.size(),
                 engine_.state().live_agent_count(), state_hash(engine_.state()));
  }

  std::lock_guard<std::mutex> lk(view_mu_);
  publish_locked_();
  last_.tick = engine_.state().tick;
  last_.state_hash = state_hash(engine_.state());
}

void Scheduler::start() {
  if (halted()) {
    spdlog::error("scheduler is halted; not starting");
    return;
  }
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return;
  spdlog::info("scheduler started (tick interval {} ms)", opts_.tick_interval.count());
  worker_ = std::thread([this]() { loop_(); });
}

void Scheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(wake_mu_);
    if (!running_.exchange(false) && !worker_.joinable()) return;
  }
  wake_.notify_all();
  if (worker_.joinable()) worker_.join();
  spdlog::info("scheduler stopped at tick {}", view()->tick);
}

void Scheduler::loop_() {
  using clock = std::chrono::steady_clock;

  clock::time_point next = clock::now() + opts_.tick_interval;
  for (;;) {
    {
      std::unique_lock<std::mutex> lk(wake_mu_);
      wake_.wait_until(lk, next, [this]() { return !running_.load(); });
    }
    if (!running_.load()) break;

    if (!run_tick()) {
      running_.store(false);
      break;
    }

    // an overrunning tick delays the next one instead of overlapping it
    next = std::max<clock::time_point>(next + opts_.tick_interval, clock::now());
  }
}

std::optional<TickStats> Scheduler::run_tick() {
  std::lock_guard<std::mutex> tick_lk(tick_mu_);
  if (halted()) return std::nullopt;

  std::vector<Action> actions = queue_.drain();
  order_for_tick(actions);

  WorldEngine next = engine_;
  TickOutcome out{};
  try {
    out = next.advance(actions);
  } catch (const IntegrityError& e) {
    halt_(e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    halt_("tick " + std::to_string(engine_.state().tick + 1) + " failed: " + e.what());
    return std::nullopt;
  }

  try {
    ledger_.append_batch(out.tick, out.events);
  } catch (const LedgerWriteError& e) {
    halt_(e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    halt_("tick " + std::to_string(out.tick) + " could not be recorded: " + e.what());
    return std::nullopt;
  }

  engine_ = std::move(next);

  TickStats stats{};
  stats.tick = out.tick;
  stats.drained = actions.size();
  stats.accepted = out.accepted;
  stats.rejected = out.rejections.size();
  stats.events = out.events.size();
  stats.state_hash = out.state_hash;

  {
    std::lock_guard<std::mutex> lk(view_mu_);
    publish_locked_();
    last_ = stats;
  }

  for (const auto& r : out.rejections) {
    spdlog::debug("tick {}: rejected {} from {}: {}", out.tick, to_string(r.action.kind()), r.action.agent,
                  to_string(r.reason));
    if (journal_ && !journal_->record(out.tick, r.action.agent, to_string(r.action.kind()), to_string(r.reason),
                                      action_to_json(r.action))) {
      spdlog::warn("could not write to rejection journal {}", journal_->path());
    }
  }
  spdlog::debug("tick {}: drained={} accepted={} rejected={} events={} state={}", stats.tick, stats.drained,
                stats.accepted, stats.rejected, stats.events, stats.state_hash);

  if (snapshots_ && opts_.snapshot_every > 0 && out.tick % opts_.snapshot_every == 0) {
    snapshots_->save(engine_.state());
  }
  return stats;
}

void Scheduler::publish_locked_() {
  view_ = std::make_shared<const WorldState>(engine_.state());
}

void Scheduler::halt_(const std::string& why) {
  {
    std::lock_guard<std::mutex> lk(view_mu_);
    fault_ = why;
  }
  running_.store(false);
  spdlog::critical("scheduler halted at tick {}: {}", engine_.state().tick + 1, why);
}

std::shared_ptr<const WorldState> Scheduler::view() const {
  std::lock_guard<std::mutex> lk(view_mu_);
  return view_;
}

std::optional<std::string> Scheduler::fault() const {
  std::lock_guard<std::mutex> lk(view_mu_);
  return fault_;
}

TickStats Scheduler::last_stats() const {
  std::lock_guard<std::mutex> lk(view_mu_);
  return last_;
}

} // namespace wsim
