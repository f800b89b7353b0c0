#include "wsim/replay.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "wsim/codec.hpp"
#include "wsim/engine.hpp"
#include "wsim/errors.hpp"

namespace wsim {

namespace {

ActionKind action_kind_for(EventType t) noexcept {
  return static_cast<ActionKind>(static_cast<uint8_t>(t) - static_cast<uint8_t>(EventType::Register));
}

std::string at_tick(Tick t) {
  return "tick " + std::to_string(t);
}

const std::string& recorded_hash(Tick t, const std::vector<LedgerRecord>& batch) {
  if (batch.empty() || batch.back().event.type != EventType::TickCommit) {
    throw IntegrityError(at_tick(t) + ": batch has no tick_commit record");
  }
  const auto& payload = batch.back().event.payload;
  if (!payload.contains("state_hash") || !payload.at("state_hash").is_string()) {
    throw IntegrityError(at_tick(t) + ": tick_commit without state_hash");
  }
  return payload.at("state_hash").get_ref<const std::string&>();
}

void compare(Tick t, const std::vector<LedgerRecord>& recorded, const std::vector<Event>& replayed) {
  const std::size_t n = std::min(recorded.size(), replayed.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (recorded[i].event == replayed[i]) continue;
    throw IntegrityError(at_tick(t) + ": event " + std::to_string(i) + " diverges (recorded " +
                         std::string(to_string(recorded[i].event.type)) + " at sequence " +
                         std::to_string(recorded[i].sequence) + ", replayed " +
                         std::string(to_string(replayed[i].type)) + ")");
  }
  if (recorded.size() != replayed.size()) {
    throw IntegrityError(at_tick(t) + ": recorded " + std::to_string(recorded.size()) +
                         " events, replay produced " + std::to_string(replayed.size()));
  }
}

// Re-runs one committed tick on `engine` and checks it against the record.
void replay_tick(WorldEngine& engine, Tick t, const std::vector<LedgerRecord>& batch) {
  const std::string& expected_hash = recorded_hash(t, batch);

  TickOutcome out{};
  if (t == 0) {
    if (batch.front().event.type != EventType::Genesis) {
      throw IntegrityError(at_tick(0) + ": first record is not genesis");
    }
    WorldDefinition def{};
    try {
      def = batch.front().event.payload.get<WorldDefinition>();
    } catch (const nlohmann::json::exception& e) {
      throw CodecError(std::string("genesis payload: ") + e.what());
    }
    out = engine.genesis(def);
  } else {
    const auto actions = actions_from_batch(batch);
    out = engine.advance(actions);
    if (!out.rejections.empty()) {
      throw IntegrityError(at_tick(t) + ": recorded action for " + out.rejections.front().action.agent +
                           " is rejected on replay (" + std::string(to_string(out.rejections.front().reason)) + ")");
    }
  }

  compare(t, batch, out.events);
  if (out.state_hash != expected_hash) {
    throw IntegrityError(at_tick(t) + ": state hash " + out.state_hash + " != recorded " + expected_hash);
  }
}

} // namespace

std::vector<Action> actions_from_batch(const std::vector<LedgerRecord>& batch) {
  std::vector<Action> out;
  for (const auto& r : batch) {
    if (!is_action_event(r.event.type)) continue;
    if (r.event.agent_ids.empty()) {
      throw CodecError("action event at sequence " + std::to_string(r.sequence) + " names no agent");
    }
    if (!r.event.payload.contains("action")) {
      throw CodecError("action event at sequence " + std::to_string(r.sequence) + " has no action payload");
    }
    Action a{};
    a.agent = r.event.agent_ids.front();
    a.submitted_tick = r.event.tick;
    a.arrival = static_cast<uint64_t>(out.size());
    a.payload = payload_from_json(action_kind_for(r.event.type), r.event.payload.at("action"));
    out.push_back(std::move(a));
  }
  return out;
}

WorldState ReplayEngine::replay(Tick target) const {
  const auto last = ledger_.last_tick();
  if (!last || target < 0 || target > *last) {
    throw std::out_of_range("tick " + std::to_string(target) + " is not committed (last committed: " +
                            (last ? std::to_string(*last) : std::string("none")) + ")");
  }

  WorldState base{};
  if (snapshots_) {
    if (const auto snap_tick = snapshots_->latest_at_or_before(target)) {
      base = snapshots_->load(*snap_tick);

      // the snapshot must also agree with what the ledger committed at that tick
      const auto batch = ledger_.at_tick(*snap_tick);
      const std::string& expected = recorded_hash(*snap_tick, batch);
      if (state_hash(base) != expected) {
        throw IntegrityError("snapshot at " + at_tick(*snap_tick) + " disagrees with the ledger commit hash");
      }
    }
  }
  return replay_from(std::move(base), target);
}

WorldState ReplayEngine::replay_from(WorldState base, Tick target) const {
  const Tick first = base.initialized() ? base.tick + 1 : 0;
  WorldEngine engine(std::move(base));
  if (first > target) return engine.state();

  std::map<Tick, std::vector<LedgerRecord>> batches;
  for (auto& r : ledger_.range(first, target)) batches[r.event.tick].push_back(std::move(r));

  for (Tick t = first; t <= target; ++t) {
    auto it = batches.find(t);
    if (it == batches.end()) throw IntegrityError(at_tick(t) + ": no committed batch in the ledger");
    replay_tick(engine, t, it->second);
  }
  return engine.state();
}

VerifyReport ReplayEngine::verify() const {
  const auto records = ledger_.scan();
  VerifyReport report{};
  report.records = records.size();
  if (records.empty()) return report;

  std::vector<LedgerRecord> batch;
  WorldEngine engine;
  Tick expected_tick = 0;

  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& r = records[i];
    if (r.sequence != i) {
      throw IntegrityError("sequence gap: record " + std::to_string(i) + " has sequence " + std::to_string(r.sequence));
    }
    if (r.event.tick != expected_tick) {
      throw IntegrityError("record " + std::to_string(r.sequence) + " is at tick " + std::to_string(r.event.tick) +
                           ", expected " + std::to_string(expected_tick));
    }
    batch.push_back(r);
    if (r.event.type != EventType::TickCommit) continue;

    replay_tick(engine, expected_tick, batch);
    batch.clear();
    expected_tick++;
  }

  if (!batch.empty()) throw IntegrityError(at_tick(expected_tick) + ": batch without tick_commit");

  report.last_tick = engine.state().tick;
  report.state_hash = state_hash(engine.state());
  spdlog::info("verify: {} records, ticks 0..{}, state {}", report.records, report.last_tick, report.state_hash);
  return report;
}

} // namespace wsim
