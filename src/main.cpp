#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "wsim/action_queue.hpp"
#include "wsim/agents/wanderer.hpp"
#include "wsim/codec.hpp"
#include "wsim/config.hpp"
#include "wsim/errors.hpp"
#include "wsim/ledger.hpp"
#include "wsim/replay.hpp"
#include "wsim/scheduler.hpp"
#include "wsim/snapshot_store.hpp"

namespace {

// Options only some commands take; everything else goes to parse_server_args.
struct CliOptions {
  int64_t ticks{100};
  int64_t agents{8};
  std::optional<wsim::Tick> from{};
  std::optional<wsim::Tick> to{};
  std::optional<std::string> agent{};
  std::size_t limit{1000};
  bool no_snapshots{false};
  std::vector<std::string> positional{};
  std::vector<std::string> rest{};
};

void usage() {
  std::cout
    << "Usage:\n"
    << "  worldsim_cli simulate [--ticks N] [--agents N] [options]\n"
    << "  worldsim_cli replay <tick> [--no-snapshots] [options]\n"
    << "  worldsim_cli verify [options]\n"
    << "  worldsim_cli events [--from T] [--to T] [--agent ID] [--limit N] [options]\n"
    << "\n"
    << wsim::server_usage("worldsim_cli <command>");
}

int64_t to_int(const std::string& flag, const std::string& v) {
  std::size_t used = 0;
  int64_t out = 0;
  try {
    out = std::stoll(v, &used);
  } catch (const std::exception&) {
    throw wsim::ConfigError(flag + ": '" + v + "' is not a number");
  }
  if (used != v.size()) throw wsim::ConfigError(flag + ": '" + v + "' is not a number");
  return out;
}

CliOptions split_args(int argc, char** argv) {
  CliOptions o{};
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) throw wsim::ConfigError(a + ": missing value");
      return argv[++i];
    };

    if (a == "--ticks") o.ticks = to_int(a, value());
    else if (a == "--agents") o.agents = to_int(a, value());
    else if (a == "--from") o.from = to_int(a, value());
    else if (a == "--to") o.to = to_int(a, value());
    else if (a == "--agent") o.agent = value();
    else if (a == "--limit") o.limit = static_cast<std::size_t>(std::max<int64_t>(0, to_int(a, value())));
    else if (a == "--no-snapshots") o.no_snapshots = true;
    else if (a.rfind("--", 0) == 0 || a == "-h") o.rest.push_back(a);
    else if (!o.rest.empty() && o.rest.back().rfind("--", 0) == 0 && o.rest.back().find('=') == std::string::npos &&
             o.rest.back() != "--help") o.rest.push_back(a);   // value of a server flag
    else o.positional.push_back(a);
  }
  if (o.ticks < 0) throw wsim::ConfigError("--ticks: must not be negative");
  if (o.agents < 0) throw wsim::ConfigError("--agents: must not be negative");
  return o;
}

std::unique_ptr<wsim::Ledger> open_existing_ledger(const std::string& path) {
  if (!std::filesystem::exists(path)) throw wsim::ConfigError("no ledger at '" + path + "'");
  return wsim::Ledger::open_file(path);
}

int cmd_simulate(const wsim::ServerConfig& cfg, const CliOptions& o) {
  auto ledger = wsim::Ledger::open_file(cfg.ledger_path);
  wsim::SnapshotStore snapshots(cfg.state_dir);
  wsim::RejectionJournal journal(cfg.rejections_path());
  wsim::ActionQueue queue(cfg.queue_capacity);

  wsim::SchedulerOptions opts{};
  opts.tick_interval = std::chrono::milliseconds(cfg.tick_ms);
  opts.snapshot_every = cfg.snapshot_every;

  wsim::Scheduler scheduler(*ledger, queue, wsim::load_world_definition(cfg), opts, &snapshots, &journal);

  // Wanderers spread over the regions in order, seeded from the world seed
  std::vector<wsim::agents::Wanderer> wanderers;
  {
    const auto view = scheduler.view();
    std::vector<wsim::RegionId> homes;
    for (const auto& [rid, r] : view->regions) homes.push_back(rid);

    uint64_t sm = cfg.seed;
    for (int64_t i = 0; i < o.agents && !homes.empty(); ++i) {
      char id[32];
      std::snprintf(id, sizeof(id), "wanderer-%03lld", static_cast<long long>(i + 1));
      wanderers.emplace_back(id, homes[static_cast<std::size_t>(i) % homes.size()]);
      wanderers.back().seed(wsim::splitmix64(sm) ^ (static_cast<uint64_t>(i) + 1ull));
    }
  }

  std::size_t accepted = 0;
  std::size_t rejected = 0;
  std::size_t queue_full = 0;
  for (int64_t t = 0; t < o.ticks; ++t) {
    const auto view = scheduler.view();
    for (auto& w : wanderers) {
      for (auto& a : w.step(*view)) {
        if (queue.submit(std::move(a)) == wsim::SubmitStatus::QueueFull) queue_full++;
      }
    }

    const auto stats = scheduler.run_tick();
    if (!stats) {
      std::cout << "SIMULATION HALTED: " << scheduler.fault().value_or("unknown fault") << "\n";
      return 2;
    }
    accepted += stats->accepted;
    rejected += stats->rejected;
  }

  const auto last = scheduler.last_stats();
  const auto view = scheduler.view();
  std::cout << "SIMULATION COMPLETE "
            << "tick=" << last.tick
            << " live_agents=" << view->live_agent_count()
            << " accepted=" << accepted
            << " rejected=" << rejected
            << " queue_full=" << queue_full
            << " ledger_records=" << ledger->size()
            << " state=" << last.state_hash
            << "\n";
  return 0;
}

int cmd_replay(const wsim::ServerConfig& cfg, const CliOptions& o) {
  if (o.positional.empty()) {
    usage();
    return 1;
  }
  const wsim::Tick tick = to_int("<tick>", o.positional.front());

  auto ledger = open_existing_ledger(cfg.ledger_path);
  wsim::SnapshotStore snapshots(cfg.state_dir);
  wsim::ReplayEngine replay(*ledger, o.no_snapshots ? nullptr : &snapshots);

  const wsim::WorldState s = replay.replay(tick);
  std::cout << wsim::snapshot_to_json(s).dump(2) << "\n";
  return 0;
}

int cmd_verify(const wsim::ServerConfig& cfg) {
  auto ledger = open_existing_ledger(cfg.ledger_path);
  wsim::ReplayEngine replay(*ledger);

  const auto report = replay.verify();
  std::cout << "VERIFY OK "
            << "records=" << report.records
            << " last_tick=" << report.last_tick
            << " state=" << report.state_hash
            << " discarded_tail=" << ledger->discarded_on_open()
            << "\n";
  return 0;
}

int cmd_events(const wsim::ServerConfig& cfg, const CliOptions& o) {
  auto ledger = open_existing_ledger(cfg.ledger_path);

  wsim::LedgerQuery q{};
  if (o.from) q.from = *o.from;
  q.to = o.to;
  q.agent = o.agent;
  q.limit = o.limit;

  for (const auto& r : ledger->query(q)) std::cout << wsim::encode_record(r) << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("worldsim"));

  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];
  if (cmd == "-h" || cmd == "--help") {
    usage();
    return 0;
  }

  try {
    const CliOptions o = split_args(argc, argv);
    const wsim::ServerConfig cfg = wsim::parse_server_args(o.rest);
    if (cfg.help) {
      usage();
      return 0;
    }
    wsim::apply_log_level(cfg.log_level);

    if (cmd == "simulate") return cmd_simulate(cfg, o);
    if (cmd == "replay") return cmd_replay(cfg, o);
    if (cmd == "verify") return cmd_verify(cfg);
    if (cmd == "events") return cmd_events(cfg, o);

    std::cerr << "unknown command '" << cmd << "'\n";
    usage();
    return 1;
  } catch (const wsim::ConfigError& e) {
    std::cerr << "error: " << e.what() << "\n\n";
    usage();
    return 1;
  } catch (const wsim::IntegrityError& e) {
    spdlog::critical("integrity failure: {}", e.what());
    std::cout << "VERIFY FAILED: " << e.what() << "\n";
    return 3;
  } catch (const std::out_of_range& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 2;
  }
}
