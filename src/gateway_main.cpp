#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "httplib.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wsim/action_queue.hpp"
#include "wsim/codec.hpp"
#include "wsim/config.hpp"
#include "wsim/errors.hpp"
#include "wsim/ledger.hpp"
#include "wsim/replay.hpp"
#include "wsim/scheduler.hpp"
#include "wsim/snapshot_store.hpp"

using nlohmann::json;

namespace {

constexpr std::size_t kDefaultEventLimit = 100;
constexpr std::size_t kMaxEventLimit = 1000;

} // namespace

// ---------------- Helpers ----------------
static void set_no_cache(httplib::Response& res) {
  res.set_header("Cache-Control", "no-store, max-age=0");
  res.set_header("Pragma", "no-cache");
}

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  set_no_cache(res);
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, int status, const std::string& message) {
  send_json(res, status, json{{"error", message}});
}

// Integer query parameter; nullopt if absent, throws std::invalid_argument if malformed.
static std::optional<long long> get_ll(const httplib::Request& req, const char* key) {
  if (!req.has_param(key)) return std::nullopt;
  const std::string v = req.get_param_value(key);
  std::size_t used = 0;
  long long out = 0;
  try {
    out = std::stoll(v, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string(key) + " must be an integer");
  }
  if (used != v.size()) throw std::invalid_argument(std::string(key) + " must be an integer");
  return out;
}

static json regions_json(const wsim::WorldState& s) {
  json out = json::array();
  for (const auto& [rid, r] : s.regions) out.push_back(r);
  return out;
}

// ---------------- main ----------------
int main(int argc, char** argv) {
  wsim::ServerConfig cfg{};
  try {
    cfg = wsim::parse_server_args(std::vector<std::string>(argv + 1, argv + argc));
    if (cfg.help) {
      std::cout << wsim::server_usage("worldsim_gateway");
      return 0;
    }
    wsim::apply_log_level(cfg.log_level);
  } catch (const wsim::ConfigError& e) {
    std::cerr << "error: " << e.what() << "\n\n" << wsim::server_usage("worldsim_gateway");
    return 1;
  }

  std::unique_ptr<wsim::Ledger> ledger;
  std::unique_ptr<wsim::Scheduler> scheduler;
  wsim::SnapshotStore snapshots(cfg.state_dir);
  wsim::RejectionJournal journal(cfg.rejections_path());
  wsim::ActionQueue queue(cfg.queue_capacity);

  try {
    ledger = wsim::Ledger::open_file(cfg.ledger_path);

    wsim::SchedulerOptions opts{};
    opts.tick_interval = std::chrono::milliseconds(cfg.tick_ms);
    opts.snapshot_every = cfg.snapshot_every;
    scheduler = std::make_unique<wsim::Scheduler>(*ledger, queue, wsim::load_world_definition(cfg), opts,
                                                  &snapshots, &journal);
  } catch (const wsim::IntegrityError& e) {
    spdlog::critical("startup integrity failure: {}", e.what());
    return 3;
  } catch (const wsim::ConfigError& e) {
    std::cerr << "error: " << e.what() << "\n\n" << wsim::server_usage("worldsim_gateway");
    return 1;
  } catch (const std::exception& e) {
    spdlog::critical("startup failed: {}", e.what());
    return 2;
  }

  scheduler->start();

  httplib::Server svr;

  // Allow typing "exit" or "quit" to stop cleanly
  std::thread stdin_thread([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "exit" || line == "quit") {
        svr.stop();
        break;
      }
    }
  });

  // ---- Observer (read-only) ----
  svr.Get("/api/observer/health", [&](const httplib::Request&, httplib::Response& res) {
    const auto view = scheduler->view();
    const auto fault = scheduler->fault();
    const auto last = scheduler->last_stats();
    send_json(res, fault ? 503 : 200,
              json{{"status", fault ? "halted" : "ok"},
                   {"running", scheduler->running()},
                   {"tick", view->tick},
                   {"state_hash", last.state_hash},
                   {"queue_depth", queue.size()},
                   {"ledger_records", ledger->size()},
                   {"fault", fault ? json(*fault) : json(nullptr)}});
  });

  svr.Get("/api/observer/world/state", [&](const httplib::Request&, httplib::Response& res) {
    const auto view = scheduler->view();
    send_json(res, 200, wsim::snapshot_to_json(*view));
  });

  svr.Get("/api/observer/world/regions", [&](const httplib::Request&, httplib::Response& res) {
    const auto view = scheduler->view();
    send_json(res, 200, json{{"tick", view->tick}, {"regions", regions_json(*view)}});
  });

  svr.Get(R"(/api/observer/agents/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    const auto view = scheduler->view();
    const wsim::Agent* a = view->find_agent(id);
    if (!a) {
      send_error(res, 404, "unknown agent " + id);
      return;
    }
    send_json(res, 200, json{{"tick", view->tick}, {"agent", *a}});
  });

  svr.Get("/api/observer/ledger/events", [&](const httplib::Request& req, httplib::Response& res) {
    wsim::LedgerQuery q{};
    q.limit = kDefaultEventLimit;
    try {
      if (const auto v = get_ll(req, "from")) q.from = *v;
      if (const auto v = get_ll(req, "to")) q.to = *v;
      if (const auto v = get_ll(req, "limit")) {
        if (*v <= 0) throw std::invalid_argument("limit must be positive");
        q.limit = std::min<std::size_t>(static_cast<std::size_t>(*v), kMaxEventLimit);
      }
    } catch (const std::invalid_argument& e) {
      send_error(res, 400, e.what());
      return;
    }
    if (req.has_param("agent_id")) q.agent = req.get_param_value("agent_id");

    json events = json::array();
    for (const auto& r : ledger->query(q)) events.push_back(wsim::record_to_json(r));
    send_json(res, 200, json{{"count", events.size()}, {"events", std::move(events)}});
  });

  svr.Get(R"(/api/observer/replay/(-?\d+))", [&](const httplib::Request& req, httplib::Response& res) {
    wsim::Tick tick = 0;
    try {
      tick = std::stoll(req.matches[1].str());
    } catch (const std::out_of_range&) {
      send_error(res, 400, "tick out of range");
      return;
    }

    wsim::ReplayEngine replay(*ledger, &snapshots);
    try {
      send_json(res, 200, wsim::snapshot_to_json(replay.replay(tick)));
    } catch (const std::out_of_range& e) {
      send_error(res, 404, e.what());
    } catch (const wsim::IntegrityError& e) {
      spdlog::critical("replay of tick {} failed: {}", tick, e.what());
      send_error(res, 500, e.what());
    } catch (const wsim::CodecError& e) {
      spdlog::error("replay of tick {} failed: {}", tick, e.what());
      send_error(res, 500, e.what());
    }
  });

  // Observers never mutate anything
  const auto method_not_allowed = [](const httplib::Request&, httplib::Response& res) {
    res.set_header("Allow", "GET");
    send_error(res, 405, "observer routes are read-only");
  };
  svr.Post(R"(/api/observer/.*)", method_not_allowed);
  svr.Put(R"(/api/observer/.*)", method_not_allowed);
  svr.Patch(R"(/api/observer/.*)", method_not_allowed);
  svr.Delete(R"(/api/observer/.*)", method_not_allowed);

  // ---- Inbound actions (behind the authenticating proxy) ----
  svr.Post("/api/agent/actions", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string agent = req.get_header_value("X-Agent-ID");
    if (agent.empty()) {
      send_error(res, 400, "missing X-Agent-ID");
      return;
    }
    if (!wsim::is_valid_utf8(agent)) {
      send_error(res, 400, "X-Agent-ID must be UTF-8");
      return;
    }

    json body = json::parse(req.body, nullptr, /*allow_exceptions*/ false);
    if (body.is_discarded() || !body.is_object()) {
      send_error(res, 400, "body must be a JSON object");
      return;
    }
    body["agent"] = agent;

    const auto view = scheduler->view();
    wsim::Action action{};
    try {
      action = wsim::action_from_json(body);
    } catch (const wsim::CodecError& e) {
      send_error(res, 400, e.what());
      return;
    }
    action.submitted_tick = view->tick;

    if (scheduler->halted()) {
      send_error(res, 503, "world is halted");
      return;
    }
    const auto type = std::string(wsim::to_string(action.kind()));
    if (queue.submit(std::move(action)) == wsim::SubmitStatus::QueueFull) {
      send_error(res, 503, "action queue is full");
      return;
    }
    send_json(res, 202, json{{"status", "queued"}, {"agent", agent}, {"type", type}, {"tick", view->tick + 1}});
  });

  spdlog::info("worldsim gateway listening on http://0.0.0.0:{}/ (ledger {}, state dir {})", cfg.port,
               cfg.ledger_path, cfg.state_dir);
  std::cout << "Type 'exit' (or 'quit') then press Enter to stop cleanly.\n";

  if (!svr.listen("0.0.0.0", cfg.port)) {
    spdlog::critical("cannot listen on port {}", cfg.port);
    scheduler->stop();
    stdin_thread.detach();
    return 2;
  }

  // Clean shutdown
  scheduler->stop();
  if (stdin_thread.joinable()) stdin_thread.join();
  return 0;
}
