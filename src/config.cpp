#include "wsim/config.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wsim/codec.hpp"
#include "wsim/errors.hpp"

namespace wsim {

namespace {

template <class T>
T parse_number(const std::string& flag, const std::string& text, T min_value) {
  std::size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(text, &used);
  } catch (const std::exception&) {
    throw ConfigError(flag + ": '" + text + "' is not a number");
  }
  if (used != text.size()) throw ConfigError(flag + ": '" + text + "' is not a number");
  if (v < static_cast<long long>(min_value)) {
    throw ConfigError(flag + ": must be at least " + std::to_string(min_value));
  }
  return static_cast<T>(v);
}

uint64_t parse_seed(const std::string& text) {
  std::size_t used = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(text, &used);
  } catch (const std::exception&) {
    throw ConfigError("--seed: '" + text + "' is not an unsigned number");
  }
  if (used != text.size() || text.front() == '-') throw ConfigError("--seed: '" + text + "' is not an unsigned number");
  return static_cast<uint64_t>(v);
}

} // namespace

std::optional<std::string> process_env(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) return std::nullopt;
  return std::string(v);
}

ServerConfig parse_server_args(const std::vector<std::string>& args, const EnvLookup& env) {
  ServerConfig cfg{};
  if (env) {
    if (auto v = env("WORLDSIM_LEDGER_FILE")) cfg.ledger_path = *v;
    if (auto v = env("WORLDSIM_STATE_DIR")) cfg.state_dir = *v;
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string flag = args[i];
    if (flag == "-h" || flag == "--help") {
      cfg.help = true;
      continue;
    }
    if (flag.rfind("--", 0) != 0) throw ConfigError("unexpected argument '" + flag + "'");

    std::string value;
    if (const auto eq = flag.find('='); eq != std::string::npos) {
      value = flag.substr(eq + 1);
      flag.resize(eq);
    } else {
      if (i + 1 >= args.size()) throw ConfigError(flag + ": missing value");
      value = args[++i];
    }

    if (flag == "--tick-ms") {
      cfg.tick_ms = parse_number<int64_t>(flag, value, 1);
    } else if (flag == "--snapshot-every") {
      cfg.snapshot_every = parse_number<int64_t>(flag, value, 0);
    } else if (flag == "--ledger") {
      if (value.empty()) throw ConfigError("--ledger: empty path");
      cfg.ledger_path = value;
    } else if (flag == "--state-dir") {
      if (value.empty()) throw ConfigError("--state-dir: empty path");
      cfg.state_dir = value;
    } else if (flag == "--seed") {
      cfg.seed = parse_seed(value);
    } else if (flag == "--queue-capacity") {
      cfg.queue_capacity = parse_number<std::size_t>(flag, value, 0);
    } else if (flag == "--port") {
      cfg.port = parse_number<int>(flag, value, 1);
      if (cfg.port > 65535) throw ConfigError("--port: must be at most 65535");
    } else if (flag == "--world") {
      cfg.world_file = value;
    } else if (flag == "--log-level") {
      if (spdlog::level::from_str(value) == spdlog::level::off && value != "off") {
        throw ConfigError("--log-level: unknown level '" + value + "'");
      }
      cfg.log_level = value;
    } else {
      throw ConfigError("unknown flag '" + flag + "'");
    }
  }
  return cfg;
}

std::string server_usage(std::string_view program) {
  std::ostringstream oss;
  oss << "Usage:\n"
      << "  " << program << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --tick-ms <ms>            tick interval (default 5000)\n"
      << "  --snapshot-every <ticks>  snapshot cadence, 0 disables (default 100)\n"
      << "  --ledger <path>           ledger file (default event_ledger.jsonl, env WORLDSIM_LEDGER_FILE)\n"
      << "  --state-dir <dir>         snapshot directory (default world_state, env WORLDSIM_STATE_DIR)\n"
      << "  --seed <n>                world seed (default 1)\n"
      << "  --queue-capacity <n>      pending action limit, 0 = unbounded (default 10000)\n"
      << "  --port <port>             HTTP port (default 8080)\n"
      << "  --world <file.json>       world definition (regions, rules)\n"
      << "  --log-level <level>       trace|debug|info|warn|error|critical|off (default info)\n";
  return oss.str();
}

WorldDefinition world_definition_from_text(std::string_view text, uint64_t seed) {
  const auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) throw ConfigError("world definition is not a JSON object");

  WorldDefinition def = default_world(seed);
  try {
    if (j.contains("rules")) def.rules = j.at("rules").get<WorldRules>();
    if (j.contains("regions")) {
      def.regions = j.at("regions").get<std::vector<Region>>();
      if (def.regions.empty()) throw ConfigError("world definition has no regions");
    }
  } catch (const CodecError& e) {
    throw ConfigError(std::string("world definition: ") + e.what());
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("world definition: ") + e.what());
  }

  std::set<RegionId> seen;
  for (const auto& r : def.regions) {
    if (r.id.empty()) throw ConfigError("world definition: region without id");
    if (!seen.insert(r.id).second) throw ConfigError("world definition: duplicate region '" + r.id + "'");
  }
  return def;
}

WorldDefinition load_world_definition(const ServerConfig& cfg) {
  if (cfg.world_file.empty()) return default_world(cfg.seed);

  std::ifstream in(cfg.world_file);
  if (!in) throw ConfigError("cannot read world definition '" + cfg.world_file + "'");
  std::ostringstream ss;
  ss << in.rdbuf();
  return world_definition_from_text(ss.str(), cfg.seed);
}

void apply_log_level(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") throw ConfigError("unknown log level '" + name + "'");
  spdlog::set_level(level);
}

} // namespace wsim
