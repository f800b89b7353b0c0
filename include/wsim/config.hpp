#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wsim/world_state.hpp"

namespace wsim {

struct ServerConfig {
  int64_t tick_ms{5000};
  int64_t snapshot_every{100};   // 0 disables snapshots
  std::string ledger_path{"event_ledger.jsonl"};
  std::string state_dir{"world_state"};
  uint64_t seed{1};
  std::size_t queue_capacity{10000};   // 0 = unbounded
  int port{8080};
  std::string world_file{};   // empty: built-in regions and rules
  std::string log_level{"info"};
  bool help{false};

  std::string rejections_path() const { return ledger_path + ".rejections.jsonl"; }
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Reads the real process environment.
std::optional<std::string> process_env(const char* name);

// Parses `--flag value` / `--flag=value` pairs on top of the defaults and the
// WORLDSIM_LEDGER_FILE / WORLDSIM_STATE_DIR environment. Flags win over the
// environment. Throws ConfigError on an unknown flag or a malformed value.
ServerConfig parse_server_args(const std::vector<std::string>& args, const EnvLookup& env = process_env);

std::string server_usage(std::string_view program);

// The configured world: the --world file if given, otherwise the built-in
// regions and rules. The seed always comes from the config.
WorldDefinition load_world_definition(const ServerConfig& cfg);

// Parses a world-definition document ({"regions": [...], "rules": {...}}).
WorldDefinition world_definition_from_text(std::string_view text, uint64_t seed);

// Sets the default spdlog logger's level. Throws ConfigError for an unknown name.
void apply_log_level(const std::string& name);

} // namespace wsim
