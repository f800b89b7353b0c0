#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "wsim/actions.hpp"
#include "wsim/errors.hpp"
#include "wsim/events.hpp"
#include "wsim/resources.hpp"
#include "wsim/world_state.hpp"

namespace wsim {

// ---- nlohmann ADL hooks ----
void to_json(nlohmann::json& j, const ResourcePool& p);
void from_json(const nlohmann::json& j, ResourcePool& p);

void to_json(nlohmann::json& j, const Region& r);      // includes the pool
void from_json(const nlohmann::json& j, Region& r);

void to_json(nlohmann::json& j, const Agent& a);
void from_json(const nlohmann::json& j, Agent& a);

void to_json(nlohmann::json& j, const WorldRules& r);
void from_json(const nlohmann::json& j, WorldRules& r);

void to_json(nlohmann::json& j, const WorldDefinition& d);
void from_json(const nlohmann::json& j, WorldDefinition& d);

// ---- actions ----
nlohmann::json payload_to_json(const ActionPayload& p);
ActionPayload payload_from_json(ActionKind kind, const nlohmann::json& j);

// {"agent": ..., "type": ..., "payload": {...}}; used by the gateway and CLI.
nlohmann::json action_to_json(const Action& a);
Action action_from_json(const nlohmann::json& j);

// ---- world state / snapshots ----
// Canonical encoding of the full state (no hash field).
nlohmann::json state_to_json(const WorldState& s);

// Snapshot record layout: {tick, state_hash, seed, rules, regions[], agents[], resource_pools[]}.
nlohmann::json snapshot_to_json(const WorldState& s);
// Throws CodecError when malformed. Does not verify the hash.
WorldState snapshot_from_json(const nlohmann::json& j, std::string* stored_hash = nullptr);

// FNV-1a 64 over the canonical encoding, as 16 lowercase hex digits.
std::string state_hash(const WorldState& s);
uint64_t fnv1a64(std::string_view bytes) noexcept;
std::string to_hex(uint64_t v);

// True when `bytes` is well-formed UTF-8, the only text the JSON encodings accept.
bool is_valid_utf8(std::string_view bytes) noexcept;

// ---- ledger records ----
nlohmann::json record_to_json(const LedgerRecord& r);
LedgerRecord record_from_json(const nlohmann::json& j);

// Single line, no trailing newline.
std::string encode_record(const LedgerRecord& r);
LedgerRecord decode_record(std::string_view line);

} // namespace wsim
