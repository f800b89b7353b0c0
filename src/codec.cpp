#include "wsim/codec.hpp"

#include <cstdio>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace wsim {

using nlohmann::json;

namespace {

template <class T>
T require(const json& j, const char* key) {
  if (!j.is_object() || !j.contains(key)) throw CodecError(std::string("missing field '") + key + "'");
  try {
    return j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw CodecError(std::string("bad field '") + key + "': " + e.what());
  }
}

// Absent keys fall back; present keys of the wrong type are CodecErrors.
template <class T>
T optional_field(const json& j, const char* key, T fallback) {
  if (!j.is_object()) throw CodecError(std::string("cannot read '") + key + "' from a non-object");
  if (!j.contains(key)) return fallback;
  try {
    return j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw CodecError(std::string("bad field '") + key + "': " + e.what());
  }
}

ResourceKind require_kind(const json& j, const char* key) {
  const auto s = require<std::string>(j, key);
  const auto k = parse_resource_kind(s);
  if (!k) throw CodecError("unknown resource kind '" + s + "'");
  return *k;
}

json resource_amount_to_json(const ResourceAmount& r) {
  return json{{"kind", std::string(to_string(r.kind))}, {"amount", r.amount}};
}

ResourceAmount resource_amount_from_json(const json& j) {
  ResourceAmount r{};
  r.kind = require_kind(j, "kind");
  if (!j.contains("amount") || !j.at("amount").is_number_integer()) {
    throw CodecError("resource amount must be an integer");
  }
  r.amount = j.at("amount").get<Amount>();
  return r;
}

} // namespace

// ---------------- resources / regions / agents ----------------

void to_json(json& j, const ResourcePool& p) {
  j = json::object();
  for (auto k : kResourceKinds) j[std::string(to_string(k))] = p[k];
}

void from_json(const json& j, ResourcePool& p) {
  if (!j.is_object()) throw CodecError("resource pool must be an object");
  p = ResourcePool{};
  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto k = parse_resource_kind(it.key());
    if (!k) throw CodecError("unknown resource kind '" + it.key() + "'");
    if (!it.value().is_number_integer()) throw CodecError("resource amount must be an integer");
    p[*k] = it.value().get<Amount>();
  }
}

void to_json(json& j, const Region& r) {
  j = json{{"id", r.id},
           {"name", r.name},
           {"x", r.x},
           {"y", r.y},
           {"danger", r.danger},
           {"resource_multiplier", r.resource_multiplier},
           {"capacity", r.capacity},
           {"occupancy", r.occupancy},
           {"pool", r.pool}};
}

void from_json(const json& j, Region& r) {
  r = Region{};
  r.id = require<std::string>(j, "id");
  r.name = optional_field(j, "name", r.id);
  r.x = optional_field(j, "x", 0.0);
  r.y = optional_field(j, "y", 0.0);
  r.danger = optional_field(j, "danger", 0.0);
  r.resource_multiplier = optional_field(j, "resource_multiplier", 1.0);
  r.capacity = require<int32_t>(j, "capacity");
  r.occupancy = optional_field<int32_t>(j, "occupancy", 0);
  if (j.contains("pool")) r.pool = j.at("pool").get<ResourcePool>();
  if (r.danger < 0.0 || r.danger > 1.0) throw CodecError("region " + r.id + ": danger outside [0, 1]");
  if (r.capacity < 0) throw CodecError("region " + r.id + ": negative capacity");
}

void to_json(json& j, const Agent& a) {
  j = json{{"id", a.id},
           {"status", std::string(to_string(a.status))},
           {"region", a.region},
           {"resources", a.resources},
           {"created_tick", a.created_tick},
           {"last_action_tick", a.last_action_tick},
           {"retired_tick", a.retired_tick},
           {"claim_ref", a.claim_ref},
           {"parent", a.parent}};
}

void from_json(const json& j, Agent& a) {
  a = Agent{};
  a.id = require<std::string>(j, "id");
  const auto st = require<std::string>(j, "status");
  const auto parsed = parse_agent_status(st);
  if (!parsed) throw CodecError("unknown agent status '" + st + "'");
  a.status = *parsed;
  a.region = require<std::string>(j, "region");
  a.resources = require<ResourcePool>(j, "resources");
  a.created_tick = require<Tick>(j, "created_tick");
  a.last_action_tick = optional_field(j, "last_action_tick", a.created_tick);
  a.retired_tick = optional_field(j, "retired_tick", Tick{-1});
  a.claim_ref = optional_field(j, "claim_ref", std::string{});
  a.parent = optional_field(j, "parent", std::string{});
}

// ---------------- rules / definition ----------------

void to_json(json& j, const WorldRules& r) {
  json costs = json::object();
  for (uint8_t i = 0; i < std::variant_size_v<ActionPayload>; ++i) {
    const auto k = static_cast<ActionKind>(i);
    costs[std::string(to_string(k))] = r.cost(k);
  }
  j = json{{"action_costs", costs},
           {"distance_cost_factor", r.distance_cost_factor},
           {"regen", r.regen},
           {"caps", r.caps},
           {"upkeep", r.upkeep},
           {"pool_regen", r.pool_regen},
           {"pool_caps", r.pool_caps},
           {"danger_damage", r.danger_damage}};
}

void from_json(const json& j, WorldRules& r) {
  // Missing fields keep the defaults so world files can override selectively.
  r = default_rules();
  if (!j.is_object()) throw CodecError("rules must be an object");
  if (j.contains("action_costs")) {
    const auto& costs = j.at("action_costs");
    if (!costs.is_object()) throw CodecError("action_costs must be an object");
    for (auto it = costs.begin(); it != costs.end(); ++it) {
      const auto k = parse_action_kind(it.key());
      if (!k) throw CodecError("unknown action kind '" + it.key() + "'");
      r.cost_mut(*k) = it.value().get<ResourcePool>();
    }
  }
  r.distance_cost_factor = optional_field(j, "distance_cost_factor", r.distance_cost_factor);
  if (j.contains("regen")) r.regen = j.at("regen").get<ResourcePool>();
  if (j.contains("caps")) r.caps = j.at("caps").get<ResourcePool>();
  if (j.contains("upkeep")) r.upkeep = j.at("upkeep").get<ResourcePool>();
  if (j.contains("pool_regen")) r.pool_regen = j.at("pool_regen").get<ResourcePool>();
  if (j.contains("pool_caps")) r.pool_caps = j.at("pool_caps").get<ResourcePool>();
  r.danger_damage = optional_field(j, "danger_damage", r.danger_damage);
}

void to_json(json& j, const WorldDefinition& d) {
  j = json{{"seed", d.seed}, {"rules", d.rules}, {"regions", d.regions}};
}

void from_json(const json& j, WorldDefinition& d) {
  d = WorldDefinition{};
  d.seed = optional_field(j, "seed", d.seed);
  d.rules = j.contains("rules") ? j.at("rules").get<WorldRules>() : default_rules();
  d.regions = require<std::vector<Region>>(j, "regions");
  if (d.regions.empty()) throw CodecError("world definition has no regions");
}

// ---------------- actions ----------------

json payload_to_json(const ActionPayload& p) {
  json out = json::object();
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;

    if constexpr (std::is_same_v<T, Register>) {
      out = json{{"region", x.region}, {"initial", x.initial}};
    } else if constexpr (std::is_same_v<T, Claim>) {
      out = json{{"claim_ref", x.claim_ref}};
    } else if constexpr (std::is_same_v<T, Move>) {
      out = json{{"destination", x.destination}};
    } else if constexpr (std::is_same_v<T, Trade>) {
      out = json{{"counterparty", x.counterparty},
                 {"offer", resource_amount_to_json(x.offer)},
                 {"request", resource_amount_to_json(x.request)}};
    } else if constexpr (std::is_same_v<T, Communicate>) {
      out = json{{"target", x.target}, {"content", x.content}};
    } else if constexpr (std::is_same_v<T, Fork>) {
      out = json{{"child_a", x.child_a}, {"child_b", x.child_b}, {"split_percent", x.split_percent}};
    } else if constexpr (std::is_same_v<T, Merge>) {
      out = json{{"absorbed", x.absorbed}};
    } else if constexpr (std::is_same_v<T, Die>) {
      out = json{{"cause", x.cause}};
    } else if constexpr (std::is_same_v<T, Observe>) {
      out = json::object();
    }
  }, p);
  return out;
}

ActionPayload payload_from_json(ActionKind kind, const json& j) {
  if (!j.is_object()) throw CodecError("action payload must be an object");
  switch (kind) {
    case ActionKind::Register: {
      Register r{};
      r.region = require<std::string>(j, "region");
      if (j.contains("initial")) r.initial = j.at("initial").get<ResourcePool>();
      return r;
    }
    case ActionKind::Claim:
      return Claim{require<std::string>(j, "claim_ref")};
    case ActionKind::Move:
      return Move{require<std::string>(j, "destination")};
    case ActionKind::Trade: {
      Trade t{};
      t.counterparty = optional_field(j, "counterparty", std::string{});
      if (!j.contains("offer") || !j.contains("request")) throw CodecError("trade needs offer and request");
      t.offer = resource_amount_from_json(j.at("offer"));
      t.request = resource_amount_from_json(j.at("request"));
      return t;
    }
    case ActionKind::Communicate:
      return Communicate{require<std::string>(j, "target"), optional_field(j, "content", std::string{})};
    case ActionKind::Fork: {
      Fork f{};
      f.child_a = optional_field(j, "child_a", std::string{});
      f.child_b = optional_field(j, "child_b", std::string{});
      f.split_percent = optional_field<int32_t>(j, "split_percent", 50);
      return f;
    }
    case ActionKind::Merge:
      return Merge{require<std::string>(j, "absorbed")};
    case ActionKind::Die:
      return Die{optional_field(j, "cause", std::string{"voluntary"})};
    case ActionKind::Observe:
      return Observe{};
  }
  throw CodecError("unknown action kind");
}

json action_to_json(const Action& a) {
  return json{{"agent", a.agent},
              {"type", std::string(to_string(a.kind()))},
              {"submitted_tick", a.submitted_tick},
              {"payload", payload_to_json(a.payload)}};
}

Action action_from_json(const json& j) {
  const auto type = require<std::string>(j, "type");
  const auto kind = parse_action_kind(type);
  if (!kind) throw CodecError("unknown action type '" + type + "'");
  Action a{};
  a.agent = require<std::string>(j, "agent");
  a.submitted_tick = optional_field(j, "submitted_tick", Tick{0});
  a.payload = payload_from_json(*kind, j.contains("payload") ? j.at("payload") : json::object());
  return a;
}

// ---------------- state / snapshots ----------------

json state_to_json(const WorldState& s) {
  json regions = json::array();
  json pools = json::array();
  for (const auto& [id, r] : s.regions) {
    json rj = r;
    rj.erase("pool");
    regions.push_back(std::move(rj));
    pools.push_back(json{{"region", id}, {"pool", r.pool}});
  }
  json agents = json::array();
  for (const auto& [id, a] : s.agents) agents.push_back(a);

  return json{{"tick", s.tick},
              {"seed", s.seed},
              {"rules", s.rules},
              {"regions", std::move(regions)},
              {"agents", std::move(agents)},
              {"resource_pools", std::move(pools)}};
}

json snapshot_to_json(const WorldState& s) {
  json j = state_to_json(s);
  j["state_hash"] = state_hash(s);
  return j;
}

WorldState snapshot_from_json(const json& j, std::string* stored_hash) {
  WorldState s{};
  s.tick = require<Tick>(j, "tick");
  s.seed = require<uint64_t>(j, "seed");
  s.rules = require<WorldRules>(j, "rules");
  for (auto r : require<std::vector<Region>>(j, "regions")) {
    const auto id = r.id;
    if (!s.regions.emplace(id, std::move(r)).second) throw CodecError("duplicate region " + id);
  }
  for (const auto& pj : require<json>(j, "resource_pools")) {
    const auto rid = require<std::string>(pj, "region");
    Region* r = s.find_region_mut(rid);
    if (!r) throw CodecError("resource pool for unknown region " + rid);
    r->pool = require<ResourcePool>(pj, "pool");
  }
  for (auto a : require<std::vector<Agent>>(j, "agents")) {
    const auto id = a.id;
    if (!s.agents.emplace(id, std::move(a)).second) throw CodecError("duplicate agent " + id);
  }
  if (stored_hash) *stored_hash = require<std::string>(j, "state_hash");
  return s;
}

uint64_t fnv1a64(std::string_view bytes) noexcept {
  constexpr uint64_t kOffset = 0xcbf29ce484222325ull;
  constexpr uint64_t kPrime  = 0x00000100000001b3ull;
  uint64_t h = kOffset;
  for (unsigned char c : bytes) {
    h ^= static_cast<uint64_t>(c);
    h *= kPrime;
  }
  return h;
}

std::string to_hex(uint64_t v) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
  return std::string(buf, 16);
}

std::string state_hash(const WorldState& s) {
  return to_hex(fnv1a64(state_to_json(s).dump()));
}

bool is_valid_utf8(std::string_view bytes) noexcept {
  const std::size_t n = bytes.size();
  std::size_t i = 0;
  while (i < n) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }
    // lead byte fixes the length and the range of the first continuation byte
    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c == 0xE0) {
      len = 3;
      lo = 0xA0;
    } else if (c == 0xED) {
      len = 3;
      hi = 0x9F;   // no surrogates
    } else if (c >= 0xE1 && c <= 0xEF) {
      len = 3;
    } else if (c == 0xF0) {
      len = 4;
      lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      len = 4;
    } else if (c == 0xF4) {
      len = 4;
      hi = 0x8F;
    } else {
      return false;
    }
    if (n - i < len) return false;
    const auto first = static_cast<unsigned char>(bytes[i + 1]);
    if (first < lo || first > hi) return false;
    for (std::size_t k = 2; k < len; ++k) {
      const auto cont = static_cast<unsigned char>(bytes[i + k]);
      if (cont < 0x80 || cont > 0xBF) return false;
    }
    i += len;
  }
  return true;
}

// ---------------- ledger records ----------------

json record_to_json(const LedgerRecord& r) {
  return json{{"sequence", r.sequence},
              {"tick", r.event.tick},
              {"type", std::string(to_string(r.event.type))},
              {"agent_ids", r.event.agent_ids},
              {"payload", r.event.payload},
              {"timestamp", r.timestamp_ms}};
}

LedgerRecord record_from_json(const json& j) {
  LedgerRecord r{};
  r.sequence = require<Seq>(j, "sequence");
  r.timestamp_ms = optional_field(j, "timestamp", int64_t{0});
  r.event.tick = require<Tick>(j, "tick");
  const auto type = require<std::string>(j, "type");
  const auto t = parse_event_type(type);
  if (!t) throw CodecError("unknown event type '" + type + "'");
  r.event.type = *t;
  r.event.agent_ids = require<std::vector<std::string>>(j, "agent_ids");
  r.event.payload = j.contains("payload") ? j.at("payload") : json::object();
  return r;
}

std::string encode_record(const LedgerRecord& r) {
  return record_to_json(r).dump();
}

LedgerRecord decode_record(std::string_view line) {
  json j = json::parse(line.begin(), line.end(), nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded()) throw CodecError("ledger line is not valid JSON");
  return record_from_json(j);
}

} // namespace wsim
