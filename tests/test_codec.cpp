#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "wsim/codec.hpp"
#include "wsim/engine.hpp"
#include "wsim/errors.hpp"

#include "world_fixtures.hpp"

using namespace wsim;
using nlohmann::json;
using wsim::fixtures::place_agent;
using wsim::fixtures::quiet_state;

TEST(Codec, SnapshotRoundTripKeepsStateAndHash) {
  auto s = quiet_state(11);
  place_agent(s, "a", "forge", ResourcePool::of(1, 2, 3, 4));
  place_agent(s, "b", "void", ResourcePool::of(0, 0, 0, 0), AgentStatus::Dead);
  s.agents.at("b").retired_tick = 0;
  s.regions.at("archive").pool = ResourcePool::of(9, 8, 7, 6);

  const json j = snapshot_to_json(s);
  EXPECT_EQ(j.at("state_hash"), state_hash(s));
  EXPECT_EQ(j.at("resource_pools").size(), 5u);

  std::string stored;
  const WorldState back = snapshot_from_json(json::parse(j.dump()), &stored);
  EXPECT_EQ(stored, state_hash(s));
  EXPECT_EQ(state_hash(back), state_hash(s));
  EXPECT_EQ(back.find_agent("b")->status, AgentStatus::Dead);
  EXPECT_EQ(back.regions.at("archive").pool, ResourcePool::of(9, 8, 7, 6));
  EXPECT_EQ(back.rules, s.rules);
}

TEST(Codec, HashChangesWithAnyField) {
  auto s = quiet_state();
  place_agent(s, "a", "nexus", ResourcePool::of(10, 0, 0, 0));
  const auto h = state_hash(s);

  auto t = s;
  t.agents.at("a").resources[ResourceKind::Compute] = 1;
  EXPECT_NE(state_hash(t), h);

  t = s;
  t.regions.at("void").pool[ResourceKind::Energy] -= 1;
  EXPECT_NE(state_hash(t), h);

  t = s;
  t.tick = 1;
  EXPECT_NE(state_hash(t), h);

  EXPECT_EQ(state_hash(s), h);
  EXPECT_EQ(h.size(), 16u);
}

TEST(Codec, Fnv1aKnownValues) {
  EXPECT_EQ(fnv1a64(""), 0xcbf29ce484222325ull);
  EXPECT_EQ(to_hex(fnv1a64("a")), "af63dc4c8601ec8c");
}

TEST(Codec, RecordLineRoundTrip) {
  LedgerRecord r{};
  r.sequence = 42;
  r.timestamp_ms = 1700000000123;
  r.event.tick = 9;
  r.event.type = EventType::Trade;
  r.event.agent_ids = {"a", "b"};
  r.event.payload = json{{"action", {{"counterparty", "b"}}}, {"delta", {{"cost", 3}}}};

  const std::string line = encode_record(r);
  EXPECT_EQ(line.find('\n'), std::string::npos);

  const LedgerRecord back = decode_record(line);
  EXPECT_EQ(back.sequence, 42u);
  EXPECT_EQ(back.timestamp_ms, 1700000000123);
  EXPECT_EQ(back.event, r.event);

  const json j = json::parse(line);
  EXPECT_EQ(j.at("type"), "trade");
  EXPECT_EQ(j.at("agent_ids"), json::array({"a", "b"}));
}

TEST(Codec, MalformedRecordsAreCodecErrors) {
  EXPECT_THROW(decode_record("{not json"), CodecError);
  EXPECT_THROW(decode_record("[1,2,3]"), CodecError);
  EXPECT_THROW(decode_record(R"({"sequence":0,"tick":0,"type":"teleport","agent_ids":[]})"), CodecError);
  EXPECT_THROW(decode_record(R"({"sequence":"zero","tick":0,"type":"genesis","agent_ids":[]})"), CodecError);
  EXPECT_THROW(decode_record(R"({"sequence":0,"type":"genesis","agent_ids":[]})"), CodecError);
  EXPECT_THROW(decode_record(R"({"sequence":0,"tick":0,"type":"genesis","agent_ids":[],"timestamp":"noon"})"),
               CodecError);
}

TEST(Codec, ActionsFromGatewayBodies) {
  const auto trade = action_from_json(json::parse(R"({
    "agent": "a", "type": "trade",
    "payload": {"counterparty": "b",
                "offer": {"kind": "energy", "amount": 5},
                "request": {"kind": "memory", "amount": 7}}})"));
  EXPECT_EQ(trade.agent, "a");
  ASSERT_EQ(trade.kind(), ActionKind::Trade);
  const auto& t = std::get<Trade>(trade.payload);
  EXPECT_EQ(t.counterparty, "b");
  EXPECT_EQ(t.offer.kind, ResourceKind::Energy);
  EXPECT_EQ(t.request.amount, 7);

  const auto obs = action_from_json(json{{"agent", "a"}, {"type", "observe"}});
  EXPECT_EQ(obs.kind(), ActionKind::Observe);

  const auto fork = action_from_json(json{{"agent", "a"}, {"type", "fork"}, {"payload", json::object()}});
  EXPECT_EQ(std::get<Fork>(fork.payload).split_percent, 50);

  const auto die = action_from_json(json{{"agent", "a"}, {"type", "die"}});
  EXPECT_EQ(std::get<Die>(die.payload).cause, "voluntary");
}

TEST(Codec, BadActionsAreCodecErrors) {
  EXPECT_THROW(action_from_json(json{{"agent", "a"}, {"type", "fly"}}), CodecError);
  EXPECT_THROW(action_from_json(json{{"type", "observe"}}), CodecError);
  EXPECT_THROW(action_from_json(json{{"agent", "a"}, {"type", "move"}, {"payload", json::object()}}), CodecError);
  EXPECT_THROW(action_from_json(json{{"agent", "a"}, {"type", "move"}, {"payload", {{"destination", 3}}}}),
               CodecError);
  EXPECT_THROW(action_from_json(json::parse(R"({"agent":"a","type":"trade",
    "payload":{"offer":{"kind":"gold","amount":1},"request":{"kind":"energy","amount":1}}})")),
               CodecError);
  EXPECT_THROW(action_from_json(json::parse(R"({"agent":"a","type":"trade",
    "payload":{"offer":{"kind":"energy","amount":1}}})")),
               CodecError);

  // optional fields of the wrong type
  EXPECT_THROW(action_from_json(json{{"agent", "a"}, {"type", "observe"}, {"submitted_tick", "x"}}), CodecError);
  EXPECT_THROW(action_from_json(json{{"agent", "a"}, {"type", "fork"}, {"payload", {{"split_percent", "half"}}}}),
               CodecError);
  EXPECT_THROW(action_from_json(json{{"agent", "a"}, {"type", "fork"}, {"payload", {{"child_a", 1}}}}), CodecError);
  EXPECT_THROW(
      action_from_json(json{{"agent", "a"}, {"type", "communicate"}, {"payload", {{"target", "b"}, {"content", 7}}}}),
      CodecError);
  EXPECT_THROW(action_from_json(json{{"agent", "a"}, {"type", "die"}, {"payload", {{"cause", false}}}}), CodecError);
  EXPECT_THROW(action_from_json(json::parse(R"({"agent":"a","type":"trade","payload":{"counterparty":[],
    "offer":{"kind":"energy","amount":1},"request":{"kind":"energy","amount":1}}})")),
               CodecError);

  // trade amounts are whole units
  EXPECT_THROW(action_from_json(json::parse(R"({"agent":"a","type":"trade",
    "payload":{"offer":{"kind":"energy","amount":1.5},"request":{"kind":"memory","amount":1}}})")),
               CodecError);
}

TEST(Codec, Utf8Validation) {
  EXPECT_TRUE(is_valid_utf8(""));
  EXPECT_TRUE(is_valid_utf8("plain ascii"));
  EXPECT_TRUE(is_valid_utf8("\xc3\xa9t\xc3\xa9"));          // two-byte sequences
  EXPECT_TRUE(is_valid_utf8("\xe2\x82\xac"));                // euro sign
  EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x8c\x8d"));           // four-byte sequence
  EXPECT_FALSE(is_valid_utf8("hi\xff\xfe"));
  EXPECT_FALSE(is_valid_utf8("\xc3"));                       // truncated
  EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));                   // overlong
  EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));               // surrogate
  EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));           // above U+10FFFF
}

TEST(Codec, ActionJsonRoundTrip) {
  Fork f{};
  f.child_a = "l";
  f.child_b = "r";
  f.split_percent = 25;
  const Action a = Action::of("x", f, 17);

  const Action back = action_from_json(action_to_json(a));
  EXPECT_EQ(back.agent, "x");
  EXPECT_EQ(back.submitted_tick, 17);
  const auto& g = std::get<Fork>(back.payload);
  EXPECT_EQ(g.child_a, "l");
  EXPECT_EQ(g.child_b, "r");
  EXPECT_EQ(g.split_percent, 25);
}

TEST(Codec, ResourcePoolRejectsUnknownKindsAndFractions) {
  EXPECT_THROW(json::parse(R"({"energy": 1, "gold": 2})").get<ResourcePool>(), CodecError);
  EXPECT_THROW(json::parse(R"({"energy": 1.5})").get<ResourcePool>(), CodecError);
  EXPECT_EQ(json::parse(R"({"memory": 4})").get<ResourcePool>(), ResourcePool::of(0, 0, 4, 0));
}

TEST(Codec, GenesisPayloadRebuildsTheDefinition) {
  const auto def = default_world(5);
  WorldEngine eng;
  const auto out = eng.genesis(def);

  const auto back = json::parse(out.events[0].payload.dump()).get<WorldDefinition>();
  EXPECT_EQ(back.seed, 5u);
  EXPECT_EQ(back.rules, def.rules);
  ASSERT_EQ(back.regions.size(), def.regions.size());
  EXPECT_EQ(state_hash(genesis_state(back)), out.state_hash);
}
