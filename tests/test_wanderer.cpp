#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "wsim/agents/wanderer.hpp"
#include "wsim/engine.hpp"
#include "wsim/rules.hpp"

#include "world_fixtures.hpp"

using namespace wsim;
using wsim::agents::Wanderer;
using wsim::agents::WandererConfig;
using wsim::fixtures::place_agent;
using wsim::fixtures::quiet_state;

TEST(Wanderer, RegistersThenClaims) {
  auto s = quiet_state();
  Wanderer w("w1", "forge");
  w.seed(1);

  auto out = w.step(s);
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out[0].kind(), ActionKind::Register);
  EXPECT_EQ(std::get<Register>(out[0].payload).region, "forge");
  EXPECT_EQ(std::get<Register>(out[0].payload).initial, WandererConfig{}.initial);
  EXPECT_TRUE(validate(s, out[0]).accept);

  place_agent(s, "w1", "forge", ResourcePool::of(60, 30, 120, 50), AgentStatus::Pending);
  out = w.step(s);
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out[0].kind(), ActionKind::Claim);
  EXPECT_EQ(std::get<Claim>(out[0].payload).claim_ref, "wanderer:w1");
}

TEST(Wanderer, RetiredWanderersStaySilent) {
  auto s = quiet_state();
  place_agent(s, "w1", "forge", ResourcePool{}, AgentStatus::Dead);
  Wanderer w("w1", "forge");
  w.seed(2);
  for (int i = 0; i < 20; ++i) EXPECT_TRUE(w.step(s).empty());
}

TEST(Wanderer, SameSeedSameChoices) {
  auto s = quiet_state();
  place_agent(s, "w1", "nexus", ResourcePool::of(60, 30, 120, 50));
  place_agent(s, "peer", "nexus", ResourcePool::of(60, 30, 120, 50));

  Wanderer a("w1", "nexus");
  Wanderer b("w1", "nexus");
  a.seed(42);
  b.seed(42);
  for (int i = 0; i < 50; ++i) {
    const auto x = a.step(s);
    const auto y = b.step(s);
    ASSERT_EQ(x.size(), y.size());
    for (std::size_t k = 0; k < x.size(); ++k) EXPECT_EQ(x[k].kind(), y[k].kind());
  }
}

TEST(Wanderer, ProducesAMixOfActions) {
  auto s = quiet_state();
  place_agent(s, "w1", "nexus", ResourcePool::of(60, 30, 120, 50));
  place_agent(s, "peer", "nexus", ResourcePool::of(60, 30, 120, 50));

  WandererConfig cfg{};
  cfg.intensity_per_tick = 1.0;
  Wanderer w("w1", "nexus", cfg);
  w.seed(7);

  std::map<ActionKind, int> seen;
  for (int i = 0; i < 500; ++i) {
    for (const auto& a : w.step(s)) {
      EXPECT_EQ(a.agent, "w1");
      EXPECT_EQ(a.submitted_tick, s.tick);
      seen[a.kind()]++;
    }
  }
  EXPECT_GT(seen[ActionKind::Move], 0);
  EXPECT_GT(seen[ActionKind::Trade], 0);
  EXPECT_GT(seen[ActionKind::Communicate], 0);
  EXPECT_GT(seen[ActionKind::Observe], 0);
  EXPECT_EQ(seen[ActionKind::Register], 0);
}

TEST(Wanderer, DrivesAWorldWithoutBreakingIt) {
  WorldEngine eng;
  eng.genesis(default_world(13));

  std::vector<Wanderer> ws;
  for (int i = 0; i < 12; ++i) {
    ws.emplace_back("w" + std::to_string(i), i % 3 ? "nexus" : "void");
    ws.back().seed(static_cast<uint64_t>(i) + 100u);
  }

  std::size_t accepted = 0;
  for (int t = 0; t < 60; ++t) {
    std::vector<Action> batch;
    for (auto& w : ws) {
      for (auto& a : w.step(eng.state())) batch.push_back(std::move(a));
    }
    const auto out = eng.advance(batch);
    accepted += out.accepted;
    ASSERT_TRUE(eng.state().check_invariants().empty());
  }
  EXPECT_GT(accepted, 24u);   // at least every registration and claim
}
