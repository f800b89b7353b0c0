#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "wsim/codec.hpp"
#include "wsim/errors.hpp"
#include "wsim/snapshot_store.hpp"

#include "world_fixtures.hpp"

using namespace wsim;
using wsim::fixtures::energy;
using wsim::fixtures::place_agent;
using wsim::fixtures::quiet_state;
namespace fs = std::filesystem;

namespace {

class SnapshotStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("wsim_snap_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
  }
  void TearDown() override { fs::remove_all(dir_); }

  WorldState state_at(Tick t) {
    auto s = quiet_state();
    s.tick = t;
    place_agent(s, "a", "nexus", energy(10 + t));
    return s;
  }

  fs::path dir_;
};

std::string read_file(const std::string& path) {
  std::ifstream in(path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

TEST_F(SnapshotStoreTest, SaveThenLoad) {
  SnapshotStore store(dir_.string());
  const auto s = state_at(100);
  ASSERT_TRUE(store.save(s));

  EXPECT_TRUE(fs::exists(store.path_for(100)));
  EXPECT_FALSE(fs::exists(store.path_for(100) + ".tmp"));
  EXPECT_EQ(fs::path(store.path_for(100)).filename().string(), "snapshot-000000000100.json");

  const auto back = store.load(100);
  EXPECT_EQ(state_hash(back), state_hash(s));
  EXPECT_EQ(back.find_agent("a")->resources[ResourceKind::Energy], 110);
}

TEST_F(SnapshotStoreTest, ListsTicksAndFindsLatest) {
  SnapshotStore store(dir_.string());
  EXPECT_TRUE(store.ticks().empty());
  EXPECT_FALSE(store.latest_at_or_before(50).has_value());

  for (Tick t : {200, 0, 100}) ASSERT_TRUE(store.save(state_at(t)));
  {
    std::ofstream stray((dir_ / "notes.txt").string());
    stray << "not a snapshot";
  }

  EXPECT_EQ(store.ticks(), (std::vector<Tick>{0, 100, 200}));
  EXPECT_EQ(store.latest_at_or_before(99), 0);
  EXPECT_EQ(store.latest_at_or_before(100), 100);
  EXPECT_EQ(store.latest_at_or_before(1000), 200);
  EXPECT_FALSE(store.latest_at_or_before(-1).has_value());
}

TEST_F(SnapshotStoreTest, MissingSnapshotIsACodecError) {
  SnapshotStore store(dir_.string());
  EXPECT_THROW(store.load(7), CodecError);
}

TEST_F(SnapshotStoreTest, EditedSnapshotFailsItsHash) {
  SnapshotStore store(dir_.string());
  ASSERT_TRUE(store.save(state_at(5)));

  auto j = nlohmann::json::parse(read_file(store.path_for(5)));
  j["agents"][0]["resources"]["energy"] = 999;
  {
    std::ofstream out(store.path_for(5), std::ios::trunc);
    out << j.dump();
  }
  EXPECT_THROW(store.load(5), IntegrityError);
}

TEST_F(SnapshotStoreTest, SnapshotUnderTheWrongNameIsRefused) {
  SnapshotStore store(dir_.string());
  ASSERT_TRUE(store.save(state_at(5)));
  fs::rename(store.path_for(5), store.path_for(6));
  EXPECT_THROW(store.load(6), IntegrityError);
}

TEST_F(SnapshotStoreTest, GarbageIsACodecError) {
  SnapshotStore store(dir_.string());
  fs::create_directories(dir_);
  {
    std::ofstream out(store.path_for(3));
    out << "{\"tick\": 3, \"seed\":";
  }
  EXPECT_THROW(store.load(3), CodecError);
}

TEST_F(SnapshotStoreTest, UnwritableDirectoryReportsFalse) {
  fs::create_directories(dir_);
  const auto blocker = dir_ / "file";
  {
    std::ofstream out(blocker.string());
    out << "x";
  }
  SnapshotStore store((blocker / "sub").string());
  EXPECT_FALSE(store.save(state_at(1)));
}
