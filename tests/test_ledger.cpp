#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wsim/codec.hpp"
#include "wsim/errors.hpp"
#include "wsim/ledger.hpp"

using namespace wsim;
namespace fs = std::filesystem;

namespace {

Event ev(Tick t, EventType type, std::vector<AgentId> ids = {}) {
  Event e{};
  e.tick = t;
  e.type = type;
  e.agent_ids = std::move(ids);
  return e;
}

Event commit(Tick t) {
  Event e = ev(t, EventType::TickCommit);
  e.payload = nlohmann::json{{"state_hash", "h" + std::to_string(t)}};
  return e;
}

// Ticks 0..3: genesis, then one move per tick by a or b.
void fill(Ledger& l) {
  l.append_batch(0, {ev(0, EventType::Genesis), commit(0)});
  l.append_batch(1, {ev(1, EventType::Move, {"a"}), commit(1)});
  l.append_batch(2, {ev(2, EventType::Move, {"b"}), ev(2, EventType::Trade, {"a", "b"}), commit(2)});
  l.append_batch(3, {commit(3)});
}

// Memory backend whose appends can be made to fail.
class FlakyBackend final : public LedgerBackend {
public:
  bool fail{false};
  std::string data;

  std::string read_all() override { return data; }
  bool append_durable(std::string_view bytes) override {
    if (fail) return false;
    data.append(bytes);
    return true;
  }
  bool truncate(std::size_t size) override {
    if (size < data.size()) data.resize(size);
    return true;
  }
};

fs::path temp_dir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("wsim_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

} // namespace

TEST(Ledger, SequencesAreContiguousFromZero) {
  auto l = Ledger::in_memory();
  fill(*l);

  const auto all = l->scan();
  ASSERT_EQ(all.size(), 8u);
  for (std::size_t i = 0; i < all.size(); ++i) EXPECT_EQ(all[i].sequence, i);
  EXPECT_EQ(l->next_sequence(), 8u);
  EXPECT_EQ(l->last_tick(), 3);
  EXPECT_EQ(all.back().event.type, EventType::TickCommit);
}

TEST(Ledger, AppendReturnsStampedRecords) {
  auto l = Ledger::in_memory();
  const auto recs = l->append_batch(0, {ev(0, EventType::Genesis), commit(0)});
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].sequence, 0u);
  EXPECT_EQ(recs[1].sequence, 1u);
  EXPECT_GT(recs[0].timestamp_ms, 0);
  EXPECT_EQ(recs[0].timestamp_ms, recs[1].timestamp_ms);
}

TEST(Ledger, MalformedBatchesAreRefused) {
  auto l = Ledger::in_memory();
  EXPECT_THROW(l->append_batch(0, {}), std::invalid_argument);
  EXPECT_THROW(l->append_batch(0, {ev(0, EventType::Genesis)}), std::invalid_argument);
  EXPECT_THROW(l->append_batch(0, {ev(1, EventType::Genesis), commit(0)}), std::invalid_argument);
  EXPECT_THROW(l->append_batch(0, {commit(0), commit(0)}), std::invalid_argument);

  l->append_batch(0, {commit(0)});
  EXPECT_THROW(l->append_batch(0, {commit(0)}), std::invalid_argument);   // tick already committed
  EXPECT_EQ(l->size(), 1u);
}

TEST(Ledger, FailedWriteRecordsNothing) {
  auto backend = std::make_unique<FlakyBackend>();
  FlakyBackend* raw = backend.get();
  Ledger l(std::move(backend));

  l.append_batch(0, {commit(0)});
  raw->fail = true;
  EXPECT_THROW(l.append_batch(1, {ev(1, EventType::Move, {"a"}), commit(1)}), LedgerWriteError);
  EXPECT_EQ(l.size(), 1u);
  EXPECT_EQ(l.last_tick(), 0);

  raw->fail = false;
  const auto recs = l.append_batch(1, {ev(1, EventType::Move, {"a"}), commit(1)});
  EXPECT_EQ(recs.front().sequence, 1u);
}

TEST(Ledger, ReopenContinuesTheSequence) {
  auto mem = std::make_unique<MemoryLedgerBackend>();
  MemoryLedgerBackend* raw = mem.get();
  Ledger first(std::move(mem));
  fill(first);

  Ledger second(std::make_unique<MemoryLedgerBackend>(raw->contents()));
  EXPECT_EQ(second.size(), 8u);
  EXPECT_EQ(second.discarded_on_open(), 0u);
  const auto recs = second.append_batch(4, {commit(4)});
  EXPECT_EQ(recs.front().sequence, 8u);
}

TEST(Ledger, TornFinalBatchIsDiscardedOnOpen) {
  auto mem = std::make_unique<MemoryLedgerBackend>();
  MemoryLedgerBackend* raw = mem.get();
  Ledger first(std::move(mem));
  fill(first);
  const std::string good = raw->contents();

  // tick 4 was half written: one complete line, then a cut-off line
  LedgerRecord r{};
  r.sequence = 8;
  r.event = ev(4, EventType::Move, {"a"});
  const std::string line = encode_record(r);
  const std::string torn = good + line + "\n" + line.substr(0, line.size() / 2);

  auto reopened_backend = std::make_unique<MemoryLedgerBackend>(torn);
  MemoryLedgerBackend* reopened_raw = reopened_backend.get();
  Ledger reopened(std::move(reopened_backend));

  EXPECT_EQ(reopened.size(), 8u);
  EXPECT_EQ(reopened.last_tick(), 3);
  EXPECT_EQ(reopened.discarded_on_open(), 1u);
  EXPECT_EQ(reopened_raw->contents(), good);

  const auto recs = reopened.append_batch(4, {commit(4)});
  EXPECT_EQ(recs.front().sequence, 8u);
}

TEST(Ledger, UncommittedCompleteLinesAreAlsoDiscarded) {
  auto mem = std::make_unique<MemoryLedgerBackend>();
  MemoryLedgerBackend* raw = mem.get();
  Ledger first(std::move(mem));
  fill(first);
  const std::string good = raw->contents();

  LedgerRecord r{};
  r.sequence = 8;
  r.event = ev(4, EventType::Move, {"a"});
  Ledger reopened(std::make_unique<MemoryLedgerBackend>(good + encode_record(r) + "\n"));
  EXPECT_EQ(reopened.size(), 8u);
  EXPECT_EQ(reopened.discarded_on_open(), 1u);
}

TEST(Ledger, CorruptLineInTheMiddleIsReported) {
  auto mem = std::make_unique<MemoryLedgerBackend>();
  MemoryLedgerBackend* raw = mem.get();
  Ledger first(std::move(mem));
  fill(first);

  std::string data = raw->contents();
  const auto second_line = data.find('\n') + 1;
  data.replace(second_line, 1, "#");
  EXPECT_THROW(Ledger{std::make_unique<MemoryLedgerBackend>(data)}, CodecError);
}

TEST(Ledger, SequenceGapIsAnIntegrityError) {
  LedgerRecord a{};
  a.sequence = 0;
  a.event = commit(0);
  LedgerRecord b{};
  b.sequence = 2;
  b.event = commit(1);
  const std::string data = encode_record(a) + "\n" + encode_record(b) + "\n";
  EXPECT_THROW(Ledger{std::make_unique<MemoryLedgerBackend>(data)}, IntegrityError);
}

TEST(Ledger, Queries) {
  auto l = Ledger::in_memory();
  fill(*l);

  EXPECT_EQ(l->range(1, 2).size(), 5u);
  EXPECT_EQ(l->at_tick(2).size(), 3u);
  EXPECT_TRUE(l->at_tick(9).empty());

  const auto a = l->for_agent("a");
  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a[0].event.type, EventType::Move);
  EXPECT_EQ(a[1].event.type, EventType::Trade);
  EXPECT_EQ(l->for_agent("b").size(), 2u);
  EXPECT_TRUE(l->for_agent("nobody").empty());

  LedgerQuery q{};
  q.from = 1;
  q.type = EventType::TickCommit;
  q.limit = 2;
  const auto commits = l->query(q);
  ASSERT_EQ(commits.size(), 2u);
  EXPECT_EQ(commits[0].event.tick, 1);
  EXPECT_EQ(commits[1].event.tick, 2);

  q = LedgerQuery{};
  q.limit = 0;
  EXPECT_TRUE(l->query(q).empty());
}

TEST(Ledger, FileBackendSurvivesReopen) {
  const auto dir = temp_dir("ledger_file");
  const std::string path = (dir / "nested" / "events.jsonl").string();

  {
    auto l = Ledger::open_file(path);
    fill(*l);
  }

  std::ifstream in(path);
  std::string line;
  std::size_t lines = 0;
  while (std::getline(in, line)) {
    EXPECT_NO_THROW(decode_record(line));
    ++lines;
  }
  EXPECT_EQ(lines, 8u);

  auto l = Ledger::open_file(path);
  EXPECT_EQ(l->size(), 8u);
  EXPECT_EQ(l->last_tick(), 3);
  l->append_batch(4, {commit(4)});
  EXPECT_EQ(l->size(), 9u);

  fs::remove_all(dir);
}

TEST(Ledger, FileBackendTruncatesTornTail) {
  const auto dir = temp_dir("ledger_torn");
  const std::string path = (dir / "events.jsonl").string();
  {
    auto l = Ledger::open_file(path);
    fill(*l);
  }
  const auto good_size = fs::file_size(path);
  {
    std::ofstream out(path, std::ios::app);
    out << R"({"sequence":8,"tick":4,"ty)";
  }

  auto l = Ledger::open_file(path);
  EXPECT_EQ(l->size(), 8u);
  EXPECT_EQ(fs::file_size(path), good_size);

  fs::remove_all(dir);
}

TEST(RejectionJournal, AppendsOneLinePerRejection) {
  const auto dir = temp_dir("rejections");
  RejectionJournal j((dir / "r.jsonl").string());

  EXPECT_TRUE(j.record(3, "a", "move", "REGION_FULL", nlohmann::json{{"destination", "nexus"}}));
  EXPECT_TRUE(j.record(3, "b", "trade", "INSUFFICIENT_RESOURCES", nlohmann::json::object()));

  std::ifstream in(j.path());
  std::string line;
  std::vector<nlohmann::json> rows;
  while (std::getline(in, line)) rows.push_back(nlohmann::json::parse(line));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].at("reason"), "REGION_FULL");
  EXPECT_EQ(rows[0].at("action").at("destination"), "nexus");
  EXPECT_EQ(rows[1].at("agent"), "b");

  fs::remove_all(dir);
}
