#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wsim/events.hpp"
#include "wsim/types.hpp"

namespace wsim {

// Byte storage under the ledger. append_durable either persists all of
// `bytes` (flushed to stable storage) and returns true, or leaves the stored
// content as it was and returns false.
class LedgerBackend {
public:
  virtual ~LedgerBackend() = default;

  virtual std::string read_all() = 0;
  virtual bool append_durable(std::string_view bytes) = 0;
  virtual bool truncate(std::size_t size) = 0;
};

// JSON Lines file, opened O_APPEND; every append ends with fsync.
class FileLedgerBackend final : public LedgerBackend {
public:
  explicit FileLedgerBackend(std::string path);
  ~FileLedgerBackend() override;

  FileLedgerBackend(const FileLedgerBackend&) = delete;
  FileLedgerBackend& operator=(const FileLedgerBackend&) = delete;

  std::string read_all() override;
  bool append_durable(std::string_view bytes) override;
  bool truncate(std::size_t size) override;

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  int fd_{-1};
  std::size_t size_{0};
};

class MemoryLedgerBackend final : public LedgerBackend {
public:
  MemoryLedgerBackend() = default;
  explicit MemoryLedgerBackend(std::string initial) : data_(std::move(initial)) {}

  std::string read_all() override { return data_; }
  bool append_durable(std::string_view bytes) override {
    data_.append(bytes);
    return true;
  }
  bool truncate(std::size_t size) override {
    if (size < data_.size()) data_.resize(size);
    return true;
  }

  const std::string& contents() const noexcept { return data_; }

private:
  std::string data_;
};

struct LedgerQuery {
  Tick from{0};
  std::optional<Tick> to{};
  std::optional<AgentId> agent{};
  std::optional<EventType> type{};
  std::size_t limit{std::numeric_limits<std::size_t>::max()};
};

// Append-only record of committed events. A batch holds all events of one
// tick and ends with its tick_commit record; it is persisted whole or not at
// all. There is deliberately no way to change or remove a record.
class Ledger {
public:
  explicit Ledger(std::unique_ptr<LedgerBackend> backend);

  static std::unique_ptr<Ledger> open_file(const std::string& path);
  static std::unique_ptr<Ledger> in_memory();

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

  // Stamps sequence numbers and timestamps, persists durably, then indexes.
  // Throws std::invalid_argument for a malformed batch and LedgerWriteError
  // when the backend fails (nothing is recorded in that case).
  std::vector<LedgerRecord> append_batch(Tick tick, const std::vector<Event>& events);

  std::vector<LedgerRecord> query(const LedgerQuery& q) const;
  std::vector<LedgerRecord> range(Tick from, Tick to) const;
  std::vector<LedgerRecord> for_agent(const AgentId& id) const;
  std::vector<LedgerRecord> at_tick(Tick tick) const;
  std::vector<LedgerRecord> scan() const;

  std::optional<Tick> last_tick() const;
  std::size_t size() const;
  Seq next_sequence() const;

  // Records of a torn final batch dropped when the ledger was opened.
  std::size_t discarded_on_open() const noexcept { return discarded_on_open_; }

private:
  std::unique_ptr<LedgerBackend> backend_;

  mutable std::mutex mu_;
  std::vector<LedgerRecord> records_;
  std::size_t discarded_on_open_{0};

  void load_();
  std::size_t lower_bound_tick_(Tick t) const;   // requires mu_
};

// Best-effort, non-authoritative journal of rejected actions, kept beside the
// ledger and never read back by replay.
class RejectionJournal {
public:
  explicit RejectionJournal(std::string path) : path_(std::move(path)) {}

  // Returns false if the line could not be written.
  bool record(Tick tick, const std::string& agent, std::string_view action_type,
              std::string_view reason, const nlohmann::json& action);

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::mutex mu_;
};

} // namespace wsim
