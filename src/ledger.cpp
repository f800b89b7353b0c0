#include "wsim/ledger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wsim/codec.hpp"
#include "wsim/errors.hpp"

namespace wsim {

namespace {

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string errno_text() {
  return std::strerror(errno);
}

} // namespace

// ---------------- FileLedgerBackend ----------------

FileLedgerBackend::FileLedgerBackend(std::string path) : path_(std::move(path)) {
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd_ < 0) throw LedgerWriteError("cannot open ledger '" + path_ + "': " + errno_text());

  struct stat st{};
  if (::fstat(fd_, &st) != 0) {
    const std::string why = errno_text();
    ::close(fd_);
    fd_ = -1;
    throw LedgerWriteError("cannot stat ledger '" + path_ + "': " + why);
  }
  size_ = static_cast<std::size_t>(st.st_size);
}

FileLedgerBackend::~FileLedgerBackend() {
  if (fd_ >= 0) ::close(fd_);
}

std::string FileLedgerBackend::read_all() {
  std::string out(size_, '\0');
  std::size_t done = 0;
  while (done < size_) {
    const ssize_t n = ::pread(fd_, out.data() + done, size_ - done, static_cast<off_t>(done));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw CodecError("cannot read ledger '" + path_ + "': " + errno_text());
    }
    if (n == 0) break;
    done += static_cast<std::size_t>(n);
  }
  out.resize(done);
  return out;
}

bool FileLedgerBackend::append_durable(std::string_view bytes) {
  std::size_t done = 0;
  while (done < bytes.size()) {
    const ssize_t n = ::write(fd_, bytes.data() + done, bytes.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      spdlog::error("ledger write to '{}' failed: {}", path_, errno_text());
      // drop the partial batch so the file keeps only whole batches
      if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
        spdlog::error("ledger rollback of '{}' failed: {}", path_, errno_text());
      }
      return false;
    }
    done += static_cast<std::size_t>(n);
  }

  if (::fsync(fd_) != 0) {
    spdlog::error("ledger fsync of '{}' failed: {}", path_, errno_text());
    if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
      spdlog::error("ledger rollback of '{}' failed: {}", path_, errno_text());
    }
    return false;
  }

  size_ += bytes.size();
  return true;
}

bool FileLedgerBackend::truncate(std::size_t size) {
  if (size >= size_) return true;
  if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) return false;
  if (::fsync(fd_) != 0) return false;
  size_ = size;
  return true;
}

// ---------------- Ledger ----------------

Ledger::Ledger(std::unique_ptr<LedgerBackend> backend) : backend_(std::move(backend)) {
  if (!backend_) throw std::invalid_argument("ledger needs a backend");
  load_();
}

std::unique_ptr<Ledger> Ledger::open_file(const std::string& path) {
  const std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) throw LedgerWriteError("cannot create ledger directory '" + p.parent_path().string() + "': " + ec.message());
  }
  return std::make_unique<Ledger>(std::make_unique<FileLedgerBackend>(path));
}

std::unique_ptr<Ledger> Ledger::in_memory() {
  return std::make_unique<Ledger>(std::make_unique<MemoryLedgerBackend>());
}

// Keeps every batch up to and including the last tick_commit. Anything after
// it is an interrupted append and is cut off; a bad line followed by further
// lines is corruption and is reported instead.
void Ledger::load_() {
  const std::string data = backend_->read_all();

  std::vector<LedgerRecord> loaded;
  std::size_t committed_end = 0;
  std::size_t committed_count = 0;

  std::size_t pos = 0;
  std::size_t line_no = 0;
  while (pos < data.size()) {
    const std::size_t nl = data.find('\n', pos);
    line_no++;
    if (nl == std::string::npos) break;   // unterminated final line: torn

    const std::string_view line(data.data() + pos, nl - pos);
    const std::size_t next = nl + 1;

    LedgerRecord rec{};
    try {
      rec = decode_record(line);
    } catch (const CodecError& e) {
      if (next >= data.size()) break;   // last line: torn
      throw CodecError("ledger line " + std::to_string(line_no) + ": " + e.what());
    }

    if (rec.sequence != loaded.size()) {
      throw IntegrityError("ledger line " + std::to_string(line_no) + ": sequence " +
                           std::to_string(rec.sequence) + ", expected " + std::to_string(loaded.size()));
    }
    if (!loaded.empty() && rec.event.tick < loaded.back().event.tick) {
      throw IntegrityError("ledger line " + std::to_string(line_no) + ": tick goes backwards");
    }

    loaded.push_back(std::move(rec));
    pos = next;

    if (loaded.back().event.type == EventType::TickCommit) {
      committed_end = pos;
      committed_count = loaded.size();
    }
  }

  if (committed_end < data.size()) {
    discarded_on_open_ = loaded.size() - committed_count;
    spdlog::warn("ledger: discarding incomplete final batch ({} records, {} bytes) after sequence {}",
                 discarded_on_open_, data.size() - committed_end,
                 committed_count == 0 ? std::string("<none>") : std::to_string(committed_count - 1));
    if (!backend_->truncate(committed_end)) {
      throw LedgerWriteError("cannot truncate incomplete ledger tail");
    }
    loaded.resize(committed_count);
  }

  records_ = std::move(loaded);
  if (!records_.empty()) {
    spdlog::info("ledger: loaded {} records through tick {}", records_.size(), records_.back().event.tick);
  }
}

std::vector<LedgerRecord> Ledger::append_batch(Tick tick, const std::vector<Event>& events) {
  if (events.empty()) throw std::invalid_argument("empty ledger batch");
  if (events.back().type != EventType::TickCommit) {
    throw std::invalid_argument("ledger batch must end with tick_commit");
  }
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (events[i].tick != tick) throw std::invalid_argument("ledger batch mixes ticks");
    if (i + 1 < events.size() && events[i].type == EventType::TickCommit) {
      throw std::invalid_argument("tick_commit before the end of a ledger batch");
    }
  }

  std::lock_guard<std::mutex> lk(mu_);

  if (!records_.empty() && tick <= records_.back().event.tick) {
    throw std::invalid_argument("ledger batch for tick " + std::to_string(tick) +
                                " does not follow tick " + std::to_string(records_.back().event.tick));
  }

  const int64_t ts = now_ms();
  std::vector<LedgerRecord> batch;
  batch.reserve(events.size());
  std::string bytes;
  for (const auto& ev : events) {
    LedgerRecord r{};
    r.sequence = static_cast<Seq>(records_.size() + batch.size());
    r.timestamp_ms = ts;
    r.event = ev;
    bytes += encode_record(r);
    bytes += '\n';
    batch.push_back(std::move(r));
  }

  if (!backend_->append_durable(bytes)) {
    throw LedgerWriteError("failed to persist ledger batch for tick " + std::to_string(tick));
  }

  records_.insert(records_.end(), batch.begin(), batch.end());
  return batch;
}

std::size_t Ledger::lower_bound_tick_(Tick t) const {
  auto it = std::lower_bound(records_.begin(), records_.end(), t,
                             [](const LedgerRecord& r, Tick v) { return r.event.tick < v; });
  return static_cast<std::size_t>(it - records_.begin());
}

std::vector<LedgerRecord> Ledger::query(const LedgerQuery& q) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<LedgerRecord> out;
  if (q.limit == 0) return out;

  for (std::size_t i = lower_bound_tick_(q.from); i < records_.size(); ++i) {
    const auto& r = records_[i];
    if (q.to && r.event.tick > *q.to) break;
    if (q.agent && !r.event.names(*q.agent)) continue;
    if (q.type && r.event.type != *q.type) continue;
    out.push_back(r);
    if (out.size() >= q.limit) break;
  }
  return out;
}

std::vector<LedgerRecord> Ledger::range(Tick from, Tick to) const {
  LedgerQuery q{};
  q.from = from;
  q.to = to;
  return query(q);
}

std::vector<LedgerRecord> Ledger::for_agent(const AgentId& id) const {
  LedgerQuery q{};
  q.agent = id;
  return query(q);
}

std::vector<LedgerRecord> Ledger::at_tick(Tick tick) const {
  return range(tick, tick);
}

std::vector<LedgerRecord> Ledger::scan() const {
  std::lock_guard<std::mutex> lk(mu_);
  return records_;
}

std::optional<Tick> Ledger::last_tick() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (records_.empty()) return std::nullopt;
  return records_.back().event.tick;
}

std::size_t Ledger::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return records_.size();
}

Seq Ledger::next_sequence() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<Seq>(records_.size());
}

// ---------------- RejectionJournal ----------------

bool RejectionJournal::record(Tick tick, const std::string& agent, std::string_view action_type,
                              std::string_view reason, const nlohmann::json& action) {
  nlohmann::json line{{"tick", tick},
                      {"agent", agent},
                      {"type", std::string(action_type)},
                      {"reason", std::string(reason)},
                      {"timestamp", now_ms()},
                      {"action", action}};

  std::lock_guard<std::mutex> lk(mu_);
  std::ofstream out(path_, std::ios::app);
  if (!out) return false;
  // rejected actions may carry bytes that are not UTF-8
  out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
  return static_cast<bool>(out);
}

} // namespace wsim
