#include "wsim/snapshot_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wsim/codec.hpp"
#include "wsim/errors.hpp"

namespace wsim {

namespace fs = std::filesystem;

namespace {

constexpr const char* kPrefix = "snapshot-";
constexpr const char* kSuffix = ".json";

std::optional<Tick> tick_from_name(const std::string& name) {
  const std::string prefix = kPrefix;
  const std::string suffix = kSuffix;
  if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
  if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
  if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

  const std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  return static_cast<Tick>(std::stoll(digits));
}

bool write_file_durable(const std::string& path, const std::string& bytes) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) return false;

  std::size_t done = 0;
  while (done < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + done, bytes.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      ::close(fd);
      return false;
    }
    done += static_cast<std::size_t>(n);
  }
  const bool synced = ::fsync(fd) == 0;
  return (::close(fd) == 0) && synced;
}

} // namespace

SnapshotStore::SnapshotStore(std::string dir) : dir_(std::move(dir)) {}

std::string SnapshotStore::path_for(Tick tick) const {
  char name[64];
  std::snprintf(name, sizeof(name), "%s%012lld%s", kPrefix, static_cast<long long>(tick), kSuffix);
  return (fs::path(dir_) / name).string();
}

bool SnapshotStore::save(const WorldState& s) {
  const std::string bytes = snapshot_to_json(s).dump();
  const std::string final_path = path_for(s.tick);
  const std::string tmp_path = final_path + ".tmp";

  std::lock_guard<std::mutex> lk(mu_);

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    spdlog::error("snapshot: cannot create '{}': {}", dir_, ec.message());
    return false;
  }

  if (!write_file_durable(tmp_path, bytes)) {
    spdlog::error("snapshot: cannot write '{}': {}", tmp_path, std::strerror(errno));
    fs::remove(tmp_path, ec);
    return false;
  }

  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    spdlog::error("snapshot: cannot rename into '{}': {}", final_path, ec.message());
    fs::remove(tmp_path, ec);
    return false;
  }

  spdlog::info("snapshot: tick {} written to {}", s.tick, final_path);
  return true;
}

WorldState SnapshotStore::load(Tick tick) const {
  const std::string path = path_for(tick);

  std::string text;
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::ifstream in(path);
    if (!in) throw CodecError("snapshot for tick " + std::to_string(tick) + " not found at " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    text = ss.str();
  }

  const auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded()) throw CodecError("snapshot " + path + " is not valid JSON");

  std::string stored;
  WorldState s = snapshot_from_json(j, &stored);
  if (s.tick != tick) {
    throw IntegrityError("snapshot " + path + " holds tick " + std::to_string(s.tick));
  }

  const std::string actual = state_hash(s);
  if (actual != stored) {
    throw IntegrityError("snapshot hash mismatch at tick " + std::to_string(tick) +
                         ": stored " + stored + ", computed " + actual);
  }
  return s;
}

std::vector<Tick> SnapshotStore::ticks() const {
  std::vector<Tick> out;
  std::lock_guard<std::mutex> lk(mu_);

  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) return out;

  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    if (auto t = tick_from_name(it->path().filename().string())) out.push_back(*t);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<Tick> SnapshotStore::latest_at_or_before(Tick tick) const {
  const auto all = ticks();
  auto it = std::upper_bound(all.begin(), all.end(), tick);
  if (it == all.begin()) return std::nullopt;
  return *std::prev(it);
}

} // namespace wsim
