#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "wsim/types.hpp"
#include "wsim/world_state.hpp"

namespace wsim {

// Full-state snapshots, one file per tick: <dir>/snapshot-<tick>.json.
// A snapshot file is either complete or absent (temp file + rename).
class SnapshotStore {
public:
  explicit SnapshotStore(std::string dir);

  // Logs and returns false on failure; snapshots are an optimization only.
  bool save(const WorldState& s);

  // Throws CodecError if missing or malformed, IntegrityError if the stored
  // hash does not match the content.
  WorldState load(Tick tick) const;

  std::optional<Tick> latest_at_or_before(Tick tick) const;
  std::vector<Tick> ticks() const;

  std::string path_for(Tick tick) const;
  const std::string& dir() const noexcept { return dir_; }

private:
  std::string dir_;
  mutable std::mutex mu_;
};

} // namespace wsim
