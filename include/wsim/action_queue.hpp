#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string_view>
#include <vector>

#include "wsim/actions.hpp"

namespace wsim {

enum class SubmitStatus : uint8_t { Accepted, QueueFull };

inline std::string_view to_string(SubmitStatus s) noexcept {
  return s == SubmitStatus::Accepted ? "accepted" : "queue_full";
}

// Multi-producer, single-consumer inbox of the scheduler. Submitting never
// blocks on tick processing; a bounded queue refuses instead of waiting.
class ActionQueue {
public:
  explicit ActionQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ActionQueue(const ActionQueue&) = delete;
  ActionQueue& operator=(const ActionQueue&) = delete;

  // Stamps the arrival sequence number.
  SubmitStatus submit(Action a);

  // Takes everything queued so far; later submissions go to the next drain.
  std::vector<Action> drain();

  std::size_t size() const;
  std::size_t capacity() const noexcept { return capacity_; }

private:
  std::size_t capacity_{0};   // 0 = unbounded

  mutable std::mutex mu_;
  std::deque<Action> q_;
  uint64_t next_arrival_{0};
};

// Processing order of one tick: submitted tick, then arrival, then agent id.
void order_for_tick(std::vector<Action>& actions);

} // namespace wsim
