#include "wsim/action_queue.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>

namespace wsim {

SubmitStatus ActionQueue::submit(Action a) {
  std::lock_guard<std::mutex> lk(mu_);
  if (capacity_ != 0 && q_.size() >= capacity_) return SubmitStatus::QueueFull;
  a.arrival = next_arrival_++;
  q_.push_back(std::move(a));
  return SubmitStatus::Accepted;
}

std::vector<Action> ActionQueue::drain() {
  std::deque<Action> taken;
  {
    std::lock_guard<std::mutex> lk(mu_);
    taken.swap(q_);
  }
  return std::vector<Action>(std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
}

std::size_t ActionQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

void order_for_tick(std::vector<Action>& actions) {
  std::stable_sort(actions.begin(), actions.end(), [](const Action& x, const Action& y) {
    return std::tie(x.submitted_tick, x.arrival, x.agent) < std::tie(y.submitted_tick, y.arrival, y.agent);
  });
}

} // namespace wsim
