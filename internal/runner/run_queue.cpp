#include "run_queue.hpp"

namespace forge::runner {

bool RunQueue::Enqueue(forge::orchestrator::v1::FlowId flow_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(flow_id);
  }
  cv_.notify_one();
  return true;
}

std::optional<forge::orchestrator::v1::FlowId> RunQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto flow_id = queue_.front();
  queue_.pop();
  return flow_id;
}

void RunQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t RunQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace forge::runner
