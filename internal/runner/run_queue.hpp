#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "forge/orchestrator/v1.hpp"

namespace forge::runner {

/*
  Thread-safe blocking queue of flow ids for the run workers.

  After Shutdown, Dequeue keeps returning queued ids until the queue is
  empty, then nullopt.
*/
class RunQueue {
 public:
  // false once shut down.
  bool Enqueue(forge::orchestrator::v1::FlowId flow_id);

  // blocking wait
  std::optional<forge::orchestrator::v1::FlowId> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex                          mutex_;
  std::condition_variable                     cv_;
  std::queue<forge::orchestrator::v1::FlowId> queue_;
  bool                                        shutdown_ = false;
};

} // namespace forge::runner
