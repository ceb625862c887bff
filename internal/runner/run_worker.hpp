#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include "run_queue.hpp"

namespace forge::runner {

/*
  Background thread that pulls flow ids off the queue and hands each to the
  run callback. Exceptions from the callback are logged and the worker moves
  on to the next id.
*/
class RunWorker {
 public:
  using RunFn = std::function<void(forge::orchestrator::v1::FlowId)>;

  RunWorker(std::shared_ptr<RunQueue> queue, RunFn run);
  ~RunWorker();

  RunWorker(const RunWorker&)            = delete;
  RunWorker& operator=(const RunWorker&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<RunQueue> queue_;
  RunFn                     run_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace forge::runner
