#include "run_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace forge::runner {

RunWorker::RunWorker(std::shared_ptr<RunQueue> queue, RunFn run) : queue_(std::move(queue)), run_(std::move(run)) {
}

RunWorker::~RunWorker() {
  Stop();
}

void RunWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RunWorker::Run, this);
}

void RunWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void RunWorker::Run() {
  while (true) {
    auto flow_id = queue_->Dequeue();
    if (!flow_id) break;

    try {
      run_(*flow_id);
    } catch (const std::exception& e) {
      FORGE_LOG_WARN("flow run failed", {observability::IntField("flow_id", *flow_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace forge::runner
