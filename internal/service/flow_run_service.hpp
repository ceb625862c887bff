#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

#include "forge/orchestrator/v1/orchestrator_service.pb.h"
#include "internal/runner/run_queue.hpp"
#include "internal/runner/run_worker.hpp"
#include "service_context.hpp"

namespace forge::service {

/*
  Accepts flow runs and executes them on a pool of background workers.

  At most one run per flow id is queued or executing at a time within this
  process; a second ExecuteFlow for the same id throws util::AlreadyRunning.
*/
class FlowRunService {
 public:
  FlowRunService(ServiceContext ctx, std::uint32_t workers);
  ~FlowRunService();

  FlowRunService(const FlowRunService&)            = delete;
  FlowRunService& operator=(const FlowRunService&) = delete;

  forge::orchestrator::v1::ExecuteFlowResponse ExecuteFlow(const forge::orchestrator::v1::ExecuteFlowRequest& req);

  bool IsActive(forge::orchestrator::v1::FlowId flow_id) const;

  // Blocks until nothing is queued or running, or the timeout passes.
  bool WaitIdle(std::chrono::milliseconds timeout);

  void Start();
  // Lets queued runs finish, then joins the workers.
  void Stop();

 private:
  void Run(forge::orchestrator::v1::FlowId flow_id);

  ServiceContext ctx_;

  std::shared_ptr<runner::RunQueue>               queue_;
  std::vector<std::unique_ptr<runner::RunWorker>> workers_;

  mutable std::mutex                                  mutex_;
  std::condition_variable                             idle_cv_;
  std::unordered_set<forge::orchestrator::v1::FlowId> active_;
};

} // namespace forge::service
