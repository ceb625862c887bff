#include "flow_run_service.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/engine/execution_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace forge::service {

using namespace forge::orchestrator::v1;

FlowRunService::FlowRunService(ServiceContext ctx, std::uint32_t workers) : ctx_(std::move(ctx)), queue_(std::make_shared<runner::RunQueue>()) {
  if (!ctx_.engine) throw std::invalid_argument("flow run service requires an engine");

  const auto count = workers == 0 ? 1u : workers;
  for (std::uint32_t i = 0; i < count; ++i) {
    workers_.push_back(std::make_unique<runner::RunWorker>(queue_, [this](FlowId flow_id) { Run(flow_id); }));
  }
}

FlowRunService::~FlowRunService() {
  Stop();
}

void FlowRunService::Start() {
  for (auto& worker : workers_) {
    worker->Start();
  }
}

void FlowRunService::Stop() {
  queue_->Shutdown();
  for (auto& worker : workers_) {
    worker->Stop();
  }
}

ExecuteFlowResponse FlowRunService::ExecuteFlow(const ExecuteFlowRequest& req) {
  const auto flow_id = req.flow_id();

  {
    std::lock_guard lock(mutex_);
    if (!active_.insert(flow_id).second) {
      throw util::AlreadyRunning("flow " + std::to_string(flow_id) + " is already running");
    }
  }

  if (!queue_->Enqueue(flow_id)) {
    {
      std::lock_guard lock(mutex_);
      active_.erase(flow_id);
    }
    idle_cv_.notify_all();
    throw std::runtime_error("flow runner is shutting down");
  }

  FORGE_LOG_INFO("flow run accepted", {observability::IntField("flow_id", flow_id)});

  ExecuteFlowResponse resp;
  resp.set_flow_id(flow_id);
  resp.set_accepted(true);
  return resp;
}

bool FlowRunService::IsActive(FlowId flow_id) const {
  std::lock_guard lock(mutex_);
  return active_.count(flow_id) > 0;
}

bool FlowRunService::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [&] { return active_.empty(); });
}

void FlowRunService::Run(FlowId flow_id) {
  try {
    ctx_.engine->ExecuteFlow(flow_id);
  } catch (const std::exception& ex) {
    // Already reported as FLOW_FAILED by the engine.
    FORGE_LOG_DEBUG("flow run ended with error", {observability::IntField("flow_id", flow_id), observability::StringField("error", ex.what())});
  }

  {
    std::lock_guard lock(mutex_);
    active_.erase(flow_id);
  }
  idle_cv_.notify_all();
}

} // namespace forge::service
