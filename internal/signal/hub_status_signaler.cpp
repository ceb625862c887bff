#include "hub_status_signaler.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/protocol/lifecycle_message.hpp"
#include "internal/util/errors.hpp"

namespace forge::signal {

namespace v1 = forge::orchestrator::v1;

HubStatusSignaler::HubStatusSignaler(std::shared_ptr<hub::Broadcaster> broadcaster) : broadcaster_(std::move(broadcaster)) {
}

void HubStatusSignaler::NotifyStatus(v1::FlowId flow_id, const v1::FlowStatus& status) {
  v1::FlowStatus stored = status;
  stored.set_flow_id(flow_id);

  {
    std::unique_lock lock(mutex_);
    statuses_[flow_id] = stored;
  }

  if (!broadcaster_) {
    return;
  }

  try {
    broadcaster_->Broadcast(protocol::LifecycleMessage::FlowStatus(stored).Serialize());
  } catch (const std::exception& ex) {
    FORGE_LOG_WARN("flow status push failed",
                   {observability::IntField("flow_id", flow_id), observability::StringField("error", ex.what())});
  }
}

v1::FlowStatus HubStatusSignaler::GetStatus(v1::FlowId flow_id) const {
  std::shared_lock lock(mutex_);
  auto             it = statuses_.find(flow_id);
  if (it == statuses_.end()) {
    throw util::NotFound("no status for flow " + std::to_string(flow_id));
  }
  return it->second;
}

} // namespace forge::signal
