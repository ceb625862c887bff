#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "internal/hub/hub.hpp"
#include "internal/signal/status_signaler.hpp"

namespace forge::signal {

/*
  Live signaler: keeps the latest status per flow in memory and pushes a
  FLOW_STATUS envelope through the broadcaster. A failed push is logged, the
  local update always succeeds.
*/
class HubStatusSignaler final : public StatusSignaler {
 public:
  explicit HubStatusSignaler(std::shared_ptr<hub::Broadcaster> broadcaster);

  void NotifyStatus(forge::orchestrator::v1::FlowId flow_id, const forge::orchestrator::v1::FlowStatus& status) override;

  forge::orchestrator::v1::FlowStatus GetStatus(forge::orchestrator::v1::FlowId flow_id) const override;

 private:
  std::shared_ptr<hub::Broadcaster> broadcaster_;

  mutable std::shared_mutex                                                          mutex_;
  std::unordered_map<forge::orchestrator::v1::FlowId, forge::orchestrator::v1::FlowStatus> statuses_;
};

} // namespace forge::signal
