#pragma once

#include "forge/orchestrator/v1.hpp"

namespace forge::signal {

/*
  Records and serves the latest status of each flow.

  NotifyStatus replaces the stored record for status.flow_id().
  GetStatus throws util::NotFound for a flow that was never notified.
*/
class StatusSignaler {
 public:
  virtual ~StatusSignaler() = default;

  virtual void NotifyStatus(forge::orchestrator::v1::FlowId flow_id, const forge::orchestrator::v1::FlowStatus& status) = 0;

  virtual forge::orchestrator::v1::FlowStatus GetStatus(forge::orchestrator::v1::FlowId flow_id) const = 0;
};

} // namespace forge::signal
