#pragma once

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "forge/orchestrator/v1/orchestrator_service.grpc.pb.h"
#include "internal/service/flow_run_service.hpp"
#include "internal/service/status_query_service.hpp"

namespace forge::hub {
class Hub;
}

namespace forge::grpc {

class OrchestratorServer final : public forge::orchestrator::v1::FlowOrchestratorService::Service {
 public:
  OrchestratorServer(std::shared_ptr<forge::service::FlowRunService> runs, std::shared_ptr<forge::service::StatusQueryService> status,
                     std::shared_ptr<forge::hub::Hub> hub);

  ::grpc::Status ExecuteFlow(::grpc::ServerContext*, const forge::orchestrator::v1::ExecuteFlowRequest*,
                             forge::orchestrator::v1::ExecuteFlowResponse*) override;

  ::grpc::Status GetFlowStatus(::grpc::ServerContext*, const forge::orchestrator::v1::GetFlowStatusRequest*,
                               forge::orchestrator::v1::GetFlowStatusResponse*) override;

  // Streams lifecycle envelopes until the client cancels or the hub shuts
  // down. flow_id != 0 filters to one flow.
  ::grpc::Status Subscribe(::grpc::ServerContext*, const forge::orchestrator::v1::SubscribeRequest*,
                           ::grpc::ServerWriter<forge::orchestrator::v1::FlowEvent>*) override;

 private:
  static constexpr std::chrono::milliseconds kPollInterval{250};

  std::shared_ptr<forge::service::FlowRunService>     runs_;
  std::shared_ptr<forge::service::StatusQueryService> status_;
  std::shared_ptr<forge::hub::Hub>                    hub_;
};

} // namespace forge::grpc
