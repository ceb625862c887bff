#include "orchestrator_server.hpp"

#include <utility>

#include "grpc_error.hpp"
#include "internal/hub/hub.hpp"
#include "internal/observability/logging.hpp"
#include "internal/protocol/lifecycle_message.hpp"
#include "internal/util/errors.hpp"

namespace forge::grpc {

using namespace forge::orchestrator::v1;

OrchestratorServer::OrchestratorServer(std::shared_ptr<forge::service::FlowRunService> runs, std::shared_ptr<forge::service::StatusQueryService> status,
                                       std::shared_ptr<forge::hub::Hub> hub)
    : runs_(std::move(runs)), status_(std::move(status)), hub_(std::move(hub)) {
}

::grpc::Status OrchestratorServer::ExecuteFlow(::grpc::ServerContext*, const ExecuteFlowRequest* req, ExecuteFlowResponse* resp) {
  try {
    *resp = runs_->ExecuteFlow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::GetFlowStatus(::grpc::ServerContext*, const GetFlowStatusRequest* req, GetFlowStatusResponse* resp) {
  try {
    *resp = status_->GetFlowStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::Subscribe(::grpc::ServerContext* ctx, const SubscribeRequest* req, ::grpc::ServerWriter<FlowEvent>* writer) {
  if (!hub_) {
    return {::grpc::StatusCode::UNAVAILABLE, "live channel is not configured"};
  }

  const auto filter   = req->flow_id();
  auto       observer = hub_->Attach();

  while (!ctx->IsCancelled()) {
    auto payload = observer->NextFor(kPollInterval);
    if (!payload) {
      if (observer->Closed()) break;
      continue;
    }

    FlowEvent event;
    try {
      auto envelope = protocol::ParseEnvelope(*payload);
      if (filter != 0 && envelope.flow_id() != filter) {
        continue;
      }
      event.set_type(envelope.type);
    } catch (const util::ParseError& ex) {
      FORGE_LOG_WARN("skipping undecodable hub message", {observability::StringField("error", ex.what())});
      continue;
    }
    event.set_envelope(*payload);

    if (!writer->Write(event)) {
      break;
    }
  }

  hub_->Detach(observer->id());
  return ::grpc::Status::OK;
}

} // namespace forge::grpc
