#include "status_query_service.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/spans.hpp"
#include "internal/signal/status_signaler.hpp"

namespace forge::service {

using namespace forge::orchestrator::v1;

StatusQueryService::StatusQueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.status) throw std::invalid_argument("status query service requires a signaler");
}

GetFlowStatusResponse StatusQueryService::GetFlowStatus(const GetFlowStatusRequest& req) {
  observability::SpanScope span("status.get");
  span.SetAttribute("flow.id", static_cast<std::int64_t>(req.flow_id()));

  GetFlowStatusResponse resp;
  *resp.mutable_status() = ctx_.status->GetStatus(req.flow_id());
  return resp;
}

} // namespace forge::service
