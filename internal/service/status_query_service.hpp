#pragma once

#include "forge/orchestrator/v1/orchestrator_service.pb.h"
#include "service_context.hpp"

namespace forge::service {

/*
  Pull-side recovery for consumers that missed pushes. Throws util::NotFound
  when the backing signaler has no record.
*/
class StatusQueryService {
 public:
  explicit StatusQueryService(ServiceContext ctx);

  forge::orchestrator::v1::GetFlowStatusResponse GetFlowStatus(const forge::orchestrator::v1::GetFlowStatusRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace forge::service
