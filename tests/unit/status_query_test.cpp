#include "internal/service/status_query_service.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/hub/hub.hpp"
#include "internal/signal/file_status_signaler.hpp"
#include "internal/signal/hub_status_signaler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1 = forge::orchestrator::v1;

using forge::service::ServiceContext;
using forge::service::StatusQueryService;

v1::FlowStatus Running(const std::string& last_node) {
  v1::FlowStatus status;
  status.set_status(v1::RUNNING);
  status.set_last_node(last_node);
  *status.mutable_updated_at() = forge::util::ToProto(forge::util::Now());
  return status;
}

void TestFileBackedQuery() {
  const auto dir = std::filesystem::temp_directory_path() / "forge_status_query_tests" / "file";
  std::filesystem::remove_all(dir);

  auto signaler = std::make_shared<forge::signal::FileStatusSignaler>(dir);
  signaler->NotifyStatus(11, Running("b"));

  ServiceContext ctx;
  ctx.status = signaler;
  StatusQueryService service(ctx);

  v1::GetFlowStatusRequest req;
  req.set_flow_id(11);
  const auto resp = service.GetFlowStatus(req);
  assert(resp.status().flow_id() == 11);
  assert(resp.status().status() == v1::RUNNING);
  assert(resp.status().last_node() == "b");

  req.set_flow_id(12);
  bool threw = false;
  try {
    (void)service.GetFlowStatus(req);
  } catch (const forge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestHubBackedQuery() {
  auto signaler = std::make_shared<forge::signal::HubStatusSignaler>(std::make_shared<forge::hub::Hub>());
  signaler->NotifyStatus(4, Running("a"));

  ServiceContext ctx;
  ctx.status = signaler;
  StatusQueryService service(ctx);

  v1::GetFlowStatusRequest req;
  req.set_flow_id(4);
  assert(service.GetFlowStatus(req).status().last_node() == "a");
}

void TestRequiresSignaler() {
  bool threw = false;
  try {
    StatusQueryService service(ServiceContext{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFileBackedQuery();
  TestHubBackedQuery();
  TestRequiresSignaler();

  std::cout << "forge_unit_status_query: pass\n";
  return 0;
}
