#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_flow_store.hpp"
#include "internal/engine/execution_engine.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/orchestrator_server.hpp"
#include "internal/hub/hub.hpp"
#include "internal/llm/gateway.hpp"
#include "internal/llm/stub_client.hpp"
#include "internal/security/credential_store.hpp"
#include "internal/service/flow_run_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/status_query_service.hpp"
#include "internal/signal/file_status_signaler.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = forge::orchestrator::v1;

struct Fixture {
  std::shared_ptr<forge::db::memory::MemoryFlowStore>  flows = std::make_shared<forge::db::memory::MemoryFlowStore>();
  std::shared_ptr<forge::hub::Hub>                     hub   = std::make_shared<forge::hub::Hub>();
  std::shared_ptr<forge::service::FlowRunService>      runs;
  std::shared_ptr<forge::service::StatusQueryService>  status;
  std::unique_ptr<forge::grpc::OrchestratorServer>     server;

  Fixture() {
    const auto dir = std::filesystem::temp_directory_path() / "forge_grpc_status_tests";
    std::filesystem::remove_all(dir);
    auto files = std::make_shared<forge::signal::FileStatusSignaler>(dir);

    auto stub = std::make_shared<forge::llm::StubProviderClient>();

    forge::engine::EngineDependencies deps;
    deps.flows            = flows;
    deps.credentials      = std::make_shared<forge::security::MemoryCredentialStore>();
    deps.generation       = std::make_shared<forge::llm::Gateway>(forge::llm::Gateway::ClientMap{{forge::llm::ProviderType::kAnthropic, stub}});
    deps.broadcaster      = hub;
    deps.durable_signaler = files;

    forge::service::ServiceContext ctx;
    ctx.engine = std::make_shared<forge::engine::ExecutionEngine>(deps);
    ctx.status = files;
    ctx.hub    = hub;

    runs   = std::make_shared<forge::service::FlowRunService>(ctx, 1);
    status = std::make_shared<forge::service::StatusQueryService>(ctx);
    server = std::make_unique<forge::grpc::OrchestratorServer>(runs, status, hub);
  }
};

void TestErrorMapping() {
  using forge::grpc::ToStatus;

  assert(ToStatus(forge::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(forge::util::AlreadyRunning("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(forge::util::ParseError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(forge::util::MissingCredential("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(forge::util::UnsupportedProvider("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestGetStatusOfUnknownFlowReturnsNotFound() {
  Fixture s;

  v1::GetFlowStatusRequest  req;
  v1::GetFlowStatusResponse resp;
  req.set_flow_id(12345);
  ::grpc::ServerContext grpc_ctx;

  const auto status = s.server->GetFlowStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestExecuteActiveFlowReturnsAlreadyExists() {
  Fixture s;
  // Workers are not started, so the first run stays queued.
  const auto id = s.flows->CreateFlow("demo", "{}");

  v1::ExecuteFlowRequest  req;
  v1::ExecuteFlowResponse resp;
  req.set_flow_id(id);

  ::grpc::ServerContext first_ctx;
  assert(s.server->ExecuteFlow(&first_ctx, &req, &resp).ok());
  assert(resp.accepted());

  ::grpc::ServerContext second_ctx;
  const auto status = s.server->ExecuteFlow(&second_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  s.runs->Start();
  assert(s.runs->WaitIdle(std::chrono::seconds(5)));

  v1::GetFlowStatusRequest  status_req;
  v1::GetFlowStatusResponse status_resp;
  status_req.set_flow_id(id);
  ::grpc::ServerContext status_ctx;
  assert(s.server->GetFlowStatus(&status_ctx, &status_req, &status_resp).ok());
  assert(status_resp.status().status() == v1::COMPLETED);

  s.runs->Stop();
}

void TestSubscribeEndsWhenHubShutsDown() {
  Fixture s;
  s.hub->Shutdown();

  v1::SubscribeRequest  req;
  ::grpc::ServerContext grpc_ctx;

  const auto status = s.server->Subscribe(&grpc_ctx, &req, nullptr);
  assert(status.ok());
  assert(s.hub->ObserverCount() == 0);
}

} // namespace

int main() {
  TestErrorMapping();
  TestGetStatusOfUnknownFlowReturnsNotFound();
  TestExecuteActiveFlowReturnsAlreadyExists();
  TestSubscribeEndsWhenHubShutsDown();

  std::cout << "forge_unit_grpc_status: pass\n";
  return 0;
}
