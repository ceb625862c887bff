#include "internal/service/flow_run_service.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_flow_store.hpp"
#include "internal/engine/execution_engine.hpp"
#include "internal/hub/hub.hpp"
#include "internal/llm/generation_service.hpp"
#include "internal/runner/run_queue.hpp"
#include "internal/security/credential_store.hpp"
#include "internal/signal/file_status_signaler.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = forge::orchestrator::v1;

using forge::service::FlowRunService;
using forge::service::ServiceContext;

// Holds every generation call until Open() is called.
class GatedGeneration final : public forge::llm::GenerationService {
 public:
  forge::llm::GenerationResult Execute(const forge::llm::GenerationRequest&) override {
    std::unique_lock lock(mutex_);
    ++waiting_;
    cv_.notify_all();
    cv_.wait(lock, [&] { return open_; });

    forge::llm::GenerationResult result;
    result.input_tokens  = 1;
    result.output_tokens = 1;
    return result;
  }

  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  bool WaitForCallers(int count, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return waiting_ >= count; });
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  int                     waiting_ = 0;
  bool                    open_    = false;
};

constexpr const char* kOneNodeFlow =
    R"({"nodes": [{"id": "a", "type": "agent", "data": {"label": "A", "role": "Architect", "prompt": "p", "provider": "Anthropic"}}]})";

struct Fixture {
  std::shared_ptr<forge::db::memory::MemoryFlowStore>    flows      = std::make_shared<forge::db::memory::MemoryFlowStore>();
  std::shared_ptr<GatedGeneration>                       generation = std::make_shared<GatedGeneration>();
  std::shared_ptr<forge::signal::FileStatusSignaler>     files;
  ServiceContext                                         ctx;

  explicit Fixture(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "forge_flow_run_service_tests" / name;
    std::filesystem::remove_all(dir);
    files = std::make_shared<forge::signal::FileStatusSignaler>(dir);

    auto credentials = std::make_shared<forge::security::MemoryCredentialStore>();
    credentials->Set("Anthropic", "sk-ant");

    forge::engine::EngineDependencies deps;
    deps.flows            = flows;
    deps.credentials      = credentials;
    deps.generation       = generation;
    deps.durable_signaler = files;

    ctx.engine = std::make_shared<forge::engine::ExecutionEngine>(deps);
    ctx.status = files;
    ctx.hub    = std::make_shared<forge::hub::Hub>();
  }
};

v1::ExecuteFlowRequest Request(v1::FlowId flow_id) {
  v1::ExecuteFlowRequest req;
  req.set_flow_id(flow_id);
  return req;
}

void TestSecondRunOfActiveFlowIsRejected() {
  Fixture f("already_running");
  const auto first  = f.flows->CreateFlow("one", kOneNodeFlow);
  const auto second = f.flows->CreateFlow("two", kOneNodeFlow);

  FlowRunService service(f.ctx, 2);
  service.Start();

  const auto resp = service.ExecuteFlow(Request(first));
  assert(resp.accepted());
  assert(resp.flow_id() == first);
  assert(service.IsActive(first));

  assert(f.generation->WaitForCallers(1, std::chrono::seconds(5)));

  bool threw = false;
  try {
    (void)service.ExecuteFlow(Request(first));
  } catch (const forge::util::AlreadyRunning& ex) {
    threw = std::string(ex.what()).find("already running") != std::string::npos;
  }
  assert(threw);

  // Other flows are independent.
  assert(service.ExecuteFlow(Request(second)).accepted());

  f.generation->Open();
  assert(service.WaitIdle(std::chrono::seconds(5)));
  assert(!service.IsActive(first));
  assert(!service.IsActive(second));

  assert(f.files->GetStatus(first).status() == v1::COMPLETED);
  assert(f.files->GetStatus(second).status() == v1::COMPLETED);

  // Finished flows may run again.
  assert(service.ExecuteFlow(Request(first)).accepted());
  assert(service.WaitIdle(std::chrono::seconds(5)));

  service.Stop();
}

void TestFailedRunReleasesFlowAndWorker() {
  Fixture f("failed_run");
  f.generation->Open();

  FlowRunService service(f.ctx, 1);
  service.Start();

  assert(service.ExecuteFlow(Request(404)).accepted());
  assert(service.WaitIdle(std::chrono::seconds(5)));
  assert(!service.IsActive(404));
  assert(f.files->GetStatus(404).status() == v1::FAILED);

  const auto id = f.flows->CreateFlow("after", kOneNodeFlow);
  assert(service.ExecuteFlow(Request(id)).accepted());
  assert(service.WaitIdle(std::chrono::seconds(5)));
  assert(f.files->GetStatus(id).status() == v1::COMPLETED);

  service.Stop();
}

void TestStoppedServiceRejectsRuns() {
  Fixture f("stopped");
  f.generation->Open();

  FlowRunService service(f.ctx, 1);
  service.Start();
  service.Stop();

  bool threw = false;
  try {
    (void)service.ExecuteFlow(Request(1));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!service.IsActive(1));
}

void TestRunQueueDrainsAfterShutdown() {
  forge::runner::RunQueue queue;
  assert(queue.Enqueue(1));
  assert(queue.Enqueue(2));
  assert(queue.Size() == 2);

  queue.Shutdown();
  assert(!queue.Enqueue(3));

  assert(queue.Dequeue() == 1);
  assert(queue.Dequeue() == 2);
  assert(!queue.Dequeue().has_value());
}

} // namespace

int main() {
  TestSecondRunOfActiveFlowIsRejected();
  TestFailedRunReleasesFlowAndWorker();
  TestStoppedServiceRejectsRuns();
  TestRunQueueDrainsAfterShutdown();

  std::cout << "forge_unit_flow_run_service: pass\n";
  return 0;
}
