#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "forge/orchestrator/v1.hpp"

namespace forge::store {
class FlowStore;
}
namespace forge::security {
class CredentialStore;
}
namespace forge::llm {
class GenerationService;
}
namespace forge::ledger {
class Ledger;
}
namespace forge::hub {
class Broadcaster;
}
namespace forge::signal {
class StatusSignaler;
}
namespace forge::protocol {
class LifecycleMessage;
}

namespace forge::engine {

/*
  Everything the engine talks to. broadcaster and either signaler may be
  null; the corresponding channel is then skipped.
*/
struct EngineDependencies {
  std::shared_ptr<forge::store::FlowStore>          flows;
  std::shared_ptr<forge::security::CredentialStore> credentials;
  std::shared_ptr<forge::llm::GenerationService>    generation;
  std::shared_ptr<forge::ledger::Ledger>            ledger;

  std::shared_ptr<forge::hub::Broadcaster>       broadcaster;
  std::shared_ptr<forge::signal::StatusSignaler> durable_signaler;
  std::shared_ptr<forge::signal::StatusSignaler> live_signaler;
};

struct FlowRunSummary {
  std::int32_t nodes_executed    = 0;
  std::int64_t execution_time_ms = 0;
};

/*
  Runs one flow to completion on the calling thread.

  Agent nodes execute in stored array order; edges are not consulted. The
  first failing node aborts the run. Whatever aborts the run is reported as
  FLOW_FAILED plus a FAILED status carrying its text, then rethrown.
  Ledger and signaler failures are logged and never abort.
*/
class ExecutionEngine {
 public:
  explicit ExecutionEngine(EngineDependencies deps);

  FlowRunSummary ExecuteFlow(forge::orchestrator::v1::FlowId flow_id);

 private:
  forge::orchestrator::v1::FlowGraph LoadGraph(forge::orchestrator::v1::FlowId flow_id);

  void RunNode(forge::orchestrator::v1::FlowId flow_id, const forge::orchestrator::v1::Node& node);

  void Emit(const forge::protocol::LifecycleMessage& message);
  void Notify(forge::orchestrator::v1::FlowId flow_id, forge::orchestrator::v1::FlowState state, const std::string& last_node,
              const std::string& error);

  EngineDependencies deps_;
};

} // namespace forge::engine
