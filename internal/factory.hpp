#pragma once

#include <memory>

#include "config/config.pb.h"

namespace forge::store {
class FlowStore;
}
namespace forge::ledger {
class Ledger;
}
namespace forge::hub {
class Hub;
}
namespace forge::signal {
class StatusSignaler;
}
namespace forge::engine {
class ExecutionEngine;
}
namespace forge::service {
class FlowRunService;
class StatusQueryService;
} // namespace forge::service

namespace forge::factory {

/*
  Application

  Owns every long-lived component of the daemon. Transports (gRPC) are
  layered on top by the binary.
*/
struct Application {
  std::shared_ptr<store::FlowStore> flows;
  std::shared_ptr<ledger::Ledger>   ledger;

  std::shared_ptr<hub::Hub>              hub;
  std::shared_ptr<signal::StatusSignaler> file_signaler;
  std::shared_ptr<signal::StatusSignaler> hub_signaler;

  std::shared_ptr<engine::ExecutionEngine> engine;

  std::shared_ptr<service::FlowRunService>     run_service;
  std::shared_ptr<service::StatusQueryService> status_service;
};

/*
  Build

  Composition root. The only place that knows concrete store, ledger and
  provider client types. Run workers are started before returning.
*/
Application Build(const forge::runtime::config::RuntimeConfig& config);

} // namespace forge::factory
