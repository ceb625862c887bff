#pragma once

#include <memory>

namespace forge::engine {
class ExecutionEngine;
}
namespace forge::signal {
class StatusSignaler;
}
namespace forge::hub {
class Hub;
}

namespace forge::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<forge::engine::ExecutionEngine> engine;
  // Backing signaler for pull queries (durable by default).
  std::shared_ptr<forge::signal::StatusSignaler> status;
  std::shared_ptr<forge::hub::Hub>               hub;
};

} // namespace forge::service
