#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/db/memory/memory_flow_store.hpp"
#include "internal/db/memory/memory_ledger.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_flow_store.hpp"
#include "internal/db/sqlite/sqlite_ledger.hpp"
#include "internal/engine/execution_engine.hpp"
#include "internal/hub/hub.hpp"
#include "internal/llm/gateway.hpp"
#include "internal/llm/stub_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/security/credential_store.hpp"
#include "internal/service/flow_run_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/status_query_service.hpp"
#include "internal/signal/file_status_signaler.hpp"
#include "internal/signal/hub_status_signaler.hpp"

namespace forge::factory {

namespace {

void BuildPersistence(const forge::runtime::config::RuntimeConfig& config, Application& app) {
  const auto& database = config.database();

  if (database.has_memory()) {
    app.flows  = std::make_shared<db::memory::MemoryFlowStore>();
    app.ledger = std::make_shared<db::memory::MemoryLedger>();
    FORGE_LOG_INFO("using in-memory flow store and ledger");
    return;
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
  sqlite_db->BootstrapSchema();

  app.flows  = std::make_shared<db::sqlite::SqliteFlowStore>(sqlite_db);
  app.ledger = std::make_shared<db::sqlite::SqliteLedger>(sqlite_db);
  FORGE_LOG_INFO("using sqlite flow store and ledger", {observability::StringField("path", sqlite_db->path())});
}

std::shared_ptr<llm::GenerationService> BuildGeneration() {
  auto stub = std::make_shared<llm::StubProviderClient>();

  llm::Gateway::ClientMap clients;
  clients[llm::ProviderType::kAnthropic] = stub;
  clients[llm::ProviderType::kOpenAI]    = stub;

  return std::make_shared<llm::Gateway>(std::move(clients));
}

} // namespace

Application Build(const forge::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  BuildPersistence(config, app);

  // ------------------------------------------------------------------
  // Signaling
  // ------------------------------------------------------------------
  app.hub           = std::make_shared<hub::Hub>(config.hub().observer_queue_capacity());
  app.file_signaler = std::make_shared<signal::FileStatusSignaler>(config.status().directory());
  app.hub_signaler  = std::make_shared<signal::HubStatusSignaler>(app.hub);

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  engine::EngineDependencies deps;
  deps.flows            = app.flows;
  deps.credentials      = std::make_shared<security::EnvCredentialStore>();
  deps.generation       = BuildGeneration();
  deps.ledger           = app.ledger;
  deps.broadcaster      = app.hub;
  deps.durable_signaler = app.file_signaler;
  deps.live_signaler    = app.hub_signaler;

  app.engine = std::make_shared<engine::ExecutionEngine>(std::move(deps));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine = app.engine;
  ctx.hub    = app.hub;
  ctx.status = config.status().query_backend() == forge::runtime::config::STATUS_QUERY_BACKEND_HUB ? app.hub_signaler : app.file_signaler;

  app.run_service    = std::make_shared<service::FlowRunService>(ctx, config.runner().workers());
  app.status_service = std::make_shared<service::StatusQueryService>(ctx);

  app.run_service->Start();

  return app;
}

} // namespace forge::factory
