#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "forge/orchestrator/v1.hpp"
#include "forge/orchestrator/v1/orchestrator_service.grpc.pb.h"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_flow_store.hpp"
#include "internal/graph/flow_graph.hpp"
#include "internal/protocol/status_json.hpp"
#include "internal/signal/file_status_signaler.hpp"

using namespace forge::orchestrator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  forgectl <addr> run <flow_id>\n"
            << "  forgectl <addr> status <flow_id>\n"
            << "  forgectl <addr> watch [flow_id]\n"
            << "  forgectl status-file <directory> <flow_id>\n"
            << "  forgectl import <sqlite_path> <name> <graph.json>\n";
}

static std::optional<FlowId> ParseFlowId(const std::string& value) {
  try {
    std::size_t pos = 0;
    const auto  id  = std::stoll(value, &pos);
    if (pos != value.size()) return std::nullopt;
    return id;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// ------------------------------------------------------------
// Offline commands (no daemon required)
// ------------------------------------------------------------

static int StatusFile(const std::string& directory, const std::string& id_arg) {
  auto flow_id = ParseFlowId(id_arg);
  if (!flow_id) {
    std::cerr << "invalid flow id: " << id_arg << "\n";
    return 1;
  }

  try {
    forge::signal::FileStatusSignaler signaler(directory);
    std::cout << forge::protocol::StatusToJson(signaler.GetStatus(*flow_id), true) << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
  return 0;
}

static int Import(const std::string& db_path, const std::string& name, const std::string& graph_path) {
  std::ifstream in(graph_path);
  if (!in) {
    std::cerr << "cannot read " << graph_path << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto raw = buffer.str();

  try {
    // Reject graphs the engine would fail to parse.
    const auto graph = forge::graph::ParseFlowGraph(raw);

    auto db = std::make_shared<forge::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();

    forge::db::sqlite::SqliteFlowStore store(db);
    forge::db::Result                  result;
    auto                               id = store.CreateFlow(name, raw, &result);
    if (!id) {
      std::cerr << result.message << "\n";
      return 2;
    }

    std::cout << "flow_id=" << *id << " nodes=" << graph.nodes_size() << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string first = argv[1];

  if (first == "status-file") {
    if (argc < 4) return 1;
    return StatusFile(argv[2], argv[3]);
  }

  if (first == "import") {
    if (argc < 5) return 1;
    return Import(argv[2], argv[3], argv[4]);
  }

  std::string addr = first;
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = FlowOrchestratorService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "run") {
    if (argc < 4) return 1;

    auto flow_id = ParseFlowId(argv[3]);
    if (!flow_id) {
      std::cerr << "invalid flow id: " << argv[3] << "\n";
      return 1;
    }

    ExecuteFlowRequest req;
    req.set_flow_id(*flow_id);

    ExecuteFlowResponse resp;

    auto status = stub->ExecuteFlow(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "accepted flow_id=" << resp.flow_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    auto flow_id = ParseFlowId(argv[3]);
    if (!flow_id) {
      std::cerr << "invalid flow id: " << argv[3] << "\n";
      return 1;
    }

    GetFlowStatusRequest req;
    req.set_flow_id(*flow_id);

    GetFlowStatusResponse resp;

    auto status = stub->GetFlowStatus(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << forge::protocol::StatusToJson(resp.status(), true) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    SubscribeRequest req;
    if (argc >= 4) {
      auto flow_id = ParseFlowId(argv[3]);
      if (!flow_id) {
        std::cerr << "invalid flow id: " << argv[3] << "\n";
        return 1;
      }
      req.set_flow_id(*flow_id);
    }

    auto reader = stub->Subscribe(&ctx, req);

    FlowEvent event;
    while (reader->Read(&event)) {
      std::cout << event.envelope() << std::endl;
    }

    auto status = reader->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return 0;
  }

  Usage();
  return 1;
}
