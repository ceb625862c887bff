#include "execution_engine.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <stdexcept>
#include <utility>

#include "internal/graph/flow_graph.hpp"
#include "internal/hub/hub.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/llm/generation_service.hpp"
#include "internal/llm/provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/protocol/lifecycle_message.hpp"
#include "internal/security/credential_store.hpp"
#include "internal/signal/status_signaler.hpp"
#include "internal/store/flow_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace forge::engine {

namespace v1 = forge::orchestrator::v1;

using forge::observability::DoubleField;
using forge::observability::IntField;
using forge::observability::StringField;
using forge::protocol::LifecycleMessage;

namespace {

constexpr const char* kGenerationFailed = "generation failed";

std::int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

void AppendLedger(ledger::Ledger* sink, const ledger::LedgerEntry& entry) {
  if (sink == nullptr) return;

  try {
    const auto result = sink->Append(entry);
    if (!result) {
      throw util::LedgerWriteError(result.message);
    }
  } catch (const std::exception& ex) {
    FORGE_LOG_WARN("ledger append failed", {IntField("flow_id", entry.flow_id), StringField("provider", entry.provider), StringField("error", ex.what())});
  }
}

} // namespace

ExecutionEngine::ExecutionEngine(EngineDependencies deps) : deps_(std::move(deps)) {
  if (!deps_.flows) throw std::invalid_argument("execution engine requires a flow store");
  if (!deps_.credentials) throw std::invalid_argument("execution engine requires a credential store");
  if (!deps_.generation) throw std::invalid_argument("execution engine requires a generation service");
}

// ------------------------------------------------------------
// Flow
// ------------------------------------------------------------

FlowRunSummary ExecutionEngine::ExecuteFlow(v1::FlowId flow_id) {
  const auto start = std::chrono::steady_clock::now();

  observability::SpanScope span("flow.execute");
  span.SetAttribute("flow.id", static_cast<std::int64_t>(flow_id));

  FORGE_LOG_INFO("flow started", {IntField("flow_id", flow_id)});
  Emit(LifecycleMessage::FlowStarted(flow_id));
  Notify(flow_id, v1::RUNNING, "", "");

  FlowRunSummary summary;
  std::string    last_node;

  try {
    const auto graph = LoadGraph(flow_id);
    if (graph.edges_size() > 0) {
      FORGE_LOG_WARN("flow edges are ignored, nodes run in stored order",
                     {IntField("flow_id", flow_id), IntField("edges", graph.edges_size())});
    }

    for (const auto& node : graph.nodes()) {
      if (!graph::IsAgentNode(node)) {
        continue;
      }

      last_node = node.id();
      RunNode(flow_id, node);
      ++summary.nodes_executed;
    }
  } catch (const std::exception& ex) {
    const std::string error = ex.what();

    span.RecordException(error);
    FORGE_LOG_ERROR("flow failed", {IntField("flow_id", flow_id), StringField("last_node", last_node), StringField("error", error)});

    Emit(LifecycleMessage::FlowFailed(flow_id, error));
    Notify(flow_id, v1::FAILED, last_node, error);
    observability::Metrics::Instance().RecordFlowOutcome("failed");
    throw;
  }

  summary.execution_time_ms = ElapsedMs(start);
  span.SetAttribute("flow.nodes_executed", static_cast<std::int64_t>(summary.nodes_executed));

  Emit(LifecycleMessage::FlowCompleted(flow_id, summary.execution_time_ms));
  Notify(flow_id, v1::COMPLETED, last_node, "");
  observability::Metrics::Instance().RecordFlowOutcome("completed");

  FORGE_LOG_INFO("flow completed", {IntField("flow_id", flow_id), IntField("nodes", summary.nodes_executed),
                                    IntField("execution_time_ms", summary.execution_time_ms)});
  return summary;
}

v1::FlowGraph ExecutionEngine::LoadGraph(v1::FlowId flow_id) {
  const auto record = deps_.flows->GetFlow(flow_id);
  if (!record) {
    throw util::NotFound("flow " + std::to_string(flow_id) + " not found");
  }

  return graph::ParseFlowGraph(record->raw_graph_json);
}

// ------------------------------------------------------------
// Node
// ------------------------------------------------------------

void ExecutionEngine::RunNode(v1::FlowId flow_id, const v1::Node& node) {
  const auto& data = node.data();

  observability::SpanScope span("flow.node");
  span.SetAttribute("flow.id", static_cast<std::int64_t>(flow_id));
  span.SetAttribute("node.id", node.id());
  span.SetAttribute("node.provider", data.provider());

  Emit(LifecycleMessage::NodeStarted(flow_id, node.id(), data.label()));
  Notify(flow_id, v1::RUNNING, node.id(), "");

  const auto secret = deps_.credentials->Get(data.provider());
  if (!secret) {
    throw util::MissingCredential("missing API key for provider " + data.provider());
  }

  if (!llm::ParseProvider(data.provider())) {
    throw util::UnsupportedProvider("unsupported provider: " + data.provider());
  }

  llm::GenerationRequest request;
  request.role     = data.role();
  request.prompt   = data.prompt();
  request.secret   = *secret;
  request.provider = data.provider();

  llm::GenerationResult result;
  bool                  failed = false;
  std::string           failure;
  util::TokenUsage      partial;

  const auto start = std::chrono::steady_clock::now();
  try {
    result = deps_.generation->Execute(request);
  } catch (const util::GenerationError& ex) {
    failed  = true;
    failure = ex.what();
    partial = ex.partial_usage();
  } catch (const std::exception& ex) {
    failed  = true;
    failure = ex.what();
  }
  const auto latency_ms = ElapsedMs(start);

  if (failed) {
    if (failure.empty()) failure = kGenerationFailed;
    result.input_tokens  = partial.input_tokens;
    result.output_tokens = partial.output_tokens;
    result.cost          = partial.cost;
  }

  observability::Metrics::Instance().ObserveNodeLatencyMs(data.provider(), static_cast<double>(latency_ms));
  observability::Metrics::Instance().RecordNodeUsage(data.provider(), result.input_tokens, result.output_tokens, result.cost);

  // Reported for failed nodes too, so consumed tokens stay visible.
  Emit(LifecycleMessage::NodeCompleted(flow_id, node.id(), result.input_tokens, result.output_tokens, result.cost));

  ledger::LedgerEntry entry;
  entry.flow_id       = flow_id;
  entry.provider      = data.provider();
  entry.role          = data.role();
  entry.prompt_hash   = ledger::HashPrompt(data.prompt());
  entry.input_tokens  = result.input_tokens;
  entry.output_tokens = result.output_tokens;
  entry.cost          = result.cost;
  entry.latency_ms    = latency_ms;
  entry.status        = failed ? ledger::EntryStatus::kFailed : ledger::EntryStatus::kSuccess;
  entry.error         = failure;
  AppendLedger(deps_.ledger.get(), entry);

  if (failed) {
    span.RecordException(failure);
    throw util::GenerationError("node " + node.id() + " failed: " + failure, partial);
  }

  FORGE_LOG_INFO("node completed", {IntField("flow_id", flow_id), StringField("node_id", node.id()), IntField("input_tokens", result.input_tokens),
                                    IntField("output_tokens", result.output_tokens), DoubleField("cost", result.cost), IntField("latency_ms", latency_ms)});
}

// ------------------------------------------------------------
// Channels
// ------------------------------------------------------------

void ExecutionEngine::Emit(const LifecycleMessage& message) {
  if (!deps_.broadcaster) return;

  try {
    deps_.broadcaster->Broadcast(message.Serialize());
  } catch (const std::exception& ex) {
    FORGE_LOG_WARN("lifecycle broadcast failed",
                   {IntField("flow_id", message.flow_id()), StringField("type", message.type_name()), StringField("error", ex.what())});
  }
}

void ExecutionEngine::Notify(v1::FlowId flow_id, v1::FlowState state, const std::string& last_node, const std::string& error) {
  v1::FlowStatus status;
  status.set_flow_id(flow_id);
  status.set_status(state);
  status.set_last_node(last_node);
  *status.mutable_updated_at() = util::ToProto(util::Now());
  status.set_error(error);

  // File first, then hub.
  if (deps_.durable_signaler) {
    try {
      deps_.durable_signaler->NotifyStatus(flow_id, status);
    } catch (const std::exception& ex) {
      FORGE_LOG_WARN("durable status signal failed", {IntField("flow_id", flow_id), StringField("error", ex.what())});
    }
  }

  if (deps_.live_signaler) {
    try {
      deps_.live_signaler->NotifyStatus(flow_id, status);
    } catch (const std::exception& ex) {
      FORGE_LOG_WARN("live status signal failed", {IntField("flow_id", flow_id), StringField("error", ex.what())});
    }
  }
}

} // namespace forge::engine
