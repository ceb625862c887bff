#include "lifecycle_message.hpp"

#include <google/protobuf/util/json_util.h>

#include <array>
#include <utility>

#include "internal/protocol/status_json.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace forge::protocol {

namespace v1 = forge::orchestrator::v1;

namespace {

constexpr std::array<std::pair<MessageType, std::string_view>, 6> kTypeNames = {{
    {MessageType::kFlowStarted, "FLOW_STARTED"},
    {MessageType::kNodeStarted, "NODE_STARTED"},
    {MessageType::kNodeCompleted, "NODE_COMPLETED"},
    {MessageType::kFlowCompleted, "FLOW_COMPLETED"},
    {MessageType::kFlowFailed, "FLOW_FAILED"},
    {MessageType::kFlowStatus, "FLOW_STATUS"},
}};

google::protobuf::Struct PayloadFor(v1::FlowId flow_id) {
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["flowId"].set_number_value(static_cast<double>(flow_id));
  return payload;
}

void SetString(google::protobuf::Struct& payload, const std::string& key, const std::string& value) {
  (*payload.mutable_fields())[key].set_string_value(value);
}

void SetNumber(google::protobuf::Struct& payload, const std::string& key, double value) {
  (*payload.mutable_fields())[key].set_number_value(value);
}

} // namespace

std::string_view MessageTypeName(MessageType type) {
  for (const auto& [candidate, name] : kTypeNames) {
    if (candidate == type) {
      return name;
    }
  }
  return "UNKNOWN";
}

LifecycleMessage::LifecycleMessage(MessageType type, FlowId flow_id, google::protobuf::Struct payload)
    : type_(type), flow_id_(flow_id), timestamp_(util::ToProto(util::Now())), payload_(std::move(payload)) {
  SetString(payload_, "timestamp", util::ToRfc3339(timestamp_));
}

LifecycleMessage LifecycleMessage::FlowStarted(FlowId flow_id) {
  return LifecycleMessage(MessageType::kFlowStarted, flow_id, PayloadFor(flow_id));
}

LifecycleMessage LifecycleMessage::NodeStarted(FlowId flow_id, const std::string& node_id, const std::string& label) {
  auto payload = PayloadFor(flow_id);
  SetString(payload, "nodeId", node_id);
  SetString(payload, "label", label);
  return LifecycleMessage(MessageType::kNodeStarted, flow_id, std::move(payload));
}

LifecycleMessage LifecycleMessage::NodeCompleted(FlowId flow_id, const std::string& node_id, std::int32_t input_tokens, std::int32_t output_tokens, double cost) {
  auto payload = PayloadFor(flow_id);
  SetString(payload, "nodeId", node_id);
  SetNumber(payload, "inputTokens", input_tokens);
  SetNumber(payload, "outputTokens", output_tokens);
  SetNumber(payload, "cost", cost);
  return LifecycleMessage(MessageType::kNodeCompleted, flow_id, std::move(payload));
}

LifecycleMessage LifecycleMessage::FlowCompleted(FlowId flow_id, std::int64_t execution_time_ms) {
  auto payload = PayloadFor(flow_id);
  SetNumber(payload, "executionTimeMs", static_cast<double>(execution_time_ms));
  return LifecycleMessage(MessageType::kFlowCompleted, flow_id, std::move(payload));
}

LifecycleMessage LifecycleMessage::FlowFailed(FlowId flow_id, const std::string& error) {
  auto payload = PayloadFor(flow_id);
  SetString(payload, "error", error);
  return LifecycleMessage(MessageType::kFlowFailed, flow_id, std::move(payload));
}

LifecycleMessage LifecycleMessage::FlowStatus(const v1::FlowStatus& status) {
  return LifecycleMessage(MessageType::kFlowStatus, status.flow_id(), StatusToStruct(status));
}

std::string LifecycleMessage::Serialize() const {
  google::protobuf::Struct envelope;
  auto&                    fields = *envelope.mutable_fields();
  fields["type"].set_string_value(std::string(type_name()));
  *fields["payload"].mutable_struct_value() = payload_;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(envelope, &json);
  if (!status.ok()) {
    throw util::ParseError("failed to encode lifecycle message: " + std::string(status.message()));
  }
  return json;
}

// ------------------------------------------------------------
// Envelope
// ------------------------------------------------------------

std::optional<MessageType> Envelope::kind() const {
  for (const auto& [candidate, name] : kTypeNames) {
    if (name == type) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::optional<v1::FlowId> Envelope::flow_id() const {
  const auto it = payload.fields().find("flowId");
  if (it == payload.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    return std::nullopt;
  }
  return FlowIdFromNumber(it->second.number_value());
}

Envelope ParseEnvelope(std::string_view raw) {
  google::protobuf::Struct object;
  const auto status = google::protobuf::util::JsonStringToMessage(google::protobuf::StringPiece(raw.data(), raw.size()), &object);
  if (!status.ok()) {
    throw util::ParseError("malformed lifecycle envelope: " + std::string(status.message()));
  }

  const auto type_it    = object.fields().find("type");
  const auto payload_it = object.fields().find("payload");
  if (type_it == object.fields().end() || type_it->second.kind_case() != google::protobuf::Value::kStringValue) {
    throw util::ParseError("lifecycle envelope has no string type");
  }
  if (payload_it == object.fields().end() || payload_it->second.kind_case() != google::protobuf::Value::kStructValue) {
    throw util::ParseError("lifecycle envelope has no payload object");
  }

  Envelope envelope;
  envelope.type    = type_it->second.string_value();
  envelope.payload = payload_it->second.struct_value();
  return envelope;
}

} // namespace forge::protocol
