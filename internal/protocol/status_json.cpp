#include "status_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace forge::protocol {

namespace v1 = forge::orchestrator::v1;

namespace {

const google::protobuf::Value* FindField(const google::protobuf::Struct& object, const std::string& key) {
  const auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

std::string OptionalString(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = FindField(object, key);
  if (value == nullptr || value->kind_case() == google::protobuf::Value::kNullValue) {
    return {};
  }
  if (value->kind_case() != google::protobuf::Value::kStringValue) {
    throw util::ParseError("flow status field '" + key + "' is not a string");
  }
  return value->string_value();
}

} // namespace

google::protobuf::Struct StatusToStruct(const v1::FlowStatus& status) {
  google::protobuf::Struct object;
  auto&                    fields = *object.mutable_fields();

  fields["flowId"].set_number_value(static_cast<double>(status.flow_id()));
  fields["status"].set_string_value(v1::FlowState_Name(status.status()));
  if (!status.last_node().empty()) {
    fields["lastNode"].set_string_value(status.last_node());
  }
  fields["updatedAt"].set_string_value(util::ToRfc3339(status.updated_at()));
  if (!status.error().empty()) {
    fields["error"].set_string_value(status.error());
  }

  return object;
}

std::optional<v1::FlowId> FlowIdFromNumber(double value) {
  // 2^63 is exact as a double; the int64 maximum is not.
  constexpr double kLowest = static_cast<double>(std::numeric_limits<v1::FlowId>::min());
  if (!std::isfinite(value) || std::trunc(value) != value || value < kLowest || value >= -kLowest) {
    return std::nullopt;
  }
  return static_cast<v1::FlowId>(value);
}

v1::FlowStatus StatusFromStruct(const google::protobuf::Struct& object) {
  v1::FlowStatus status;

  const auto* flow_id = FindField(object, "flowId");
  const auto  id      = flow_id != nullptr && flow_id->kind_case() == google::protobuf::Value::kNumberValue ? FlowIdFromNumber(flow_id->number_value())
                                                                                                             : std::nullopt;
  if (!id) {
    throw util::ParseError("flow status is missing an integral flowId");
  }
  status.set_flow_id(*id);

  v1::FlowState state = v1::FLOW_STATE_UNSPECIFIED;
  if (!v1::FlowState_Parse(OptionalString(object, "status"), &state) || state == v1::FLOW_STATE_UNSPECIFIED) {
    throw util::ParseError("flow status has an unknown status value");
  }
  status.set_status(state);

  status.set_last_node(OptionalString(object, "lastNode"));
  status.set_error(OptionalString(object, "error"));

  const auto updated_at = OptionalString(object, "updatedAt");
  if (updated_at.empty()) {
    throw util::ParseError("flow status is missing updatedAt");
  }
  *status.mutable_updated_at() = util::FromRfc3339(updated_at);

  return status;
}

std::string StatusToJson(const v1::FlowStatus& status, bool indent) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = indent;

  std::string json;
  const auto  result = google::protobuf::util::MessageToJsonString(StatusToStruct(status), &json, options);
  if (!result.ok()) {
    throw util::ParseError("failed to encode flow status: " + std::string(result.message()));
  }
  return json;
}

v1::FlowStatus StatusFromJson(std::string_view json) {
  google::protobuf::Struct object;
  const auto result = google::protobuf::util::JsonStringToMessage(google::protobuf::StringPiece(json.data(), json.size()), &object);
  if (!result.ok()) {
    throw util::ParseError("failed to decode flow status: " + std::string(result.message()));
  }
  return StatusFromStruct(object);
}

} // namespace forge::protocol
