#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/timestamp.pb.h>

#include "forge/orchestrator/v1.hpp"

namespace forge::protocol {

enum class MessageType {
  kFlowStarted,
  kNodeStarted,
  kNodeCompleted,
  kFlowCompleted,
  kFlowFailed,
  // Legacy status push, only produced by the hub-backed signaler.
  kFlowStatus,
};

std::string_view MessageTypeName(MessageType type);

/*
  One lifecycle event, serialized on the wire as {"type": ..., "payload": {...}}.

  Every payload carries flowId and an RFC3339 timestamp stamped at
  construction. Instances are immutable.
*/
class LifecycleMessage {
 public:
  using FlowId = forge::orchestrator::v1::FlowId;

  static LifecycleMessage FlowStarted(FlowId flow_id);
  static LifecycleMessage NodeStarted(FlowId flow_id, const std::string& node_id, const std::string& label);
  static LifecycleMessage NodeCompleted(FlowId flow_id, const std::string& node_id, std::int32_t input_tokens, std::int32_t output_tokens, double cost);
  static LifecycleMessage FlowCompleted(FlowId flow_id, std::int64_t execution_time_ms);
  static LifecycleMessage FlowFailed(FlowId flow_id, const std::string& error);
  static LifecycleMessage FlowStatus(const forge::orchestrator::v1::FlowStatus& status);

  MessageType type() const {
    return type_;
  }
  std::string_view type_name() const {
    return MessageTypeName(type_);
  }
  FlowId flow_id() const {
    return flow_id_;
  }
  const google::protobuf::Timestamp& timestamp() const {
    return timestamp_;
  }
  const google::protobuf::Struct& payload() const {
    return payload_;
  }

  std::string Serialize() const;

 private:
  LifecycleMessage(MessageType type, FlowId flow_id, google::protobuf::Struct payload);

  MessageType                 type_;
  FlowId                      flow_id_;
  google::protobuf::Timestamp timestamp_;
  google::protobuf::Struct    payload_;
};

/*
  Decoded envelope. Unknown kinds are returned as-is so consumers can skip
  them.
*/
struct Envelope {
  std::string              type;
  google::protobuf::Struct payload;

  std::optional<MessageType>                     kind() const;
  std::optional<forge::orchestrator::v1::FlowId> flow_id() const;
};

// Throws util::ParseError unless raw is an object with a string "type" and an
// object "payload".
Envelope ParseEnvelope(std::string_view raw);

} // namespace forge::protocol
