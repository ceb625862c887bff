#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "forge/orchestrator/v1.hpp"

namespace forge::protocol {

/*
  JSON shape of a FlowStatus as consumers see it:

    {"flowId": 42, "status": "RUNNING", "lastNode": "b",
     "updatedAt": "2026-01-02T03:04:05.123456789Z", "error": "..."}

  lastNode and error are omitted when empty. Shared by the status files and
  the FLOW_STATUS envelope.
*/
google::protobuf::Struct           StatusToStruct(const forge::orchestrator::v1::FlowStatus& status);
forge::orchestrator::v1::FlowStatus StatusFromStruct(const google::protobuf::Struct& object);

// Flow ids travel as JSON numbers; nullopt unless integral and in FlowId range.
std::optional<forge::orchestrator::v1::FlowId> FlowIdFromNumber(double value);

std::string                         StatusToJson(const forge::orchestrator::v1::FlowStatus& status, bool indent);
forge::orchestrator::v1::FlowStatus StatusFromJson(std::string_view json);

} // namespace forge::protocol
