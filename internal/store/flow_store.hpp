#pragma once

#include <optional>
#include <string>

#include "forge/orchestrator/v1.hpp"

namespace forge::store {

/*
  A persisted flow as the editor saved it. The engine only reads
  raw_graph_json.
*/
struct FlowRecord {
  forge::orchestrator::v1::FlowId id = 0;
  std::string                     name;
  std::string                     raw_graph_json;
  std::string                     status;
  std::string                     created_at;
};

class FlowStore {
 public:
  virtual ~FlowStore() = default;

  virtual std::optional<FlowRecord> GetFlow(forge::orchestrator::v1::FlowId flow_id) = 0;
};

} // namespace forge::store
