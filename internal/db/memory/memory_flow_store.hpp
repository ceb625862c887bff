#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/store/flow_store.hpp"

namespace forge::db::memory {

class MemoryFlowStore final : public store::FlowStore {
 public:
  std::optional<store::FlowRecord> GetFlow(forge::orchestrator::v1::FlowId flow_id) override;

  // Assigns the next id and returns it.
  forge::orchestrator::v1::FlowId CreateFlow(const std::string& name, const std::string& raw_graph_json);

  // Inserts or replaces the record under record.id.
  void PutFlow(const store::FlowRecord& record);

 private:
  std::mutex                                                         mutex_;
  std::unordered_map<forge::orchestrator::v1::FlowId, store::FlowRecord> flows_;
  forge::orchestrator::v1::FlowId                                    next_id_ = 1;
};

} // namespace forge::db::memory
