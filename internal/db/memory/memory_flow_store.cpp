#include "memory_flow_store.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace forge::db::memory {

namespace v1 = forge::orchestrator::v1;

std::optional<store::FlowRecord> MemoryFlowStore::GetFlow(v1::FlowId flow_id) {
  std::lock_guard lock(mutex_);
  auto            it = flows_.find(flow_id);
  if (it == flows_.end()) return std::nullopt;
  return it->second;
}

v1::FlowId MemoryFlowStore::CreateFlow(const std::string& name, const std::string& raw_graph_json) {
  std::lock_guard lock(mutex_);

  store::FlowRecord record;
  record.id             = next_id_++;
  record.name           = name;
  record.raw_graph_json = raw_graph_json;
  record.status         = "draft";
  record.created_at     = util::ToRfc3339(util::ToProto(util::Now()));

  flows_[record.id] = record;
  return record.id;
}

void MemoryFlowStore::PutFlow(const store::FlowRecord& record) {
  std::lock_guard lock(mutex_);
  flows_[record.id] = record;
  next_id_          = std::max(next_id_, record.id + 1);
}

} // namespace forge::db::memory
