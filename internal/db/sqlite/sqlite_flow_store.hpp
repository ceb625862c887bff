#pragma once

#include <memory>

#include "internal/db/api/result.hpp"
#include "internal/store/flow_store.hpp"
#include "sqlite_db.hpp"

namespace forge::db::sqlite {

/*
  Reads flows from forge_flows(id, name, data, status, created_at).
*/
class SqliteFlowStore final : public store::FlowStore {
 public:
  explicit SqliteFlowStore(std::shared_ptr<SqliteDB> db);

  std::optional<store::FlowRecord> GetFlow(forge::orchestrator::v1::FlowId flow_id) override;

  // Returns the new row id, or nullopt with the failure in *result.
  std::optional<forge::orchestrator::v1::FlowId> CreateFlow(const std::string& name, const std::string& raw_graph_json, Result* result = nullptr);

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace forge::db::sqlite
