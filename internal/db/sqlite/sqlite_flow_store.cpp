#include "sqlite_flow_store.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "sqlite_common.hpp"

namespace forge::db::sqlite {

namespace v1 = forge::orchestrator::v1;

SqliteFlowStore::SqliteFlowStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::optional<store::FlowRecord> SqliteFlowStore::GetFlow(v1::FlowId flow_id) {
  auto* db = db_->Handle();

  const char* sql = "SELECT id,name,data,status,created_at FROM forge_flows WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }

  BindI64(st, 1, flow_id);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    auto result = Translate(db, rc);
    sqlite3_finalize(st);
    throw std::runtime_error("failed to fetch flow: " + result.message);
  }

  store::FlowRecord r;
  r.id             = ColI64(st, 0);
  r.name           = ColText(st, 1);
  r.raw_graph_json = ColText(st, 2);
  r.status         = ColText(st, 3);
  r.created_at     = ColText(st, 4);

  sqlite3_finalize(st);
  return r;
}

std::optional<v1::FlowId> SqliteFlowStore::CreateFlow(const std::string& name, const std::string& raw_graph_json, Result* result) {
  auto* db = db_->Handle();

  const char* sql = "INSERT INTO forge_flows(name,data,status) VALUES(?,?,'draft');";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    if (result) *result = Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    return std::nullopt;
  }

  BindText(st, 1, name);
  BindText(st, 2, raw_graph_json);

  int  rc         = sqlite3_step(st);
  auto translated = Translate(db, rc);
  sqlite3_finalize(st);

  if (result) *result = translated;
  if (!translated) return std::nullopt;
  return static_cast<v1::FlowId>(sqlite3_last_insert_rowid(db));
}

} // namespace forge::db::sqlite
