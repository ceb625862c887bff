#include "sqlite_ledger.hpp"

#include <string>
#include <utility>

#include "sqlite_common.hpp"

namespace forge::db::sqlite {

SqliteLedger::SqliteLedger(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteLedger::Append(const ledger::LedgerEntry& entry) {
  auto* db = db_->Handle();

  const char* sql =
      "INSERT INTO token_ledger(flow_id,model_used,agent_role,prompt_hash,input_tokens,output_tokens,total_cost_usd,latency_ms,status,error_message) "
      "VALUES(?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, std::to_string(entry.flow_id));
  BindText(st, 2, entry.provider);
  BindText(st, 3, entry.role);
  BindText(st, 4, entry.prompt_hash);
  BindI32(st, 5, entry.input_tokens);
  BindI32(st, 6, entry.output_tokens);
  BindDouble(st, 7, entry.cost);
  BindI64(st, 8, entry.latency_ms);
  BindText(st, 9, ledger::EntryStatusName(entry.status));
  BindText(st, 10, entry.error);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<ledger::LedgerEntry> SqliteLedger::ListByFlow(forge::orchestrator::v1::FlowId flow_id) {
  auto* db = db_->Handle();

  const char* sql =
      "SELECT flow_id,model_used,agent_role,prompt_hash,input_tokens,output_tokens,total_cost_usd,latency_ms,status,error_message,timestamp "
      "FROM token_ledger WHERE flow_id=? ORDER BY id;";

  std::vector<ledger::LedgerEntry> out;

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return out;

  BindText(st, 1, std::to_string(flow_id));

  while (sqlite3_step(st) == SQLITE_ROW) {
    ledger::LedgerEntry e;
    e.flow_id       = flow_id;
    e.provider      = ColText(st, 1);
    e.role          = ColText(st, 2);
    e.prompt_hash   = ColText(st, 3);
    e.input_tokens  = ColI32(st, 4);
    e.output_tokens = ColI32(st, 5);
    e.cost          = sqlite3_column_double(st, 6);
    e.latency_ms    = ColI64(st, 7);
    e.status        = ColText(st, 8) == "SUCCESS" ? ledger::EntryStatus::kSuccess : ledger::EntryStatus::kFailed;
    e.error         = ColText(st, 9);
    e.timestamp     = ColText(st, 10);
    out.push_back(std::move(e));
  }

  sqlite3_finalize(st);
  return out;
}

} // namespace forge::db::sqlite
