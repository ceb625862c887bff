#include "sqlite_db.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace forge::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets the status readers run while a worker appends ledger rows
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS forge_flows (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, data TEXT NOT NULL, status TEXT NOT NULL DEFAULT 'draft', created_at DATETIME DEFAULT CURRENT_TIMESTAMP);",
      "CREATE TABLE IF NOT EXISTS token_ledger (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp DATETIME DEFAULT CURRENT_TIMESTAMP, flow_id TEXT NOT NULL, model_used TEXT NOT NULL, agent_role TEXT NOT NULL, prompt_hash TEXT NOT NULL, input_tokens INTEGER NOT NULL, output_tokens INTEGER NOT NULL, total_cost_usd REAL NOT NULL, latency_ms INTEGER NOT NULL, status TEXT NOT NULL, error_message TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_ledger_flow_id ON token_ledger(flow_id);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }

  Exec("SELECT id,name,data,status,created_at FROM forge_flows LIMIT 1;");
  Exec("SELECT flow_id,model_used,agent_role,prompt_hash,input_tokens,output_tokens,total_cost_usd,latency_ms,status,error_message FROM token_ledger LIMIT 1;");
}

} // namespace forge::db::sqlite
