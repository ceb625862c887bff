#pragma once

#include <sqlite3.h>

#include <string>

namespace forge::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized (FULLMUTEX) mode so one handle can be shared by the
  run workers and the gRPC threads.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Creates forge_flows and token_ledger if missing.
  void BootstrapSchema();

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace forge::db::sqlite
