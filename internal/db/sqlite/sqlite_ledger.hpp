#pragma once

#include <memory>

#include "internal/ledger/ledger.hpp"
#include "sqlite_db.hpp"

namespace forge::db::sqlite {

/*
  Appends to token_ledger. flow_id is stored as TEXT for compatibility with
  rows written by other tools against the same file.
*/
class SqliteLedger final : public ledger::Ledger {
 public:
  explicit SqliteLedger(std::shared_ptr<SqliteDB> db);

  Result Append(const ledger::LedgerEntry& entry) override;

  std::vector<ledger::LedgerEntry> ListByFlow(forge::orchestrator::v1::FlowId flow_id) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace forge::db::sqlite
