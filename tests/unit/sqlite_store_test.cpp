#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_flow_store.hpp"
#include "internal/db/memory/memory_ledger.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_flow_store.hpp"
#include "internal/db/sqlite/sqlite_ledger.hpp"
#include "internal/ledger/ledger.hpp"

namespace {

using forge::db::ErrorCode;
using forge::db::Result;
using forge::db::sqlite::SqliteDB;
using forge::db::sqlite::SqliteFlowStore;
using forge::db::sqlite::SqliteLedger;
using forge::ledger::EntryStatus;
using forge::ledger::LedgerEntry;

std::shared_ptr<SqliteDB> OpenDatabase(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "forge_sqlite_store_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  auto db = std::make_shared<SqliteDB>(path.string());
  db->BootstrapSchema();
  return db;
}

LedgerEntry MakeEntry(forge::orchestrator::v1::FlowId flow_id, const std::string& provider, EntryStatus status) {
  LedgerEntry entry;
  entry.flow_id       = flow_id;
  entry.provider      = provider;
  entry.role          = "Architect";
  entry.prompt_hash   = forge::ledger::HashPrompt("design a parser");
  entry.input_tokens  = 100;
  entry.output_tokens = 50;
  entry.cost          = 0.00105;
  entry.latency_ms    = 12;
  entry.status        = status;
  entry.error         = status == EntryStatus::kFailed ? "quota" : "";
  return entry;
}

void TestHashPromptIsStableHex() {
  assert(forge::ledger::HashPrompt("") == "cbf29ce484222325");
  const auto hash = forge::ledger::HashPrompt("design a parser");
  assert(hash.size() == 16);
  assert(hash == forge::ledger::HashPrompt("design a parser"));
  assert(hash != forge::ledger::HashPrompt("design a lexer"));
}

void TestSqliteFlowStoreCreateAndGet() {
  auto            db = OpenDatabase("flows");
  SqliteFlowStore store(db);

  Result     result;
  const auto id = store.CreateFlow("demo", R"({"nodes": []})", &result);
  assert(id.has_value());
  assert(result);

  const auto record = store.GetFlow(*id);
  assert(record.has_value());
  assert(record->id == *id);
  assert(record->name == "demo");
  assert(record->raw_graph_json == R"({"nodes": []})");
  assert(record->status == "draft");
  assert(!record->created_at.empty());

  assert(!store.GetFlow(*id + 100).has_value());

  const auto second = store.CreateFlow("other", "{}");
  assert(second.has_value() && *second > *id);
}

void TestSqliteLedgerAppendAndList() {
  auto         db = OpenDatabase("ledger");
  SqliteLedger ledger(db);

  assert(ledger.Append(MakeEntry(1, "Anthropic", EntryStatus::kSuccess)));
  assert(ledger.Append(MakeEntry(2, "OpenAI", EntryStatus::kSuccess)));
  assert(ledger.Append(MakeEntry(1, "OpenAI", EntryStatus::kFailed)));

  const auto rows = ledger.ListByFlow(1);
  assert(rows.size() == 2);
  assert(rows[0].provider == "Anthropic");
  assert(rows[0].status == EntryStatus::kSuccess);
  assert(rows[0].input_tokens == 100);
  assert(rows[0].output_tokens == 50);
  assert(std::fabs(rows[0].cost - 0.00105) < 1e-12);
  assert(rows[0].latency_ms == 12);
  assert(!rows[0].timestamp.empty());
  assert(rows[1].provider == "OpenAI");
  assert(rows[1].status == EntryStatus::kFailed);
  assert(rows[1].error == "quota");

  assert(ledger.ListByFlow(3).empty());
}

void TestSqliteLedgerReportsWriteFailure() {
  auto db = OpenDatabase("ledger_failure");
  db->Exec("DROP TABLE token_ledger;");

  SqliteLedger ledger(db);
  const auto   result = ledger.Append(MakeEntry(1, "Anthropic", EntryStatus::kSuccess));
  assert(!result);
  assert(result.code == ErrorCode::InternalError);
  assert(!result.message.empty());
}

void TestMemoryBackends() {
  forge::db::memory::MemoryFlowStore flows;
  const auto                         id = flows.CreateFlow("demo", "{}");
  assert(flows.GetFlow(id)->name == "demo");
  assert(flows.GetFlow(id)->status == "draft");
  assert(!flows.GetFlow(id + 1).has_value());

  forge::store::FlowRecord record;
  record.id             = 77;
  record.name           = "seeded";
  record.raw_graph_json = "{}";
  flows.PutFlow(record);
  assert(flows.GetFlow(77)->name == "seeded");

  forge::db::memory::MemoryLedger ledger;
  assert(ledger.Append(MakeEntry(5, "OpenAI", EntryStatus::kSuccess)));
  assert(ledger.Append(MakeEntry(6, "OpenAI", EntryStatus::kSuccess)));
  assert(ledger.ListByFlow(5).size() == 1);
  assert(!ledger.ListByFlow(5)[0].timestamp.empty());
  assert(ledger.All().size() == 2);
}

} // namespace

int main() {
  TestHashPromptIsStableHex();
  TestSqliteFlowStoreCreateAndGet();
  TestSqliteLedgerAppendAndList();
  TestSqliteLedgerReportsWriteFailure();
  TestMemoryBackends();

  std::cout << "forge_unit_sqlite_store: pass\n";
  return 0;
}
