#include "memory_ledger.hpp"

#include "internal/util/time.hpp"

namespace forge::db::memory {

Result MemoryLedger::Append(const ledger::LedgerEntry& entry) {
  std::lock_guard lock(mutex_);
  auto&           stored = entries_.emplace_back(entry);
  if (stored.timestamp.empty()) {
    stored.timestamp = util::ToRfc3339(util::ToProto(util::Now()));
  }
  return Result::Ok();
}

std::vector<ledger::LedgerEntry> MemoryLedger::ListByFlow(forge::orchestrator::v1::FlowId flow_id) {
  std::lock_guard                  lock(mutex_);
  std::vector<ledger::LedgerEntry> out;
  for (const auto& entry : entries_) {
    if (entry.flow_id == flow_id) out.push_back(entry);
  }
  return out;
}

std::vector<ledger::LedgerEntry> MemoryLedger::All() {
  std::lock_guard lock(mutex_);
  return entries_;
}

} // namespace forge::db::memory
