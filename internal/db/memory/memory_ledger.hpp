#pragma once

#include <mutex>
#include <vector>

#include "internal/ledger/ledger.hpp"

namespace forge::db::memory {

class MemoryLedger final : public ledger::Ledger {
 public:
  Result Append(const ledger::LedgerEntry& entry) override;

  std::vector<ledger::LedgerEntry> ListByFlow(forge::orchestrator::v1::FlowId flow_id) override;

  std::vector<ledger::LedgerEntry> All();

 private:
  std::mutex                       mutex_;
  std::vector<ledger::LedgerEntry> entries_;
};

} // namespace forge::db::memory
