#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "forge/orchestrator/v1.hpp"
#include "internal/db/api/result.hpp"

namespace forge::ledger {

enum class EntryStatus {
  kSuccess,
  kFailed,
};

inline const char* EntryStatusName(EntryStatus status) {
  return status == EntryStatus::kSuccess ? "SUCCESS" : "FAILED";
}

/*
  One row per agent node attempt. Entries are append-only.
*/
struct LedgerEntry {
  forge::orchestrator::v1::FlowId flow_id = 0;
  std::string                     provider;
  std::string                     role;
  std::string                     prompt_hash;
  std::int32_t                    input_tokens  = 0;
  std::int32_t                    output_tokens = 0;
  double                          cost          = 0.0;
  std::int64_t                    latency_ms    = 0;
  EntryStatus                     status        = EntryStatus::kSuccess;
  std::string                     error;
  // Filled in by the backend on read.
  std::string timestamp;
};

class Ledger {
 public:
  virtual ~Ledger() = default;

  virtual db::Result Append(const LedgerEntry& entry) = 0;

  // Oldest first.
  virtual std::vector<LedgerEntry> ListByFlow(forge::orchestrator::v1::FlowId flow_id) = 0;
};

// Stable 64-bit FNV-1a digest, hex encoded. Lets rows be compared without
// storing the prompt text.
std::string HashPrompt(const std::string& prompt);

} // namespace forge::ledger
