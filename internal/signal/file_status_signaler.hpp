#pragma once

#include <filesystem>
#include <mutex>

#include "internal/signal/status_signaler.hpp"

namespace forge::signal {

/*
  Durable signaler: one indented JSON file per flow,

      <directory>/<flowId>.json

  fully rewritten on every update. The directory is created on first write.
  Writes are serialized within the process only.
*/
class FileStatusSignaler final : public StatusSignaler {
 public:
  explicit FileStatusSignaler(std::filesystem::path directory);

  // Throws util::SignalDeliveryError on I/O failure.
  void NotifyStatus(forge::orchestrator::v1::FlowId flow_id, const forge::orchestrator::v1::FlowStatus& status) override;

  // Throws util::NotFound for a missing file and util::ParseError for a
  // corrupt one.
  forge::orchestrator::v1::FlowStatus GetStatus(forge::orchestrator::v1::FlowId flow_id) const override;

  std::filesystem::path PathFor(forge::orchestrator::v1::FlowId flow_id) const;

  const std::filesystem::path& directory() const {
    return directory_;
  }

 private:
  std::filesystem::path directory_;
  mutable std::mutex    mutex_;
};

} // namespace forge::signal
