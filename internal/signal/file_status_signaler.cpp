#include "file_status_signaler.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "internal/protocol/status_json.hpp"
#include "internal/util/errors.hpp"

namespace forge::signal {

namespace v1 = forge::orchestrator::v1;

FileStatusSignaler::FileStatusSignaler(std::filesystem::path directory) : directory_(std::move(directory)) {
}

std::filesystem::path FileStatusSignaler::PathFor(v1::FlowId flow_id) const {
  return directory_ / (std::to_string(flow_id) + ".json");
}

void FileStatusSignaler::NotifyStatus(v1::FlowId flow_id, const v1::FlowStatus& status) {
  v1::FlowStatus stored = status;
  stored.set_flow_id(flow_id);
  const auto json = protocol::StatusToJson(stored, /*indent=*/true);

  std::lock_guard lock(mutex_);

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw util::SignalDeliveryError("failed to create status directory " + directory_.string() + ": " + ec.message());
  }

  const auto    path = PathFor(flow_id);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::SignalDeliveryError("failed to open status file " + path.string());
  }

  out << json;
  out.flush();
  if (!out) {
    throw util::SignalDeliveryError("failed to write status file " + path.string());
  }
}

v1::FlowStatus FileStatusSignaler::GetStatus(v1::FlowId flow_id) const {
  const auto path = PathFor(flow_id);

  std::string contents;
  {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      throw util::NotFound("no status for flow " + std::to_string(flow_id));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw util::NotFound("no status for flow " + std::to_string(flow_id));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    contents = buffer.str();
  }

  try {
    return protocol::StatusFromJson(contents);
  } catch (const util::ParseError& ex) {
    throw util::ParseError("corrupt status file " + path.string() + ": " + ex.what());
  }
}

} // namespace forge::signal
