#pragma once

#include "forge/orchestrator/v1/flow.pb.h"

#include <cstdint>

namespace forge::orchestrator::v1 {

// Numeric flow id as stored by the flow store and used for status file names.
using FlowId = std::int64_t;

} // namespace forge::orchestrator::v1
