#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace forge::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// RFC3339 with up to nanosecond precision, always UTC ("...T...Z").
std::string                 ToRfc3339(const google::protobuf::Timestamp& ts);
google::protobuf::Timestamp FromRfc3339(const std::string& text);

} // namespace forge::util
