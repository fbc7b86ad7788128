#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace relaynorm::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

int64_t MillisBetween(TimePoint from, TimePoint to);

} // namespace relaynorm::util
