#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace launchpad::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

uint64_t ToUnixMillis(TimePoint tp);

// UTC calendar date, YYYY-MM-DD.
std::string TodayUtc();

} // namespace launchpad::util
