#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <google/protobuf/timestamp.pb.h>

namespace graphdoc::util {

/*
  Time utilities. All clock reads go through here.

  Stored timestamps are unix epoch milliseconds; rendered timestamps are
  RFC 3339 in UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

std::string              ToRfc3339(TimePoint tp);
std::string              MillisToRfc3339(uint64_t ms);
std::optional<TimePoint> ParseRfc3339(const std::string& text);

} // namespace graphdoc::util
