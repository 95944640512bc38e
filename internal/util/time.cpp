#include "time.hpp"

#include <fmt/format.h>
#include <google/protobuf/util/time_util.h>

namespace graphdoc::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

// Always three fraction digits, matching graphdoc_ms_to_text on Postgres.
std::string ToRfc3339(TimePoint tp) {
  const auto ms      = std::chrono::floor<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  const auto seconds = ms >= 0 ? ms / 1000 : (ms - 999) / 1000;

  google::protobuf::Timestamp ts;
  ts.set_seconds(seconds);
  auto text = google::protobuf::util::TimeUtil::ToString(ts); // "...:SSZ"
  text.pop_back();
  return fmt::format("{}.{:03}Z", text, ms - seconds * 1000);
}

std::string MillisToRfc3339(uint64_t ms) {
  return ToRfc3339(FromUnixMillis(ms));
}

std::optional<TimePoint> ParseRfc3339(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

} // namespace graphdoc::util
