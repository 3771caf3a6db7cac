#include "server/common/timestamps.h"

#include <cstdio>
#include <ctime>

namespace agentfw {

namespace {
std::tm ToUtc(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}
}  // namespace

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
  auto tm = ToUtc(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count() %
            1000;
  if (ms < 0) {
    ms += 1000;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

std::string MinuteLabel(std::chrono::system_clock::time_point tp) {
  return FormatIsoTimestamp(tp).substr(0, 16);
}

std::string HourLabel(std::chrono::system_clock::time_point tp) {
  return FormatIsoTimestamp(tp).substr(0, 13);
}

}  // namespace agentfw
