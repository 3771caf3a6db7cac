#pragma once

#include <chrono>
#include <string>

namespace agentfw {

// UTC ISO-8601 with milliseconds, e.g. "2026-10-19T11:28:03.125Z".
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp);

// Window labels used as self-expiring bucket keys.
// MinuteLabel -> "2026-10-19T11:28", HourLabel -> "2026-10-19T11".
std::string MinuteLabel(std::chrono::system_clock::time_point tp);
std::string HourLabel(std::chrono::system_clock::time_point tp);

}  // namespace agentfw
