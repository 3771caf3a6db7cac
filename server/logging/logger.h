#pragma once

#include <string>

namespace agentfw {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on AGENTFW_LOG_FORMAT=json before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below the minimum level are dropped. Defaults to INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "server", "pipeline", "dispatch").  `extra` is an optional key=value
// string appended to the JSON object or the text line (ignored when empty).
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace agentfw
