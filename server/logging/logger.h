#pragma once

#include <string>

namespace vertexbridge {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Output format. Text lines look like
//   2025-04-01T12:00:00.123Z [INFO] relay: stream completed | chunks=3
// and JSON mode writes one object per line with timestamp, level, app,
// component, message and (optionally) extra.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Name stamped into JSON records as "app". Defaults to "vertexbridge".
void SetAppName(const std::string &name);

// Entries below the minimum level are discarded. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Parses "DEBUG", "info", "WARNING", ... Unknown names fall back to INFO.
Level ParseLevel(const std::string &name);

// Renders one entry without writing it. Exposed for tests.
std::string FormatEntry(Level level, const std::string &component,
                        const std::string &message, const std::string &extra);

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

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
} // namespace vertexbridge
