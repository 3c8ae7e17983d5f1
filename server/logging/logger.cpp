#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace vertexbridge {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_write_mutex;
std::mutex g_app_mutex;
std::string g_app_name{"vertexbridge"};

const char *LevelName(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

// UTC, millisecond precision: 2025-04-01T12:00:00.123Z
std::string Timestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
  gmtime_r(&secs, &utc);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(ms));
  return out;
}

std::string AppName() {
  std::lock_guard<std::mutex> lock(g_app_mutex);
  return g_app_name;
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetAppName(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_app_mutex);
  g_app_name = name;
}

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

Level ParseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::toupper(c));
                 });
  if (upper == "DEBUG") {
    return Level::DEBUG;
  }
  if (upper == "WARN" || upper == "WARNING") {
    return Level::WARN;
  }
  if (upper == "ERROR" || upper == "CRITICAL") {
    return Level::ERROR;
  }
  return Level::INFO;
}

std::string FormatEntry(Level level, const std::string &component,
                        const std::string &message, const std::string &extra) {
  if (g_json_mode.load()) {
    json j;
    j["timestamp"] = Timestamp();
    j["level"] = LevelName(level);
    j["app"] = AppName();
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    // Messages may carry caller-supplied text.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
  }
  std::string line = Timestamp() + " [" + LevelName(level) + "] " +
                     component + ": " + message;
  if (!extra.empty()) {
    line += " | " + extra;
  }
  return line;
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  std::string line = FormatEntry(level, component, message, extra);
  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::cerr << line << "\n";
}

} // namespace log
} // namespace vertexbridge
