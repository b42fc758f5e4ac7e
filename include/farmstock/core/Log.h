#pragma once

#include <string_view>

namespace farmstock::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Parses trace|debug|info|warn|error|off (case-insensitive).
bool parseLogLevel(std::string_view text, LogLevel& out);

// Callback sink for log messages.
//
// Sinks run after the line has been written to stderr and obey the level filter.
// The timestamp and message views are only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Writes "[hh:mm:ss.mmm][LEVEL] message" to stderr. Thread-safe.
void log(LogLevel level, std::string_view message);

} // namespace farmstock::core

#define FARMSTOCK_LOG_TRACE(msg) ::farmstock::core::log(::farmstock::core::LogLevel::Trace, (msg))
#define FARMSTOCK_LOG_DEBUG(msg) ::farmstock::core::log(::farmstock::core::LogLevel::Debug, (msg))
#define FARMSTOCK_LOG_INFO(msg)  ::farmstock::core::log(::farmstock::core::LogLevel::Info,  (msg))
#define FARMSTOCK_LOG_WARN(msg)  ::farmstock::core::log(::farmstock::core::LogLevel::Warn,  (msg))
#define FARMSTOCK_LOG_ERROR(msg) ::farmstock::core::log(::farmstock::core::LogLevel::Error, (msg))
