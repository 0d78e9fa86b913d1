// Log.hpp
//
// Leveled logging for the runtime and core. Messages are formatted with fmt
// and written to stderr as "[LEVEL] message". A sink can be installed to
// capture output (tests use this to assert on warnings).
#pragma once
#include <fmt/core.h>
#include <functional>
#include <string>
#include <utility>

namespace SignalFlow {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

using LogSink = std::function<void(LogLevel, const std::string&)>;

void setLogLevel(LogLevel level);
LogLevel logLevel();
// Parses "debug", "info", "warn", "error" or "off"; returns false on anything else
bool parseLogLevel(const std::string& text, LogLevel& out);
const char* logLevelName(LogLevel level);

// Replace the output sink; an empty sink restores stderr output
void setLogSink(LogSink sink);

void writeLog(LogLevel level, const std::string& message);

inline bool logEnabled(LogLevel level) { return level >= logLevel() && logLevel() != LogLevel::Off; }

template <typename... Args>
void logDebug(fmt::format_string<Args...> f, Args&&... args) {
    if (logEnabled(LogLevel::Debug)) writeLog(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> f, Args&&... args) {
    if (logEnabled(LogLevel::Info)) writeLog(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void logWarn(fmt::format_string<Args...> f, Args&&... args) {
    if (logEnabled(LogLevel::Warn)) writeLog(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void logError(fmt::format_string<Args...> f, Args&&... args) {
    if (logEnabled(LogLevel::Error)) writeLog(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace SignalFlow
