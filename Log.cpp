// Log.cpp
#include "Log.hpp"
#include <cstdio>

namespace SignalFlow {

namespace {
LogLevel currentLevel = LogLevel::Info;
LogSink currentSink;
}

void setLogLevel(LogLevel level) { currentLevel = level; }

LogLevel logLevel() { return currentLevel; }

bool parseLogLevel(const std::string& text, LogLevel& out) {
    if (text == "debug") out = LogLevel::Debug;
    else if (text == "info") out = LogLevel::Info;
    else if (text == "warn") out = LogLevel::Warn;
    else if (text == "error") out = LogLevel::Error;
    else if (text == "off") out = LogLevel::Off;
    else return false;
    return true;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: break;
    }
    return "OFF";
}

void setLogSink(LogSink sink) { currentSink = std::move(sink); }

void writeLog(LogLevel level, const std::string& message) {
    if (currentSink) {
        currentSink(level, message);
        return;
    }
    fmt::print(stderr, "[{}] {}\n", logLevelName(level), message);
}

} // namespace SignalFlow
