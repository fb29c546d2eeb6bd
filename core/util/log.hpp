#pragma once

#include <functional>
#include <string>

namespace beamdec {

// ─── Logging ───────────────────────────────────────────────────
// Leveled, printf-style logging routed through one replaceable sink.
// The default sink writes to stderr. Install a callback to redirect
// messages (tests capture them, the Python module installs a callable).

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    None
};

using LogCallback = std::function<void(LogLevel, const std::string&)>;

/// Replace the sink. An empty callback restores the stderr sink.
void setLogCallback(LogCallback callback);

/// Messages below `level` are dropped before formatting.
void setLogLevel(LogLevel level);
LogLevel logLevel();

const char* logLevelName(LogLevel level);

void logMessage(LogLevel level, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace beamdec

#define BEAMDEC_LOG_DEBUG(...) ::beamdec::logMessage(::beamdec::LogLevel::Debug, __VA_ARGS__)
#define BEAMDEC_LOG_INFO(...)  ::beamdec::logMessage(::beamdec::LogLevel::Info,  __VA_ARGS__)
#define BEAMDEC_LOG_WARN(...)  ::beamdec::logMessage(::beamdec::LogLevel::Warn,  __VA_ARGS__)
#define BEAMDEC_LOG_ERROR(...) ::beamdec::logMessage(::beamdec::LogLevel::Error, __VA_ARGS__)
