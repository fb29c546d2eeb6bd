#include "util/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>
#include <vector>

namespace beamdec {

namespace {

std::mutex g_log_mutex;
LogCallback g_log_callback;
std::atomic<int> g_log_level{static_cast<int>(LogLevel::Warn)};

void defaultSink(LogLevel level, const std::string& text) {
    std::fprintf(stderr, "[beamdec] %s: %s\n", logLevelName(level), text.c_str());
}

} // namespace

void setLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = std::move(callback);
}

void setLogLevel(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_log_level.load());
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::None:  return "none";
    }
    return "unknown";
}

void logMessage(LogLevel level, const char* format, ...) {
    if (level == LogLevel::None || static_cast<int>(level) < g_log_level.load()) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);
    int len = std::vsnprintf(nullptr, 0, format, args);
    va_end(args);

    std::string text;
    if (len > 0) {
        std::vector<char> buffer(static_cast<size_t>(len) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), format, args_copy);
        text.assign(buffer.data(), static_cast<size_t>(len));
    }
    va_end(args_copy);

    // The sink runs unlocked so it may log itself.
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        callback = g_log_callback;
    }
    if (callback) {
        callback(level, text);
    } else {
        defaultSink(level, text);
    }
}

} // namespace beamdec
