#include "logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_output_mutex;

/**
 * Cross platform safe localtime wrapper.
 * windows -> localtime_s
 * Linux/Unix -> localtime_r
 */
std::tm safe_localtime(std::time_t time) {
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void log_message(LogLevel level, const std::string& component, const std::string& message) {
    if (level < g_level.load()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf = safe_localtime(now);

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << "[" << std::put_time(&tm_buf, "%F %T") << "] "
              << to_string(level) << " [" << component << "] "
              << message << std::endl;
}
