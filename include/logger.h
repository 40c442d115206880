#pragma once
#ifndef LOGGER_H
#define LOGGER_H

#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/**
 * Set the minimum level that reaches std::cerr. Defaults to Info.
 */
void set_log_level(LogLevel level);

LogLevel log_level();

/**
 * Parse "debug", "info", "warn" or "error" (case-insensitive).
 * @throws std::invalid_argument for any other name
 */
LogLevel parse_log_level(const std::string& name);

std::string to_string(LogLevel level);

/**
 * Write one timestamped line: [YYYY-MM-DD HH:MM:SS] LEVEL [component] message
 * Lines below the current level are dropped. Safe to call from any thread.
 */
void log_message(LogLevel level, const std::string& component, const std::string& message);

#endif // LOGGER_H
