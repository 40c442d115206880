#pragma once
#ifndef CONFIG_H
#define CONFIG_H

#include "logger.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * Raised for unreadable or invalid configuration.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Settings for a cache and the sweeper that cleans it.
 */
struct CacheConfig {
    std::optional<std::chrono::milliseconds> default_ttl;          ///< Empty = never expire
    std::chrono::milliseconds sweep_interval{600000};              ///< 10 minutes
    LogLevel log_level = LogLevel::Info;
};

/**
 * Read a config from JSON. Recognised keys (all optional):
 * default_ttl_ms, sweep_interval_ms, log_level.
 * A default_ttl_ms of 0 means entries never expire by default.
 * @throws ConfigError on wrong types or out-of-range values
 */
CacheConfig config_from_json(const nlohmann::json& j);

/**
 * Load and parse a JSON config file.
 * @throws ConfigError if the file cannot be read or parsed
 */
CacheConfig load_config_file(const std::string& path);

/**
 * Find the value of --config in argv, if present.
 */
std::optional<std::string> parse_config_path(int argc, char* argv[]);

/**
 * Apply --default-ttl-ms, --sweep-interval-ms and --log-level on top of cfg.
 * --config is accepted and skipped.
 * @throws ConfigError for unknown flags, missing or invalid values
 */
void apply_cli_overrides(CacheConfig& cfg, int argc, char* argv[]);

nlohmann::json to_json(const CacheConfig& cfg);

#endif // CONFIG_H
