#include "config.h"

#include <cstdint>
#include <fstream>

using json = nlohmann::json;

namespace {

// Largest millisecond count that still fits a steady_clock duration.
constexpr std::chrono::milliseconds::rep max_millis =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::duration::max()).count();

bool is_known_option(const std::string& arg) {
    return arg == "--config" || arg == "--default-ttl-ms" ||
           arg == "--sweep-interval-ms" || arg == "--log-level";
}

std::chrono::milliseconds::rep parse_millis(const std::string& flag, const std::string& text) {
    std::size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw ConfigError("invalid value for " + flag + ": '" + text + "'");
    }
    if (pos != text.size()) {
        throw ConfigError("invalid value for " + flag + ": '" + text + "'");
    }
    if (value < 0) {
        throw ConfigError(flag + " must not be negative");
    }
    if (value > max_millis) {
        throw ConfigError(flag + " is out of range");
    }
    return value;
}

std::chrono::milliseconds::rep json_millis(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string{key} + " must be an integer");
    }
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(max_millis)) {
            throw ConfigError(std::string{key} + " is out of range");
        }
        return static_cast<long long>(u);
    }
    auto value = v.get<long long>();
    if (value < 0) {
        throw ConfigError(std::string{key} + " must not be negative");
    }
    if (value > max_millis) {
        throw ConfigError(std::string{key} + " is out of range");
    }
    return value;
}

LogLevel level_from(const std::string& name) {
    try {
        return parse_log_level(name);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

} // namespace

CacheConfig config_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    CacheConfig cfg;
    if (j.contains("default_ttl_ms")) {
        auto ttl = json_millis(j, "default_ttl_ms");
        if (ttl > 0) {
            cfg.default_ttl = std::chrono::milliseconds(ttl);
        }
    }
    if (j.contains("sweep_interval_ms")) {
        auto interval = json_millis(j, "sweep_interval_ms");
        if (interval == 0) {
            throw ConfigError("sweep_interval_ms must be positive");
        }
        cfg.sweep_interval = std::chrono::milliseconds(interval);
    }
    if (j.contains("log_level")) {
        const auto& level = j.at("log_level");
        if (!level.is_string()) {
            throw ConfigError("log_level must be a string");
        }
        cfg.log_level = level_from(level.get<std::string>());
    }
    return cfg;
}

CacheConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file '" + path + "'");
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("invalid JSON in '" + path + "': " + e.what());
    }
    return config_from_json(j);
}

std::optional<std::string> parse_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) return std::string{argv[i + 1]};
    }
    return std::nullopt;
}

void apply_cli_overrides(CacheConfig& cfg, int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!is_known_option(arg)) {
            throw ConfigError("unknown option " + arg);
        }
        if (i + 1 >= argc) {
            throw ConfigError("missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            continue;
        } else if (arg == "--default-ttl-ms") {
            auto ttl = parse_millis(arg, value);
            if (ttl > 0) {
                cfg.default_ttl = std::chrono::milliseconds(ttl);
            } else {
                cfg.default_ttl.reset();
            }
        } else if (arg == "--sweep-interval-ms") {
            auto interval = parse_millis(arg, value);
            if (interval == 0) {
                throw ConfigError("--sweep-interval-ms must be positive");
            }
            cfg.sweep_interval = std::chrono::milliseconds(interval);
        } else if (arg == "--log-level") {
            cfg.log_level = level_from(value);
        }
    }
}

json to_json(const CacheConfig& cfg) {
    return json{
        {"default_ttl_ms", cfg.default_ttl ? cfg.default_ttl->count() : 0},
        {"sweep_interval_ms", cfg.sweep_interval.count()},
        {"log_level", to_string(cfg.log_level)}
    };
}
