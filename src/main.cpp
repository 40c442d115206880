#include "cache.h"
#include "config.h"
#include "logger.h"
#include "sweeper.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using StringCache = Cache<std::string, std::string>;

static std::string show(const std::optional<std::string>& v) {
    return v ? *v : "MISS";
}

int main(int argc, char* argv[]) {
    CacheConfig cfg;
    try {
        if (auto path = parse_config_path(argc, argv)) {
            cfg = load_config_file(*path);
        }
        apply_cli_overrides(cfg, argc, argv);
    } catch (const ConfigError& e) {
        log_message(LogLevel::Error, "Main", e.what());
        std::cerr << "usage: " << argv[0]
                  << " [--config file.json] [--default-ttl-ms N]"
                     " [--sweep-interval-ms N] [--log-level debug|info|warn|error]\n";
        return 1;
    }

    set_log_level(cfg.log_level);
    log_message(LogLevel::Info, "Main", "Effective config: " + to_json(cfg).dump());

    // --- Core components ---
    std::optional<StringCache::duration> default_ttl;
    if (cfg.default_ttl) default_ttl = *cfg.default_ttl;
    auto cache = std::make_shared<StringCache>(default_ttl);

    Sweeper<StringCache> sweeper(cache, cfg.sweep_interval);
    sweeper.start();

    std::cout << "=== Basic set/get ===\n";
    cache->set("A", "Apple");
    cache->set("B", "Banana", std::chrono::milliseconds(200));
    std::cout << "Get A: " << show(cache->get("A")) << "\n";
    std::cout << "Get B: " << show(cache->get("B")) << "\n";

    std::cout << "\n=== Overwrite ===\n";
    auto previous = cache->set("A", "Apricot");
    std::cout << "Replaced " << show(previous) << " with " << show(cache->get("A")) << "\n";

    std::cout << "\n=== Lazy expiry ===\n";
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::cout << "Get B after TTL: " << show(cache->get("B")) << "\n";
    std::cout << "Stored entries (incl. expired): " << cache->size() << "\n";

    std::cout << "\n=== Sweep ===\n";
    auto removed = sweeper.sweep_now();
    std::cout << "Removed " << removed << ", stored entries now " << cache->size() << "\n";

    std::cout << "\n=== Remove ===\n";
    std::cout << "Removed A: " << show(cache->remove("A")) << "\n";
    std::cout << "Empty: " << std::boolalpha << cache->empty() << "\n";

    std::cout << "\nhits=" << cache->hits() << " misses=" << cache->misses() << "\n";

    sweeper.stop();
    return 0;
}
