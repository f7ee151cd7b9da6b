#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

} // namespace

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;

    if (role != "source" && role != "remote" && role != "both") {
        errors.push_back(std::format("unknown role '{}'", role));
    }
    if (store.type != "sqlite" && store.type != "http" && store.type != "memory") {
        errors.push_back(std::format("unknown store type '{}'", store.type));
    }
    if (store.type == "http" && store.url.empty()) {
        errors.push_back("store.url is required for the http store");
    }
    if (store.type == "memory" && role != "both") {
        errors.push_back("the memory store only works with role 'both'");
    }
    if (source.injection != "tty" && source.injection != "wtype" && source.injection != "none") {
        errors.push_back(std::format("unknown injection method '{}'", source.injection));
    }

    if (sync.poll_interval_ms == 0) errors.push_back("sync.poll_interval_ms must be > 0");
    if (sync.debounce_ms == 0) errors.push_back("sync.debounce_ms must be > 0");
    if (sync.debounce_ms >= sync.poll_interval_ms) {
        errors.push_back(std::format("sync.debounce_ms ({}) must be less than "
                                     "sync.poll_interval_ms ({})",
                                     sync.debounce_ms, sync.poll_interval_ms));
    }
    if (sync.session_ttl_s == 0) errors.push_back("sync.session_ttl_s must be > 0");
    if (sync.cleanup_every_ticks == 0) errors.push_back("sync.cleanup_every_ticks must be > 0");
    if (sync.workers == 0) errors.push_back("sync.workers must be > 0");
    if (source.response_poll_interval_ms == 0) {
        errors.push_back("source.response_poll_interval_ms must be > 0");
    }
    if (remote.refresh_interval_ms == 0) errors.push_back("remote.refresh_interval_ms must be > 0");

    return errors;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        read_key(j, "role", cfg.role);
        read_key(j, "device_name", cfg.device_name);

        if (j.contains("store")) {
            auto& s = j["store"];
            read_key(s, "type", cfg.store.type);
            read_key(s, "path", cfg.store.path);
            read_key(s, "url", cfg.store.url);
            read_key(s, "token", cfg.store.token);
            read_key(s, "timeout_s", cfg.store.timeout_s);
        }

        if (j.contains("sync")) {
            auto& s = j["sync"];
            read_key(s, "poll_interval_ms", cfg.sync.poll_interval_ms);
            read_key(s, "debounce_ms", cfg.sync.debounce_ms);
            read_key(s, "heartbeat_interval_ms", cfg.sync.heartbeat_interval_ms);
            read_key(s, "session_ttl_s", cfg.sync.session_ttl_s);
            read_key(s, "cleanup_every_ticks", cfg.sync.cleanup_every_ticks);
            read_key(s, "malformed_report_threshold", cfg.sync.malformed_report_threshold);
            read_key(s, "workers", cfg.sync.workers);
        }

        if (j.contains("source")) {
            auto& s = j["source"];
            read_key(s, "status_dir", cfg.source.status_dir);
            read_key(s, "file_prefix", cfg.source.file_prefix);
            read_key(s, "local_timeout_s", cfg.source.local_timeout_s);
            read_key(s, "pid_check_after_s", cfg.source.pid_check_after_s);
            read_key(s, "response_poll_interval_ms", cfg.source.response_poll_interval_ms);
            read_key(s, "fallback_dir", cfg.source.fallback_dir);
            read_key(s, "injection", cfg.source.injection);
        }

        if (j.contains("remote")) {
            read_key(j["remote"], "refresh_interval_ms", cfg.remote.refresh_interval_ms);
            read_key(j["remote"], "notify", cfg.remote.notify);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
