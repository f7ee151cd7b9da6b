#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    std::string role = "source"; // "source", "remote" or "both"
    std::string device_name;     // empty: hostname

    struct Store {
        std::string type = "sqlite"; // "sqlite", "http" or "memory"
        std::string path;            // sqlite file; empty: data_dir/store.db
        std::string url = "http://localhost:8787";
        std::string token;
        uint32_t timeout_s = 15;
    } store;

    struct Sync {
        uint32_t poll_interval_ms = 1000;
        uint32_t debounce_ms = 500;
        uint32_t heartbeat_interval_ms = 0; // 0: refresh unchanged sessions every tick
        uint32_t session_ttl_s = 1800;
        uint32_t cleanup_every_ticks = 10;
        uint32_t malformed_report_threshold = 5;
        uint32_t workers = 2;

        std::chrono::milliseconds poll_interval() const {
            return std::chrono::milliseconds(poll_interval_ms);
        }
        std::chrono::milliseconds debounce() const { return std::chrono::milliseconds(debounce_ms); }
        std::chrono::milliseconds heartbeat_interval() const {
            return std::chrono::milliseconds(heartbeat_interval_ms);
        }
        std::chrono::seconds session_ttl() const { return std::chrono::seconds(session_ttl_s); }
    } sync;

    struct Source {
        std::string status_dir = "/tmp";
        std::string file_prefix = "session-relay-";
        uint32_t local_timeout_s = 7200;
        uint32_t pid_check_after_s = 60;
        uint32_t response_poll_interval_ms = 2000;
        std::string fallback_dir = "/tmp";
        std::string injection = "tty"; // "tty", "wtype" or "none"
    } source;

    struct Remote {
        uint32_t refresh_interval_ms = 5000;
        bool notify = true; // desktop notice when a session needs input or finishes
    } remote;

    bool runs_source() const { return role == "source" || role == "both"; }
    bool runs_remote() const { return role == "remote" || role == "both"; }

    // Returns one message per violated constraint; empty when usable.
    std::vector<std::string> validate() const;

    static Config load(const std::string& path);
    static Config load_default();
};
