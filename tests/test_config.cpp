#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "sr_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.role == "source");
        REQUIRE(cfg.store.type == "sqlite");
        REQUIRE(cfg.store.url == "http://localhost:8787");
        REQUIRE(cfg.sync.poll_interval_ms == 1000);
        REQUIRE(cfg.sync.debounce_ms == 500);
        REQUIRE(cfg.sync.session_ttl() == std::chrono::seconds(1800));
        REQUIRE(cfg.source.file_prefix == "session-relay-");
        REQUIRE(cfg.source.local_timeout_s == 7200);
        REQUIRE(cfg.source.injection == "tty");
        REQUIRE(cfg.remote.refresh_interval_ms == 5000);
        REQUIRE(cfg.remote.notify);
        REQUIRE(cfg.runs_source());
        REQUIRE_FALSE(cfg.runs_remote());
        REQUIRE(cfg.validate().empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "role": "both",
            "device_name": "desk",
            "store": { "type": "http", "url": "http://10.0.0.1:9090", "token": "t0k", "timeout_s": 5 },
            "sync": { "poll_interval_ms": 2000, "debounce_ms": 250, "heartbeat_interval_ms": 60000,
                      "session_ttl_s": 600, "cleanup_every_ticks": 3, "workers": 4 },
            "source": { "status_dir": "/run/user/1000", "file_prefix": "cc-", "injection": "wtype",
                        "fallback_dir": "/var/tmp" },
            "remote": { "refresh_interval_ms": 10000, "notify": false }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.role == "both");
        REQUIRE(cfg.device_name == "desk");
        REQUIRE(cfg.store.type == "http");
        REQUIRE(cfg.store.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.store.token == "t0k");
        REQUIRE(cfg.store.timeout_s == 5);
        REQUIRE(cfg.sync.poll_interval() == std::chrono::milliseconds(2000));
        REQUIRE(cfg.sync.debounce() == std::chrono::milliseconds(250));
        REQUIRE(cfg.sync.heartbeat_interval() == std::chrono::milliseconds(60000));
        REQUIRE(cfg.sync.session_ttl_s == 600);
        REQUIRE(cfg.sync.cleanup_every_ticks == 3);
        REQUIRE(cfg.sync.workers == 4);
        REQUIRE(cfg.source.status_dir == "/run/user/1000");
        REQUIRE(cfg.source.file_prefix == "cc-");
        REQUIRE(cfg.source.injection == "wtype");
        REQUIRE(cfg.source.fallback_dir == "/var/tmp");
        REQUIRE(cfg.remote.refresh_interval_ms == 10000);
        REQUIRE_FALSE(cfg.remote.notify);
        REQUIRE(cfg.runs_source());
        REQUIRE(cfg.runs_remote());
        REQUIRE(cfg.validate().empty());
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "role": "remote", "sync": { "session_ttl_s": 900 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.role == "remote");
        REQUIRE(cfg.sync.session_ttl_s == 900);
        // Other fields retain defaults
        REQUIRE(cfg.store.type == "sqlite");
        REQUIRE(cfg.sync.poll_interval_ms == 1000);
        REQUIRE(cfg.source.status_dir == "/tmp");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.role == "source");
        REQUIRE(cfg.store.type == "sqlite");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/sr_test_nonexistent_config_file.json");
        REQUIRE(cfg.role == "source");
        REQUIRE(cfg.sync.debounce_ms == 500);
    }

    SECTION("ValidateRejectsBadValues") {
        Config cfg;
        cfg.role = "observer";
        cfg.store.type = "redis";
        cfg.source.injection = "paste";
        cfg.sync.debounce_ms = 1000; // not below the poll interval
        auto errors = cfg.validate();
        REQUIRE(errors.size() == 4);
    }

    SECTION("ValidateMemoryStoreNeedsBothRoles") {
        Config cfg;
        cfg.store.type = "memory";
        REQUIRE(cfg.validate().size() == 1);
        cfg.role = "both";
        REQUIRE(cfg.validate().empty());
    }

    SECTION("ValidateZeroIntervals") {
        Config cfg;
        cfg.sync.session_ttl_s = 0;
        cfg.remote.refresh_interval_ms = 0;
        REQUIRE(cfg.validate().size() == 2);
    }
}
