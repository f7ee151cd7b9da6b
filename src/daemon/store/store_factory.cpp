#include "store/store_factory.hpp"

#include "platform/platform_paths.hpp"
#include "store/http_store.hpp"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::expected<StoreBundle, std::string> make_store(const Config::Store& cfg) {
    StoreBundle bundle;

    if (cfg.type == "memory") {
        auto store = std::make_unique<MemoryRecordStore>();
        bundle.push = std::make_unique<MemoryPushChannel>(*store);
        bundle.store = std::move(store);
    } else if (cfg.type == "sqlite") {
        auto path = cfg.path;
        if (path.empty()) {
            auto dir = platform::data_dir();
            if (dir.empty()) return std::unexpected("no data directory for the sqlite store");
            path = (fs::path(dir) / "store.db").string();
        }
        auto store = std::make_unique<SqliteRecordStore>();
        if (!store->open(path)) return std::unexpected("cannot open sqlite store at " + path);
        bundle.store = std::move(store);
        bundle.push = std::make_unique<SqlitePushChannel>(path);
    } else if (cfg.type == "http") {
        bundle.store = std::make_unique<HttpRecordStore>(cfg.url, cfg.token,
                                                         static_cast<long>(cfg.timeout_s));
        bundle.push = std::make_unique<HttpPushChannel>(cfg.url, cfg.token);
    } else {
        return std::unexpected("unknown store type: " + cfg.type);
    }

    return bundle;
}
