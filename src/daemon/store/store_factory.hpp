#pragma once

#include "config.hpp"
#include "store/record_store.hpp"

#include <expected>
#include <memory>
#include <string>

// A store and the push channel that reports its changes. The channel may
// refer to the store, so it is declared second and destroyed first.
struct StoreBundle {
    std::unique_ptr<RecordStore> store;
    std::unique_ptr<PushChannel> push;
};

std::expected<StoreBundle, std::string> make_store(const Config::Store& cfg);
