#pragma once

#include "model/records.hpp"
#include "store/record_store.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

// Reads the active Session records of every source. Blocking; called from
// worker threads.
class SessionFetcher {
public:
    using Clock = std::function<Timestamp()>;

    struct Result {
        std::vector<SessionRecord> sessions; // newest first
        size_t malformed = 0;
    };

    static constexpr size_t PAGE_SIZE = 100;

    SessionFetcher(RecordStore& store, std::chrono::seconds ttl, Clock clock);

    // Session records written within the TTL window, filtered server-side on
    // the indexed timestamp field and following cursors until exhausted.
    // A store error is returned as such, never as an empty list.
    std::expected<Result, StoreError> fetch_active() const;

    // Targeted read of one record after a push notification. Records that
    // fell out of the window come back as NotFound.
    std::expected<SessionRecord, StoreError> fetch_one(const std::string& id) const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    RecordStore& store_;
    std::chrono::seconds ttl_;
    Clock clock_;
};
