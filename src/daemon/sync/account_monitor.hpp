#pragma once

#include "logger.hpp"
#include "store/record_store.hpp"

#include <atomic>

// Tracks whether the store account is reachable. Read and updated from
// worker threads.
class AccountMonitor {
public:
    AccountMonitor(RecordStore& store, const Logger& log);

    // Checks the account and returns the result.
    bool refresh();

    // True when known available; otherwise checks once.
    bool ensure();

    // Called with the error of a failed store call.
    void note_error(const StoreError& err);

    bool available() const { return available_.load(); }

private:
    void set(bool available, const std::string& why);

    RecordStore& store_;
    const Logger& log_;
    std::atomic<bool> available_{false};
    std::atomic<bool> checked_{false};
};
