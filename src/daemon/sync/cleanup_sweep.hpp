#pragma once

#include "logger.hpp"
#include "model/session_id.hpp"
#include "scheduler/task_scheduler.hpp"
#include "store/record_store.hpp"
#include "sync/session_fetcher.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

// Deletes Session records this source published for sessions that are no
// longer running locally. Runs every N upload ticks. The remote read and the
// deletes run on workers; the stale set is computed on the actor against the
// local set current when the read returns.
class CleanupSweep {
public:
    using LocalIds = std::function<std::unordered_set<SessionId>()>;

    struct Outcome {
        bool ran = false; // false: skipped (already running, fetch error or empty result)
        size_t remote = 0;
        size_t stale = 0;
        size_t deleted = 0;
        std::string error;
    };
    using Done = std::function<void(const Outcome&)>;

    struct Stats {
        uint64_t sweeps = 0;
        uint64_t skipped = 0;
        uint64_t deleted = 0;
        uint64_t delete_failed = 0;
    };

    CleanupSweep(TaskScheduler& scheduler, RecordStore& store, const SessionFetcher& fetcher,
                 std::string device_name, uint32_t every_ticks, LocalIds local_ids,
                 const Logger& log);
    ~CleanupSweep();

    CleanupSweep(const CleanupSweep&) = delete;
    CleanupSweep& operator=(const CleanupSweep&) = delete;

    void on_tick();

    // Starts a sweep now. Returns false when one is already running.
    bool run_now(Done done = {});

    bool running() const { return running_; }
    const Stats& stats() const { return stats_; }

    // Ids of records published by `device_name` that are not in `local`.
    static std::vector<std::string> compute_stale(const std::vector<SessionRecord>& remote,
                                                  const std::unordered_set<SessionId>& local,
                                                  const std::string& device_name);

private:
    struct Liveness {
        bool alive = true;
    };

    void fetched(std::expected<SessionFetcher::Result, StoreError> result, Done done);
    void finish(const Outcome& outcome, const Done& done);

    TaskScheduler& scheduler_;
    RecordStore& store_;
    const SessionFetcher& fetcher_;
    std::string device_name_;
    uint32_t every_ticks_;
    LocalIds local_ids_;
    const Logger& log_;

    uint32_t ticks_ = 0;
    bool running_ = false;
    std::shared_ptr<Liveness> liveness_ = std::make_shared<Liveness>();
    Stats stats_;
};
