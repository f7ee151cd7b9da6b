#pragma once

#include "detector/session_detector.hpp"
#include "logger.hpp"
#include "model/records.hpp"
#include "scheduler/task_scheduler.hpp"
#include "store/record_store.hpp"
#include "sync/account_monitor.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Publishes local session state as Session records.
//
// A status change (re)arms a per-session debounce timer; only the status that
// is still current when the timer fires gets written. Fired writes run on a
// worker and are never cancelled. Unchanged sessions are re-written once
// their last write is older than the heartbeat interval so their timestamp
// stays inside the remote query window.
//
// All members are touched on the scheduler's actor thread only.
class UploadPipeline {
public:
    struct Options {
        std::chrono::milliseconds debounce{500};
        std::chrono::milliseconds heartbeat_interval{0};
        std::string device_name;
    };

    struct Stats {
        uint64_t scheduled = 0;
        uint64_t writes_ok = 0;
        uint64_t writes_failed = 0;
        uint64_t skipped_unavailable = 0;
        uint64_t heartbeats = 0;
    };

    UploadPipeline(TaskScheduler& scheduler, RecordStore& store, AccountMonitor& account,
                   Options options, const Logger& log);
    ~UploadPipeline();

    UploadPipeline(const UploadPipeline&) = delete;
    UploadPipeline& operator=(const UploadPipeline&) = delete;

    // Called once per local tick with every active session.
    void publish(const std::vector<LocalSession>& sessions);

    // Status of the newest write that completed successfully for this id.
    std::optional<SessionStatus> published_status(const SessionId& id) const;
    bool has_pending(const SessionId& id) const;
    size_t tracked() const { return slots_.size(); }
    const Stats& stats() const { return stats_; }

    // Fetch-then-save. NotFound (or an unknown record type on first run)
    // creates the record; a Conflict from a concurrent create retries once
    // as an update.
    static std::expected<Record, StoreError> upsert_session(RecordStore& store,
                                                            const SessionRecord& rec);

private:
    struct Slot {
        std::optional<TaskScheduler::TimerId> timer;
        SessionStatus desired = SessionStatus::Idle;
        std::string project;
        std::optional<int> pid;

        std::optional<SessionStatus> published;
        std::optional<Timestamp> last_write;
        uint64_t next_seq = 1;
        uint64_t completed_seq = 0;
        unsigned in_flight = 0;
    };

    // Completion state shared with detached writes; cleared on destruction so
    // late completions become no-ops.
    struct Liveness {
        bool alive = true;
    };

    void arm(const SessionId& id, Slot& slot, bool heartbeat);
    void fire(const SessionId& id);
    void complete(const SessionId& id, uint64_t seq, SessionStatus status, Timestamp at,
                  std::expected<Record, StoreError> result);

    TaskScheduler& scheduler_;
    RecordStore& store_;
    AccountMonitor& account_;
    Options options_;
    const Logger& log_;

    std::unordered_map<SessionId, Slot> slots_;
    std::shared_ptr<Liveness> liveness_ = std::make_shared<Liveness>();
    Stats stats_;
};
