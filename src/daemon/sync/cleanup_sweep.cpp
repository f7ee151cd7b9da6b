#include "sync/cleanup_sweep.hpp"

#include "model/records.hpp"

CleanupSweep::CleanupSweep(TaskScheduler& scheduler, RecordStore& store,
                           const SessionFetcher& fetcher, std::string device_name,
                           uint32_t every_ticks, LocalIds local_ids, const Logger& log)
    : scheduler_(scheduler), store_(store), fetcher_(fetcher),
      device_name_(std::move(device_name)), every_ticks_(every_ticks == 0 ? 1 : every_ticks),
      local_ids_(std::move(local_ids)), log_(log) {}

CleanupSweep::~CleanupSweep() {
    liveness_->alive = false;
}

void CleanupSweep::on_tick() {
    if (++ticks_ < every_ticks_) return;
    ticks_ = 0;
    run_now();
}

bool CleanupSweep::run_now(Done done) {
    if (running_) {
        if (done) done(Outcome{.error = "a sweep is already running"});
        return false;
    }
    running_ = true;

    scheduler_.run_detached([this, liveness = liveness_, done = std::move(done)]() mutable {
        auto result = fetcher_.fetch_active();
        scheduler_.post([this, liveness, result = std::move(result), done = std::move(done)]() mutable {
            if (!liveness->alive) return;
            fetched(std::move(result), std::move(done));
        });
    });
    return true;
}

void CleanupSweep::fetched(std::expected<SessionFetcher::Result, StoreError> result, Done done) {
    if (!result) {
        ++stats_.skipped;
        log_.debug("cleanup: skipped, fetch failed: {}", describe(result.error()));
        finish(Outcome{.error = describe(result.error())}, done);
        return;
    }
    // An empty result cannot be told apart from a query that silently
    // returned nothing, so it never deletes anything.
    if (result->sessions.empty()) {
        ++stats_.skipped;
        finish(Outcome{}, done);
        return;
    }

    auto stale = compute_stale(result->sessions, local_ids_(), device_name_);
    ++stats_.sweeps;

    Outcome outcome{.ran = true, .remote = result->sessions.size(), .stale = stale.size()};
    if (stale.empty()) {
        finish(outcome, done);
        return;
    }

    scheduler_.run_detached([this, liveness = liveness_, stale = std::move(stale), outcome,
                             done = std::move(done)]() mutable {
        size_t failed = 0;
        for (const auto& id : stale) {
            auto res = store_.remove(record_type::SESSION, id);
            if (res || res.error().kind == StoreErrorKind::NotFound) {
                ++outcome.deleted;
                log_.info("cleanup: removed stale session {}", id);
            } else {
                ++failed;
                log_.warn("cleanup: removing {} failed: {}", id, describe(res.error()));
            }
        }

        scheduler_.post([this, liveness, outcome, failed, done = std::move(done)] {
            if (!liveness->alive) return;
            stats_.deleted += outcome.deleted;
            stats_.delete_failed += failed;
            finish(outcome, done);
        });
    });
}

void CleanupSweep::finish(const Outcome& outcome, const Done& done) {
    running_ = false;
    if (done) done(outcome);
}

std::vector<std::string> CleanupSweep::compute_stale(const std::vector<SessionRecord>& remote,
                                                     const std::unordered_set<SessionId>& local,
                                                     const std::string& device_name) {
    std::vector<std::string> stale;
    for (const auto& rec : remote) {
        if (rec.source_device_name != device_name) continue;
        if (local.contains(SessionId::from_canonical(rec.id))) continue;
        stale.push_back(rec.id);
    }
    return stale;
}
