#include "sync/upload_pipeline.hpp"

#include <unordered_set>

UploadPipeline::UploadPipeline(TaskScheduler& scheduler, RecordStore& store,
                               AccountMonitor& account, Options options, const Logger& log)
    : scheduler_(scheduler), store_(store), account_(account), options_(std::move(options)),
      log_(log) {}

UploadPipeline::~UploadPipeline() {
    liveness_->alive = false;
    for (auto& [id, slot] : slots_) {
        if (slot.timer) scheduler_.cancel(*slot.timer);
    }
}

void UploadPipeline::publish(const std::vector<LocalSession>& sessions) {
    auto now = scheduler_.now();
    std::unordered_set<SessionId> seen;

    for (const auto& s : sessions) {
        if (s.id.empty()) continue;
        seen.insert(s.id);

        auto [it, inserted] = slots_.try_emplace(s.id);
        auto& slot = it->second;
        slot.project = s.project;
        slot.pid = s.pid;

        if (inserted || s.status != slot.desired) {
            slot.desired = s.status;
            arm(s.id, slot, false);
            continue;
        }

        if (slot.timer || slot.in_flight > 0) continue;

        // Unchanged: a failed earlier write is retried here, and a stale
        // timestamp is refreshed.
        bool unpublished = slot.published != slot.desired;
        bool due = !slot.last_write || now - *slot.last_write >= options_.heartbeat_interval;
        if (unpublished || due) arm(s.id, slot, !unpublished);
    }

    for (auto it = slots_.begin(); it != slots_.end();) {
        if (seen.contains(it->first)) {
            ++it;
            continue;
        }
        if (it->second.timer) scheduler_.cancel(*it->second.timer);
        log_.debug("upload: {} left the local set", it->first.str());
        it = slots_.erase(it);
    }
}

void UploadPipeline::arm(const SessionId& id, Slot& slot, bool heartbeat) {
    if (slot.timer) scheduler_.cancel(*slot.timer);

    slot.timer = scheduler_.schedule_after(options_.debounce, [this, id] { fire(id); });
    ++stats_.scheduled;
    if (heartbeat) ++stats_.heartbeats;
}

void UploadPipeline::fire(const SessionId& id) {
    auto it = slots_.find(id);
    if (it == slots_.end()) return;
    auto& slot = it->second;
    slot.timer.reset();

    auto at = scheduler_.now();
    SessionRecord rec{
        .id = id.str(),
        .status = slot.desired,
        .project = slot.project,
        .timestamp = at,
        .pid = slot.pid,
        .source_device_name = options_.device_name,
    };
    uint64_t seq = slot.next_seq++;
    ++slot.in_flight;

    log_.debug("upload: writing {} = {}", rec.id, to_string(rec.status));

    scheduler_.run_detached([this, liveness = liveness_, id, seq, rec]() {
        std::expected<Record, StoreError> result =
            std::unexpected(StoreError{StoreErrorKind::Unavailable, "account unavailable"});
        if (account_.ensure()) {
            result = upsert_session(store_, rec);
            if (!result) account_.note_error(result.error());
        }

        scheduler_.post([this, liveness, id, seq, status = rec.status, at = rec.timestamp,
                         result = std::move(result)]() mutable {
            if (!liveness->alive) return;
            complete(id, seq, status, at, std::move(result));
        });
    });
}

void UploadPipeline::complete(const SessionId& id, uint64_t seq, SessionStatus status,
                              Timestamp at, std::expected<Record, StoreError> result) {
    if (!result) {
        if (result.error().kind == StoreErrorKind::Unavailable) {
            ++stats_.skipped_unavailable;
            log_.debug("upload: skipped {} ({})", id.str(), describe(result.error()));
        } else {
            ++stats_.writes_failed;
            log_.warn("upload: write of {} failed: {}", id.str(), describe(result.error()));
        }
    } else {
        ++stats_.writes_ok;
    }

    auto it = slots_.find(id);
    if (it == slots_.end()) return;
    auto& slot = it->second;
    if (slot.in_flight > 0) --slot.in_flight;

    // Writes for one id may finish out of order; only a newer one counts.
    if (result && seq > slot.completed_seq) {
        slot.completed_seq = seq;
        slot.published = status;
        slot.last_write = at;
    }
}

std::optional<SessionStatus> UploadPipeline::published_status(const SessionId& id) const {
    auto it = slots_.find(id);
    if (it == slots_.end()) return std::nullopt;
    return it->second.published;
}

bool UploadPipeline::has_pending(const SessionId& id) const {
    auto it = slots_.find(id);
    return it != slots_.end() && it->second.timer.has_value();
}

std::expected<Record, StoreError> UploadPipeline::upsert_session(RecordStore& store,
                                                                 const SessionRecord& rec) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto existing = store.fetch(record_type::SESSION, rec.id);
        if (existing) {
            apply_fields(rec, existing->fields);
            auto saved = store.save(*existing);
            // Deleted by a sweep between fetch and save: create it again.
            if (!saved && saved.error().kind == StoreErrorKind::NotFound) continue;
            return saved;
        }
        if (!existing.error().is_absent()) return std::unexpected(existing.error());

        auto created = store.save(Record{
            .type = record_type::SESSION,
            .id = rec.id,
            .fields = to_fields(rec),
            .change_tag = std::nullopt,
        });
        if (!created && created.error().kind == StoreErrorKind::Conflict) continue;
        return created;
    }
    return std::unexpected(
        StoreError{StoreErrorKind::Conflict, "session " + rec.id + " kept changing under us"});
}
