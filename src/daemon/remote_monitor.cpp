#include "remote_monitor.hpp"

#include <algorithm>
#include <format>

RemoteMonitor::Options RemoteMonitor::Options::from_config(const Config& cfg,
                                                           std::string device_name) {
    return Options{
        .refresh_interval = std::chrono::milliseconds(cfg.remote.refresh_interval_ms),
        .session_ttl = cfg.sync.session_ttl(),
        .malformed_report_threshold = cfg.sync.malformed_report_threshold,
        .device_name = std::move(device_name),
        .notify_changes = cfg.remote.notify,
    };
}

RemoteMonitor::RemoteMonitor(TaskScheduler& scheduler, RecordStore& store, PushChannel* push,
                             Notifier& notifier, Options options, const Logger& log)
    : scheduler_(scheduler), store_(store), push_(push), notifier_(notifier),
      options_(std::move(options)), log_(log),
      account_(store_, log_),
      fetcher_(store_, options_.session_ttl, [&scheduler] { return scheduler.now(); }),
      bridge_(store_, log_),
      channel_(store_) {}

RemoteMonitor::~RemoteMonitor() {
    liveness_->alive = false;
    stop();
}

void RemoteMonitor::start() {
    if (push_ && !push_started_) {
        push_started_ = push_->start([this, liveness = liveness_](const ChangeNotification& note) {
            // Channel thread: hop onto the actor.
            scheduler_.post([this, liveness, note] {
                if (!liveness->alive) return;
                on_notification(note);
            });
        });
        if (!push_started_) log_.warn("remote: push channel did not start, polling only");
    }

    activate();
    refresh();
    if (!timer_) arm();
    log_.info("remote: refreshing every {}ms", options_.refresh_interval.count());
}

void RemoteMonitor::stop() {
    if (timer_) {
        scheduler_.cancel(*timer_);
        timer_.reset();
    }
    if (push_ && push_started_) {
        push_->stop();
        push_started_ = false;
    }
}

void RemoteMonitor::arm() {
    timer_ = scheduler_.schedule_after(options_.refresh_interval, [this] {
        timer_.reset();
        refresh();
        arm();
    });
}

void RemoteMonitor::activate() {
    if (activating_ || !bridge_.has_deferred()) return;
    activating_ = true;

    scheduler_.run_detached([this, liveness = liveness_] {
        if (account_.ensure()) bridge_.ensure_subscriptions();
        scheduler_.post([this, liveness] {
            if (!liveness->alive) return;
            activating_ = false;
        });
    });
}

void RemoteMonitor::refresh() {
    if (refreshing_) {
        refresh_again_ = true;
        return;
    }
    refreshing_ = true;
    ++stats_.refreshes;

    scheduler_.run_detached([this, liveness = liveness_] {
        Snapshot snap{
            .sessions = std::unexpected(StoreError{StoreErrorKind::Unavailable, "account unavailable"}),
            .prompts = std::unexpected(StoreError{StoreErrorKind::Unavailable, "account unavailable"}),
        };
        if (account_.ensure()) {
            snap.sessions = fetcher_.fetch_active();
            if (!snap.sessions) account_.note_error(snap.sessions.error());
            snap.prompts = channel_.fetch_pending();
        }

        scheduler_.post([this, liveness, snap = std::move(snap)]() mutable {
            if (!liveness->alive) return;
            apply_snapshot(std::move(snap));
        });
    });
}

void RemoteMonitor::apply_snapshot(Snapshot snap) {
    refreshing_ = false;

    size_t malformed = 0;
    if (snap.sessions) {
        sessions_ = std::move(snap.sessions->sessions);
        malformed += snap.sessions->malformed;
    } else {
        // Keep the previous view; an error is not an empty store.
        ++stats_.refresh_errors;
        log_.debug("remote: session fetch failed: {}", describe(snap.sessions.error()));
    }

    if (snap.prompts) {
        prompts_ = std::move(snap.prompts->prompts);
        malformed += snap.prompts->malformed;
    } else {
        log_.debug("remote: prompt fetch failed: {}", describe(snap.prompts.error()));
    }

    if (snap.sessions) note_malformed(malformed);
    // A store that has never seen a session holds none.
    bool sessions_loaded =
        snap.sessions || snap.sessions.error().kind == StoreErrorKind::UnknownType;
    announce_changes(sessions_loaded, snap.prompts.has_value());

    if (refresh_again_) {
        refresh_again_ = false;
        refresh();
    }
}

void RemoteMonitor::note_malformed(size_t count) {
    stats_.malformed += count;
    if (count == 0) {
        malformed_streak_ = 0;
        malformed_reported_ = false;
        return;
    }

    log_.debug("remote: skipped {} malformed records", count);
    if (++malformed_streak_ < options_.malformed_report_threshold || malformed_reported_) return;

    malformed_reported_ = true;
    log_.error("remote: {} fetches in a row returned records that do not decode",
               malformed_streak_);
    auto res = notifier_.notify("session-relay",
                                "Some session records in the shared store cannot be read. "
                                "Check that every device runs the same version.");
    if (!res) log_.warn("remote: notification failed: {}", res.error());
}

void RemoteMonitor::announce_changes(bool sessions_loaded, bool prompts_loaded) {
    if (sessions_seeded_) {
        for (const auto& s : sessions_) {
            auto it = announced_status_.find(s.id);
            if (it != announced_status_.end() && it->second == s.status) continue;
            announced_status_[s.id] = s.status;

            if (s.status == SessionStatus::NeedsInput) {
                alert("Input needed", std::format("{} needs your response to continue", s.project));
            } else if (s.status == SessionStatus::Idle) {
                alert("Ready", std::format("{} has finished and is ready", s.project));
            }
        }
        std::erase_if(announced_status_, [&](const auto& entry) {
            return std::ranges::find(sessions_, entry.first, &SessionRecord::id) == sessions_.end();
        });
    } else if (sessions_loaded) {
        for (const auto& s : sessions_) announced_status_[s.id] = s.status;
        sessions_seeded_ = true;
    }

    if (prompts_seeded_) {
        for (const auto& p : prompts_) {
            if (!announced_prompts_.insert(p.id).second) continue;
            alert("Input needed", std::format("{}: {}", p.project, p.prompt_message.substr(0, 100)));
        }
        std::erase_if(announced_prompts_, [&](const std::string& id) {
            return std::ranges::find(prompts_, id, &PromptRecord::id) == prompts_.end();
        });
    } else if (prompts_loaded) {
        for (const auto& p : prompts_) announced_prompts_.insert(p.id);
        prompts_seeded_ = true;
    }
}

void RemoteMonitor::alert(const std::string& title, const std::string& body) {
    if (!options_.notify_changes) return;
    ++stats_.alerts;
    auto res = notifier_.notify(title, body);
    if (!res) log_.warn("remote: notification failed: {}", res.error());
}

void RemoteMonitor::on_notification(const ChangeNotification& note) {
    ++stats_.notifications;
    auto plan = SubscriptionBridge::plan(note);

    switch (plan.kind) {
        case SubscriptionBridge::RefreshKind::Ignore:
            return;
        case SubscriptionBridge::RefreshKind::FullRefresh:
            refresh();
            return;
        case SubscriptionBridge::RefreshKind::DropSession:
            drop_session(plan.record_id);
            return;
        case SubscriptionBridge::RefreshKind::DropPrompt:
            drop_prompt(plan.record_id);
            return;
        case SubscriptionBridge::RefreshKind::FetchSession:
            ++stats_.targeted_fetches;
            scheduler_.run_detached([this, liveness = liveness_, id = plan.record_id] {
                auto res = fetcher_.fetch_one(id);
                scheduler_.post([this, liveness, id, res = std::move(res)]() mutable {
                    if (!liveness->alive) return;
                    if (res) {
                        upsert_session(std::move(*res));
                    } else if (res.error().kind == StoreErrorKind::NotFound) {
                        drop_session(id);
                    } else {
                        if (res.error().kind == StoreErrorKind::Malformed) note_malformed(1);
                        log_.debug("remote: fetch of session {} failed: {}", id, describe(res.error()));
                    }
                });
            });
            return;
        case SubscriptionBridge::RefreshKind::FetchPrompt:
            ++stats_.targeted_fetches;
            scheduler_.run_detached([this, liveness = liveness_, id = plan.record_id] {
                auto res = channel_.fetch(id);
                scheduler_.post([this, liveness, id, res = std::move(res)]() mutable {
                    if (!liveness->alive) return;
                    if (res) {
                        upsert_prompt(std::move(*res));
                    } else if (res.error().is_absent()) {
                        drop_prompt(id);
                    } else {
                        log_.debug("remote: fetch of prompt {} failed: {}", id, describe(res.error()));
                    }
                });
            });
            return;
    }
}

void RemoteMonitor::upsert_session(SessionRecord rec) {
    auto it = std::ranges::find(sessions_, rec.id, &SessionRecord::id);
    if (it != sessions_.end()) {
        // A late targeted read must not roll the view back.
        if (it->timestamp > rec.timestamp) return;
        *it = std::move(rec);
    } else {
        sessions_.push_back(std::move(rec));
    }
    std::ranges::stable_sort(sessions_, std::ranges::greater{}, &SessionRecord::timestamp);
    announce_changes(false, false);
}

void RemoteMonitor::drop_session(const std::string& id) {
    std::erase_if(sessions_, [&](const SessionRecord& s) { return s.id == id; });
}

void RemoteMonitor::upsert_prompt(PromptRecord rec) {
    if (rec.responded) {
        drop_prompt(rec.id);
        return;
    }
    auto it = std::ranges::find(prompts_, rec.id, &PromptRecord::id);
    if (it != prompts_.end()) {
        *it = std::move(rec);
    } else {
        prompts_.push_back(std::move(rec));
    }
    std::ranges::stable_sort(prompts_, std::ranges::greater{}, &PromptRecord::timestamp);
    announce_changes(false, false);
}

void RemoteMonitor::drop_prompt(const std::string& id) {
    std::erase_if(prompts_, [&](const PromptRecord& p) { return p.id == id; });
}

void RemoteMonitor::submit_response(const std::string& prompt_id, const std::string& text,
                                    ResponseDone done) {
    scheduler_.run_detached([this, liveness = liveness_, prompt_id, text,
                             done = std::move(done)]() mutable {
        std::expected<PromptRecord, StoreError> res =
            std::unexpected(StoreError{StoreErrorKind::Unavailable, "account unavailable"});
        if (account_.ensure()) {
            res = channel_.submit_response(prompt_id, text, options_.device_name, scheduler_.now());
            if (!res) account_.note_error(res.error());
        }

        scheduler_.post([this, liveness, res = std::move(res), done = std::move(done)]() mutable {
            if (!liveness->alive) return;
            if (res) {
                ++stats_.responses_submitted;
                log_.info("remote: answered prompt {}", res->id);
                drop_prompt(res->id);
            } else {
                log_.warn("remote: answering failed: {}", describe(res.error()));
            }
            if (done) done(std::move(res));
        });
    });
}

nlohmann::json RemoteMonitor::status_json() const {
    nlohmann::json subs = nlohmann::json::object();
    for (const auto& [id, reg] : bridge_.registrations()) {
        subs[id] = std::string(to_string(reg));
    }

    return {
        {"device", options_.device_name},
        {"account", account_.available() ? "available" : "unavailable"},
        {"sessions", sessions_.size()},
        {"pending_prompts", prompts_.size()},
        {"subscriptions", subs},
        {"push", push_started_},
        {"refreshes", stats_.refreshes},
        {"refresh_errors", stats_.refresh_errors},
        {"notifications", stats_.notifications},
        {"malformed", stats_.malformed},
    };
}
