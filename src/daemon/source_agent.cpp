#include "source_agent.hpp"

#include <ranges>

SourceAgent::Options SourceAgent::Options::from_config(const Config& cfg,
                                                       std::string device_name) {
    return Options{
        .poll_interval = cfg.sync.poll_interval(),
        .debounce = cfg.sync.debounce(),
        .heartbeat_interval = cfg.sync.heartbeat_interval(),
        .session_ttl = cfg.sync.session_ttl(),
        .cleanup_every_ticks = cfg.sync.cleanup_every_ticks,
        .response_poll_interval = std::chrono::milliseconds(cfg.source.response_poll_interval_ms),
        .device_name = std::move(device_name),
    };
}

SourceAgent::SourceAgent(TaskScheduler& scheduler, RecordStore& store, Collaborators collab,
                         StatusFileLayout layout, Options options, const Logger& log)
    : scheduler_(scheduler), store_(store), detector_(collab.detector),
      options_(std::move(options)), log_(log),
      account_(store_, log_),
      pipeline_(scheduler_, store_, account_,
                UploadPipeline::Options{
                    .debounce = options_.debounce,
                    .heartbeat_interval = options_.heartbeat_interval,
                    .device_name = options_.device_name,
                },
                log_),
      fetcher_(store_, options_.session_ttl, [&scheduler] { return scheduler.now(); }),
      cleanup_(scheduler_, store_, fetcher_, options_.device_name, options_.cleanup_every_ticks,
               [this] { return local_ids(); }, log_),
      prompts_(store_),
      delivery_(collab.injector, collab.clipboard, collab.notifier, collab.detector,
                std::move(layout), log_),
      poller_(scheduler_, prompts_, delivery_, collab.history, options_.response_poll_interval,
              [this] {
                  auto ids = local_ | std::views::transform(&LocalSession::id);
                  return std::vector<SessionId>(ids.begin(), ids.end());
              },
              log_) {}

SourceAgent::~SourceAgent() {
    liveness_->alive = false;
    stop();
}

void SourceAgent::start() {
    scheduler_.run_detached([this] { account_.refresh(); });
    if (!timer_) timer_ = scheduler_.schedule_after(std::chrono::milliseconds(0), [this] {
        timer_.reset();
        tick();
        arm();
    });
    poller_.start();
    log_.info("source: polling every {}ms as '{}'", options_.poll_interval.count(),
              options_.device_name);
}

void SourceAgent::stop() {
    if (timer_) {
        scheduler_.cancel(*timer_);
        timer_.reset();
    }
    poller_.stop();
}

void SourceAgent::arm() {
    timer_ = scheduler_.schedule_after(options_.poll_interval, [this] {
        timer_.reset();
        tick();
        arm();
    });
}

void SourceAgent::tick() {
    ++ticks_;
    local_ = detector_.poll();

    std::unordered_map<SessionId, SessionStatus> current;
    for (const auto& s : local_) {
        current[s.id] = s.status;

        auto prev = previous_.find(s.id);
        bool was_waiting = prev != previous_.end() && prev->second == SessionStatus::NeedsInput;
        if (s.status == SessionStatus::NeedsInput) {
            if (!was_waiting) awaiting_prompt_.insert(s.id);
        } else {
            awaiting_prompt_.erase(s.id);
        }
    }
    std::erase_if(awaiting_prompt_, [&](const SessionId& id) { return !current.contains(id); });
    previous_ = std::move(current);

    for (const auto& s : local_) {
        if (awaiting_prompt_.contains(s.id)) on_needs_input(s);
    }

    pipeline_.publish(local_);
    cleanup_.on_tick();
}

void SourceAgent::on_needs_input(const LocalSession& session) {
    // The hook may write the prompt file after the status file; keep
    // looking on later ticks while the session still waits.
    auto file = detector_.read_prompt(session.id);
    if (!file) return;
    awaiting_prompt_.erase(session.id);

    auto at = file->timestamp.value_or(session.observed_at);
    PromptRecord prompt{
        .id = make_prompt_id(session.id, at),
        .session_id = session.id.str(),
        .project = file->project.empty() ? session.project : file->project,
        .prompt_message = file->prompt_message,
        .notification_type = file->notification_type,
        .transcript_path = file->transcript_path,
        .transcript_excerpt = file->transcript_excerpt,
        .timestamp = at,
        .pid = file->pid ? file->pid : session.pid,
    };

    scheduler_.run_detached([this, liveness = liveness_, session = session.id,
                             prompt = std::move(prompt)] {
        std::expected<PromptChannel::Published, StoreError> res =
            std::unexpected(StoreError{StoreErrorKind::Unavailable, "account unavailable"});
        if (account_.ensure()) {
            res = prompts_.publish(prompt);
            if (!res) account_.note_error(res.error());
        }

        scheduler_.post([this, liveness, session, id = prompt.id,
                         res = std::move(res)] {
            if (!liveness->alive) return;
            if (!res) {
                log_.warn("prompt: publishing {} failed: {}", id, describe(res.error()));
                // Try again on the next tick while the session still waits.
                auto it = previous_.find(session);
                if (it != previous_.end() && it->second == SessionStatus::NeedsInput) {
                    awaiting_prompt_.insert(session);
                }
                return;
            }
            if (*res == PromptChannel::Published::Created) {
                ++prompts_published_;
                log_.info("prompt: published {}", id);
            }
        });
    });
}

std::unordered_set<SessionId> SourceAgent::local_ids() const {
    std::unordered_set<SessionId> ids;
    for (const auto& s : local_) ids.insert(s.id);
    return ids;
}

nlohmann::json SourceAgent::status_json() const {
    std::vector<SessionStatus> statuses;
    for (const auto& s : local_) statuses.push_back(s.status);

    const auto& up = pipeline_.stats();
    const auto& cl = cleanup_.stats();
    const auto& rp = poller_.stats();

    return {
        {"device", options_.device_name},
        {"account", account_.available() ? "available" : "unavailable"},
        {"aggregate", std::string(to_string(aggregate_status(statuses)))},
        {"sessions", local_.size()},
        {"ticks", ticks_},
        {"injection", std::string(to_string(delivery_.capability()))},
        {"upload",
         {{"writes_ok", up.writes_ok},
          {"writes_failed", up.writes_failed},
          {"skipped_unavailable", up.skipped_unavailable},
          {"heartbeats", up.heartbeats}}},
        {"cleanup", {{"sweeps", cl.sweeps}, {"skipped", cl.skipped}, {"deleted", cl.deleted}}},
        {"prompts",
         {{"published", prompts_published_},
          {"delivered", rp.delivered},
          {"fallbacks", rp.fallbacks},
          {"duplicates", rp.duplicates}}},
    };
}
