#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "model/records.hpp"
#include "output/output.hpp"
#include "prompt/prompt_channel.hpp"
#include "scheduler/task_scheduler.hpp"
#include "store/record_store.hpp"
#include "sync/account_monitor.hpp"
#include "sync/session_fetcher.hpp"
#include "sync/subscription_bridge.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Remote role: keeps a view of every source's active sessions and pending
// prompts, refreshed by push notifications and by a fixed-interval fetch,
// and submits answers to prompts.
class RemoteMonitor {
public:
    struct Options {
        std::chrono::milliseconds refresh_interval{5000};
        std::chrono::seconds session_ttl{1800};
        uint32_t malformed_report_threshold = 5;
        std::string device_name;
        bool notify_changes = true;

        static Options from_config(const Config& cfg, std::string device_name);
    };

    struct Stats {
        uint64_t refreshes = 0;
        uint64_t refresh_errors = 0;
        uint64_t notifications = 0;
        uint64_t targeted_fetches = 0;
        uint64_t responses_submitted = 0;
        uint64_t malformed = 0;
        uint64_t alerts = 0;
    };

    using ResponseDone = std::function<void(std::expected<PromptRecord, StoreError>)>;

    RemoteMonitor(TaskScheduler& scheduler, RecordStore& store, PushChannel* push,
                  Notifier& notifier, Options options, const Logger& log);
    ~RemoteMonitor();

    RemoteMonitor(const RemoteMonitor&) = delete;
    RemoteMonitor& operator=(const RemoteMonitor&) = delete;

    void start();
    void stop();

    // Called when a user looks at the view: retries deferred subscriptions.
    void activate();

    // Full re-read of sessions and pending prompts, on a worker.
    void refresh();

    // Actor thread.
    void on_notification(const ChangeNotification& note);

    void submit_response(const std::string& prompt_id, const std::string& text,
                         ResponseDone done);

    // Newest first.
    const std::vector<SessionRecord>& sessions() const { return sessions_; }
    const std::vector<PromptRecord>& pending_prompts() const { return prompts_; }

    const Stats& stats() const { return stats_; }
    SubscriptionBridge& bridge() { return bridge_; }
    AccountMonitor& account() { return account_; }

    nlohmann::json status_json() const;

private:
    struct Liveness {
        bool alive = true;
    };

    struct Snapshot {
        std::expected<SessionFetcher::Result, StoreError> sessions;
        std::expected<PromptChannel::Batch, StoreError> prompts;
    };

    void arm();
    void apply_snapshot(Snapshot snap);
    void note_malformed(size_t count);
    // Notifies once per session status change into NeedsInput or Idle and
    // once per new prompt.
    void announce_changes(bool sessions_loaded, bool prompts_loaded);
    void alert(const std::string& title, const std::string& body);
    void upsert_session(SessionRecord rec);
    void drop_session(const std::string& id);
    void upsert_prompt(PromptRecord rec);
    void drop_prompt(const std::string& id);

    TaskScheduler& scheduler_;
    RecordStore& store_;
    PushChannel* push_;
    Notifier& notifier_;
    Options options_;
    const Logger& log_;

    AccountMonitor account_;
    SessionFetcher fetcher_;
    SubscriptionBridge bridge_;
    PromptChannel channel_;

    std::optional<TaskScheduler::TimerId> timer_;
    bool refreshing_ = false;
    bool refresh_again_ = false;
    bool activating_ = false;
    bool push_started_ = false;

    std::vector<SessionRecord> sessions_;
    std::vector<PromptRecord> prompts_;

    // Last status seen per session and prompts already shown. The first
    // successful load only seeds them, so startup does not replay the view.
    std::unordered_map<std::string, SessionStatus> announced_status_;
    std::unordered_set<std::string> announced_prompts_;
    bool sessions_seeded_ = false;
    bool prompts_seeded_ = false;

    uint32_t malformed_streak_ = 0;
    bool malformed_reported_ = false;

    std::shared_ptr<Liveness> liveness_ = std::make_shared<Liveness>();
    Stats stats_;
};
