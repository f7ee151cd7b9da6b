#pragma once

#include "config.hpp"
#include "detector/session_detector.hpp"
#include "inject/injector.hpp"
#include "logger.hpp"
#include "output/output.hpp"
#include "prompt/prompt_channel.hpp"
#include "prompt/response_delivery.hpp"
#include "prompt/response_poller.hpp"
#include "scheduler/task_scheduler.hpp"
#include "storage/history_db.hpp"
#include "store/record_store.hpp"
#include "sync/account_monitor.hpp"
#include "sync/cleanup_sweep.hpp"
#include "sync/session_fetcher.hpp"
#include "sync/upload_pipeline.hpp"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Source role: polls the local detector, publishes session state, publishes
// prompts when a session starts waiting for input, and routes answers back.
class SourceAgent {
public:
    struct Options {
        std::chrono::milliseconds poll_interval{1000};
        std::chrono::milliseconds debounce{500};
        std::chrono::milliseconds heartbeat_interval{0};
        std::chrono::seconds session_ttl{1800};
        uint32_t cleanup_every_ticks = 10;
        std::chrono::milliseconds response_poll_interval{2000};
        std::string device_name;

        static Options from_config(const Config& cfg, std::string device_name);
    };

    struct Collaborators {
        SessionDetector& detector;
        Injector& injector;
        ClipboardSink& clipboard;
        Notifier& notifier;
        HistoryDb* history = nullptr;
    };

    SourceAgent(TaskScheduler& scheduler, RecordStore& store, Collaborators collab,
                StatusFileLayout layout, Options options, const Logger& log);
    ~SourceAgent();

    SourceAgent(const SourceAgent&) = delete;
    SourceAgent& operator=(const SourceAgent&) = delete;

    void start();
    void stop();

    // One detector tick. Called by the poll timer; exposed for tests.
    void tick();

    const std::vector<LocalSession>& local_sessions() const { return local_; }
    std::unordered_set<SessionId> local_ids() const;

    CleanupSweep& cleanup() { return cleanup_; }
    ResponsePoller& poller() { return poller_; }
    UploadPipeline& pipeline() { return pipeline_; }
    const ResponseDelivery& delivery() const { return delivery_; }
    AccountMonitor& account() { return account_; }

    nlohmann::json status_json() const;

private:
    struct Liveness {
        bool alive = true;
    };

    void arm();
    void on_needs_input(const LocalSession& session);

    TaskScheduler& scheduler_;
    RecordStore& store_;
    SessionDetector& detector_;
    Options options_;
    const Logger& log_;

    AccountMonitor account_;
    UploadPipeline pipeline_;
    SessionFetcher fetcher_;
    CleanupSweep cleanup_;
    PromptChannel prompts_;
    ResponseDelivery delivery_;
    ResponsePoller poller_;

    std::optional<TaskScheduler::TimerId> timer_;
    std::vector<LocalSession> local_;
    std::unordered_map<SessionId, SessionStatus> previous_;

    // NeedsInput sessions whose prompt has not been published yet.
    std::unordered_set<SessionId> awaiting_prompt_;
    uint64_t ticks_ = 0;
    uint64_t prompts_published_ = 0;

    std::shared_ptr<Liveness> liveness_ = std::make_shared<Liveness>();
};
