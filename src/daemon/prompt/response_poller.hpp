#pragma once

#include "logger.hpp"
#include "model/session_id.hpp"
#include "prompt/prompt_channel.hpp"
#include "prompt/response_delivery.hpp"
#include "scheduler/task_scheduler.hpp"
#include "storage/history_db.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Source-side poller for answered prompts. Each cycle queries every locally
// active session on a worker, then delivers newly seen answers on the actor.
// Prompt ids are remembered before delivery, so an answer that is still in
// the store on the next cycle (or arrives twice) is never delivered again.
// An answer that reached neither the session nor a fallback stays in the
// store and is retried.
class ResponsePoller {
public:
    using ActiveIds = std::function<std::vector<SessionId>()>;

    struct Stats {
        uint64_t cycles = 0;
        uint64_t delivered = 0;
        uint64_t fallbacks = 0;
        uint64_t duplicates = 0;
        uint64_t undelivered = 0;
        uint64_t errors = 0;
        uint64_t malformed = 0;
    };

    static constexpr auto PROCESSED_TTL = std::chrono::hours(1);

    ResponsePoller(TaskScheduler& scheduler, PromptChannel& channel, ResponseDelivery& delivery,
                   HistoryDb* history, std::chrono::milliseconds interval, ActiveIds active_ids,
                   const Logger& log);
    ~ResponsePoller();

    ResponsePoller(const ResponsePoller&) = delete;
    ResponsePoller& operator=(const ResponsePoller&) = delete;

    void start();
    void stop();

    // Runs one cycle unless one is in progress.
    bool poll_now();

    bool processed(const std::string& prompt_id) const { return processed_.contains(prompt_id); }
    size_t processed_count() const { return processed_.size(); }
    const Stats& stats() const { return stats_; }

private:
    struct Liveness {
        bool alive = true;
    };

    struct CycleResult {
        std::vector<PromptRecord> answered;
        size_t malformed = 0;
        size_t errors = 0;
    };

    void arm();
    void handle(CycleResult result);
    void prune();

    TaskScheduler& scheduler_;
    PromptChannel& channel_;
    ResponseDelivery& delivery_;
    HistoryDb* history_;
    std::chrono::milliseconds interval_;
    ActiveIds active_ids_;
    const Logger& log_;

    std::optional<TaskScheduler::TimerId> timer_;
    bool polling_ = false;

    // prompt id -> last time it was seen answered in the store
    std::unordered_map<std::string, Timestamp> processed_;

    std::shared_ptr<Liveness> liveness_ = std::make_shared<Liveness>();
    Stats stats_;
};
