#include "prompt/response_poller.hpp"

ResponsePoller::ResponsePoller(TaskScheduler& scheduler, PromptChannel& channel,
                               ResponseDelivery& delivery, HistoryDb* history,
                               std::chrono::milliseconds interval, ActiveIds active_ids,
                               const Logger& log)
    : scheduler_(scheduler), channel_(channel), delivery_(delivery), history_(history),
      interval_(interval), active_ids_(std::move(active_ids)), log_(log) {}

ResponsePoller::~ResponsePoller() {
    liveness_->alive = false;
    stop();
}

void ResponsePoller::start() {
    if (timer_) return;
    arm();
}

void ResponsePoller::stop() {
    if (timer_) {
        scheduler_.cancel(*timer_);
        timer_.reset();
    }
}

void ResponsePoller::arm() {
    timer_ = scheduler_.schedule_after(interval_, [this] {
        timer_.reset();
        poll_now();
        arm();
    });
}

bool ResponsePoller::poll_now() {
    if (polling_) return false;

    auto ids = active_ids_();
    if (ids.empty()) return false;

    polling_ = true;
    ++stats_.cycles;

    scheduler_.run_detached([this, liveness = liveness_, ids = std::move(ids)] {
        CycleResult result;
        for (const auto& id : ids) {
            auto batch = channel_.fetch_responses(id);
            if (!batch) {
                ++result.errors;
                log_.debug("prompt: response query for {} failed: {}", id.str(),
                           describe(batch.error()));
                continue;
            }
            result.malformed += batch->malformed;
            for (auto& p : batch->prompts) result.answered.push_back(std::move(p));
        }

        scheduler_.post([this, liveness, result = std::move(result)]() mutable {
            if (!liveness->alive) return;
            handle(std::move(result));
        });
    });
    return true;
}

void ResponsePoller::handle(CycleResult result) {
    polling_ = false;
    stats_.errors += result.errors;
    stats_.malformed += result.malformed;

    auto now = scheduler_.now();
    for (const auto& prompt : result.answered) {
        // The query already filters; a record edited in between may not be.
        if (!prompt.responded || !prompt.response_text) continue;

        auto [it, inserted] = processed_.try_emplace(prompt.id, now);
        if (!inserted) {
            it->second = now;
            ++stats_.duplicates;
            // Still in the store: the earlier delete failed or has not landed.
            scheduler_.run_detached([this, id = prompt.id] {
                auto res = channel_.remove(id);
                if (!res) log_.debug("prompt: retrying delete of {}: {}", id, describe(res.error()));
            });
            continue;
        }

        auto outcome = delivery_.deliver(prompt);
        if (!outcome.reached_user()) {
            // Leave the answer in the store for the next cycle.
            processed_.erase(prompt.id);
            ++stats_.undelivered;
            continue;
        }
        ++stats_.delivered;
        if (outcome.path == ResponseDelivery::Path::Fallback) ++stats_.fallbacks;

        if (history_) {
            bool recorded = history_->insert(DeliveryEntry{
                .prompt_id = prompt.id,
                .session_id = prompt.session_id,
                .project = prompt.project,
                .response_text = *prompt.response_text,
                .responded_from = prompt.responded_from_device.value_or(""),
                .path = std::string(to_string(outcome.path)),
            });
            if (!recorded) log_.warn("prompt: could not record delivery of {}", prompt.id);
        }

        scheduler_.run_detached([this, id = prompt.id] {
            auto res = channel_.remove(id);
            if (!res) log_.warn("prompt: deleting {} failed: {}", id, describe(res.error()));
        });
    }

    prune();
}

void ResponsePoller::prune() {
    auto cutoff = scheduler_.now() - PROCESSED_TTL;
    std::erase_if(processed_, [&](const auto& entry) { return entry.second < cutoff; });
}
