#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

// Deadline-ordered one-shot timers. Not thread-safe; owned by one actor.
// Timers with equal deadlines fire in insertion order.
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    TimerId add(Clock::time_point deadline, Task task);
    bool cancel(TimerId id);

    std::optional<Clock::time_point> next_deadline() const;

    // Removes and returns every task whose deadline is <= now, in firing order.
    std::vector<Task> pop_due(Clock::time_point now);

    size_t size() const { return by_deadline_.size(); }
    bool empty() const { return by_deadline_.empty(); }

private:
    using Key = std::pair<Clock::time_point, TimerId>;

    std::map<Key, Task> by_deadline_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_ = 1;
};
