#include "scheduler/timer_queue.hpp"

TimerQueue::TimerId TimerQueue::add(Clock::time_point deadline, Task task) {
    TimerId id = next_id_++;
    by_deadline_.emplace(Key{deadline, id}, std::move(task));
    deadlines_.emplace(id, deadline);
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) return false;

    by_deadline_.erase(Key{it->second, id});
    deadlines_.erase(it);
    return true;
}

std::optional<TimerQueue::Clock::time_point> TimerQueue::next_deadline() const {
    if (by_deadline_.empty()) return std::nullopt;
    return by_deadline_.begin()->first.first;
}

std::vector<TimerQueue::Task> TimerQueue::pop_due(Clock::time_point now) {
    std::vector<Task> due;
    while (!by_deadline_.empty()) {
        auto it = by_deadline_.begin();
        if (it->first.first > now) break;

        deadlines_.erase(it->first.second);
        due.push_back(std::move(it->second));
        by_deadline_.erase(it);
    }
    return due;
}
