#include "scheduler/worker_pool.hpp"

#include <print>

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; i++) {
        threads_.emplace_back([this](std::stop_token stop) { worker_main(stop); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard lock(mu_);
        if (!accepting_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mu_);
        accepting_ = false;
    }
    for (auto& t : threads_) {
        t.request_stop();
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::worker_main(std::stop_token stop) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mu_);
            cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            // Drain what is queued even after a stop request.
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::println(stderr, "worker: task threw: {}", e.what());
        }
    }
}
