#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

// Fixed set of threads running remote store calls off the event loop.
// shutdown() lets queued and in-flight tasks finish before joining.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown() has been called.
    bool submit(Task task);
    void shutdown();

    size_t thread_count() const { return threads_.size(); }

private:
    void worker_main(std::stop_token stop);

    std::mutex mu_;
    std::condition_variable_any cv_;
    std::deque<Task> queue_;
    bool accepting_ = true;
    std::vector<std::jthread> threads_;
};
