#pragma once

#include "model/records.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

// Execution context of one actor (the source agent or the remote monitor).
//
// schedule_after(), cancel() and tasks handed to post() all run on the actor
// thread, so protocol state needs no locking. run_detached() hands work to a
// background worker; that work is never cancelled and reports back through
// post(). Workers are joined before the actors are destroyed, so only a
// posted completion can outlive its owner.
class TaskScheduler {
public:
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    virtual ~TaskScheduler() = default;

    // Wall-clock time used for record timestamps. Safe from any thread.
    virtual Timestamp now() const = 0;

    virtual TimerId schedule_after(std::chrono::milliseconds delay, Task task) = 0;

    // Returns false if the timer already fired or was never scheduled.
    virtual bool cancel(TimerId id) = 0;

    // Thread-safe: queue a task onto the actor thread.
    virtual void post(Task task) = 0;

    // Thread-safe: run a task on a worker thread.
    virtual void run_detached(Task task) = 0;
};
