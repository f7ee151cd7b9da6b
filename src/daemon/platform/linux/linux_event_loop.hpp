#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "detector/status_file_detector.hpp"
#include "inject/injector.hpp"
#include "logger.hpp"
#include "output/output.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "remote_monitor.hpp"
#include "scheduler/task_scheduler.hpp"
#include "scheduler/timer_queue.hpp"
#include "scheduler/worker_pool.hpp"
#include "source_agent.hpp"
#include "storage/history_db.hpp"
#include "store/store_factory.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// epoll loop that is the actor thread for both roles. Timers sit in a
// TimerQueue behind one timerfd, posted tasks are signalled through an
// eventfd, and store calls run on a WorkerPool.
class LinuxEventLoop : public TaskScheduler {
public:
    LinuxEventLoop(Config config, std::string device_name, bool verbose = false);
    ~LinuxEventLoop() override;

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    Timestamp now() const override;
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;
    void post(Task task) override;
    void run_detached(Task task) override;

private:
    bool build_components();
    std::unique_ptr<Injector> make_injector() const;

    void rearm_timer();
    void fire_timers();
    void drain_posted();
    void handle_client(int fd);
    void drop_client(int fd);

    Config config_;
    std::string device_name_;
    Logger log_;

    TimerQueue timers_;
    std::mutex post_mu_;
    std::vector<Task> posted_;
    WorkerPool workers_;

    // Destroyed in reverse: agents before the store they call.
    StoreBundle bundle_;
    std::unique_ptr<HistoryDb> history_;
    std::unique_ptr<Injector> injector_;
    std::unique_ptr<ClipboardSink> clipboard_;
    std::unique_ptr<Notifier> notifier_;
    std::unique_ptr<StatusFileDetector> detector_;
    std::unique_ptr<SourceAgent> source_;
    std::unique_ptr<RemoteMonitor> remote_;
    UnixSocketServer ipc_server_;
    std::unique_ptr<DaemonCore> core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int post_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
