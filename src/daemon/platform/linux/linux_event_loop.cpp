#include "platform/linux/linux_event_loop.hpp"

#include "inject/disabled_injector.hpp"
#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/tty_injector.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wtype_injector.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, std::string device_name, bool verbose)
    : config_(std::move(config)), device_name_(std::move(device_name)), log_(verbose),
      workers_(config_.sync.workers) {}

LinuxEventLoop::~LinuxEventLoop() {
    // In-flight store calls still reference the agents and the store.
    workers_.shutdown();

    core_.reset();
    remote_.reset();
    source_.reset();
    ipc_server_.stop();

    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (post_event_fd_ >= 0) ::close(post_event_fd_);
}

Timestamp LinuxEventLoop::now() const {
    return to_timestamp(std::chrono::system_clock::now());
}

TaskScheduler::TimerId LinuxEventLoop::schedule_after(std::chrono::milliseconds delay, Task task) {
    auto id = timers_.add(TimerQueue::Clock::now() + delay, std::move(task));
    rearm_timer();
    return id;
}

bool LinuxEventLoop::cancel(TimerId id) {
    bool removed = timers_.cancel(id);
    if (removed) rearm_timer();
    return removed;
}

void LinuxEventLoop::post(Task task) {
    {
        std::lock_guard lock(post_mu_);
        posted_.push_back(std::move(task));
    }
    uint64_t val = 1;
    if (::write(post_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        log_.error("eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::run_detached(Task task) {
    if (!workers_.submit(std::move(task))) {
        log_.debug("worker pool stopped, dropping detached task");
    }
}

std::unique_ptr<Injector> LinuxEventLoop::make_injector() const {
    const auto& method = config_.source.injection;
    if (method == "wtype") return std::make_unique<WtypeInjector>();
    if (method == "none") return std::make_unique<DisabledInjector>();
    return std::make_unique<TtyInjector>();
}

bool LinuxEventLoop::build_components() {
    auto bundle = make_store(config_.store);
    if (!bundle) {
        log_.error("store: {}", bundle.error());
        return false;
    }
    bundle_ = std::move(*bundle);
    log_.info("store: {} backend", config_.store.type);

    auto history_path = platform::data_dir() + "/history.db";
    history_ = std::make_unique<HistoryDb>();
    if (!history_->open(history_path)) {
        log_.warn("history: could not open {}, deliveries will not be recorded", history_path);
        history_.reset();
    }

    notifier_ = std::make_unique<DesktopNotifier>();

    if (config_.runs_source()) {
        StatusFileLayout layout(config_.source.status_dir, config_.source.file_prefix,
                                config_.source.fallback_dir);
        StatusFileDetector::Options det_opts{
            .local_timeout = std::chrono::seconds(config_.source.local_timeout_s),
            .pid_check_after = std::chrono::seconds(config_.source.pid_check_after_s),
        };
        detector_ = std::make_unique<StatusFileDetector>(layout, det_opts,
                                                         [this] { return now(); }, log_);
        injector_ = make_injector();
        clipboard_ = std::make_unique<WaylandClipboardOutput>();

        SourceAgent::Collaborators collab{
            .detector = *detector_,
            .injector = *injector_,
            .clipboard = *clipboard_,
            .notifier = *notifier_,
            .history = history_.get(),
        };
        source_ = std::make_unique<SourceAgent>(*this, *bundle_.store, collab, layout,
                                                SourceAgent::Options::from_config(config_, device_name_),
                                                log_);
        log_.info("source: watching {}/{}*.json as {}", config_.source.status_dir,
                  config_.source.file_prefix, device_name_);
    }

    if (config_.runs_remote()) {
        remote_ = std::make_unique<RemoteMonitor>(*this, *bundle_.store, bundle_.push.get(),
                                                  *notifier_,
                                                  RemoteMonitor::Options::from_config(config_, device_name_),
                                                  log_);
        log_.info("remote: monitoring as {}", device_name_);
    }

    core_ = std::make_unique<DaemonCore>(config_, log_, ipc_server_, source_.get(), remote_.get(),
                                         history_.get());
    return true;
}

bool LinuxEventLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        log_.error("epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        log_.error("signalfd failed: {}", std::strerror(errno));
        return false;
    }

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        log_.error("timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    post_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (post_event_fd_ < 0) {
        log_.error("eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log_.info("IPC listening on {}", ipc_path);

    if (!build_components()) return false;

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN) ||
        !add_fd(post_event_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN)) {
        log_.error("epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    core_->start();
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_.error("epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log_.info("received signal {}, shutting down", info.ssi_signo);
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) < 0 && errno != EAGAIN) {
                    log_.warn("timerfd read failed: {}", std::strerror(errno));
                }
                fire_timers();
                continue;
            }

            if (fd == post_event_fd_) {
                uint64_t val;
                if (::read(post_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    log_.warn("eventfd read failed: {}", std::strerror(errno));
                }
                drain_posted();
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        log_.warn("epoll_ctl client failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_->shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    post([] {});
}

void LinuxEventLoop::handle_client(int fd) {
    // A client may have pipelined several commands; serve every complete line.
    for (;;) {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case IpcServer::ReadResult::Partial:
                return;
            case IpcServer::ReadResult::Closed:
                drop_client(fd);
                return;
            case IpcServer::ReadResult::Invalid:
                ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid JSON"}});
                continue;
            case IpcServer::ReadResult::Command:
                break;
        }

        auto response = core_->dispatch(cmd, fd);
        if (!DaemonCore::is_pending(response)) {
            ipc_server_.send_response(fd, response);
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_->remove_waiting_client(fd);
}

void LinuxEventLoop::rearm_timer() {
    itimerspec arm{};
    if (auto deadline = timers_.next_deadline()) {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline->time_since_epoch());
        // An all-zero it_value disarms the timer; a deadline already passed must still fire.
        if (ns.count() <= 0) ns = std::chrono::nanoseconds(1);
        arm.it_value.tv_sec = static_cast<time_t>(ns.count() / 1'000'000'000);
        arm.it_value.tv_nsec = static_cast<long>(ns.count() % 1'000'000'000);
    }
    if (timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &arm, nullptr) < 0) {
        log_.error("timerfd_settime failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::fire_timers() {
    auto due = timers_.pop_due(TimerQueue::Clock::now());
    for (auto& task : due) task();
    rearm_timer();
}

void LinuxEventLoop::drain_posted() {
    std::vector<Task> batch;
    {
        std::lock_guard lock(post_mu_);
        batch.swap(posted_);
    }
    for (auto& task : batch) task();
}
