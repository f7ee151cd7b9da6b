#pragma once

#include "detector/session_detector.hpp"
#include "detector/status_files.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

// Reads the status files hooks drop into the status directory. Sessions
// whose file is older than the local timeout are expired and their file
// removed; once a file is older than pid_check_after, a dead pid expires it
// as well (the hook's parent may be a short-lived shell at first).
class StatusFileDetector : public SessionDetector {
public:
    using Clock = std::function<Timestamp()>;
    using ProcessAlive = std::function<bool(int pid)>;

    struct Options {
        std::chrono::seconds local_timeout{7200};
        std::chrono::seconds pid_check_after{60};
    };

    StatusFileDetector(StatusFileLayout layout, Options options, Clock clock,
                       const Logger& log, ProcessAlive alive = {});

    std::vector<LocalSession> poll() override;
    bool mark_working(const SessionId& id) override;

    std::optional<PromptFile> read_prompt(const SessionId& id) const override;
    bool remove_prompt(const SessionId& id) const override;

    // Files that failed to decode on the last poll.
    size_t decode_errors() const { return decode_errors_; }

    const StatusFileLayout& layout() const { return layout_; }

    static bool process_alive(int pid);

private:
    StatusFileLayout layout_;
    Options options_;
    Clock clock_;
    const Logger& log_;
    ProcessAlive alive_;
    size_t decode_errors_ = 0;
};
