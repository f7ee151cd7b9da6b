#include "detector/status_file_detector.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <signal.h>

namespace fs = std::filesystem;

StatusFileDetector::StatusFileDetector(StatusFileLayout layout, Options options, Clock clock,
                                       const Logger& log, ProcessAlive alive)
    : layout_(std::move(layout)), options_(options), clock_(std::move(clock)), log_(log),
      alive_(alive ? std::move(alive) : ProcessAlive(&StatusFileDetector::process_alive)) {}

bool StatusFileDetector::process_alive(int pid) {
    if (pid <= 0) return false;
    // EPERM: the process exists but belongs to someone else.
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

std::vector<LocalSession> StatusFileDetector::poll() {
    std::vector<LocalSession> sessions;
    size_t errors = 0;
    auto now = clock_();

    std::error_code ec;
    std::error_code rm_ec;
    for (auto& entry : fs::directory_iterator(layout_.status_dir(), ec)) {
        auto name = entry.path().filename().string();
        if (!layout_.is_status_file(name)) continue;

        auto content = read_text_file(entry.path().string());
        if (!content) {
            ++errors;
            continue;
        }
        // Hooks truncate before writing; an empty file is mid-write.
        if (content->empty()) continue;

        auto status = parse_status_file(*content);
        if (!status) {
            ++errors;
            log_.debug("detector: {}: {}", name, status.error());
            continue;
        }

        auto observed = status->timestamp.value_or(now);
        auto age = now - observed;

        if (age >= options_.local_timeout) {
            log_.debug("detector: {} timed out", name);
            fs::remove(entry.path(), rm_ec);
            continue;
        }
        if (age > options_.pid_check_after && status->pid && !alive_(*status->pid)) {
            log_.debug("detector: {} process {} is gone", name, *status->pid);
            fs::remove(entry.path(), rm_ec);
            continue;
        }

        sessions.push_back(LocalSession{
            .id = SessionId::from_local(name, layout_.prefix()),
            .status = status->state,
            .project = std::move(status->project),
            .pid = status->pid,
            .observed_at = observed,
        });
    }
    if (ec) {
        log_.warn("detector: cannot read {}: {}", layout_.status_dir(), ec.message());
        ++errors;
    }

    // Directory order is arbitrary; keep ticks comparable.
    std::ranges::sort(sessions, {}, [](const LocalSession& s) { return s.id.str(); });
    decode_errors_ = errors;
    return sessions;
}

bool StatusFileDetector::mark_working(const SessionId& id) {
    auto path = layout_.status_path(id);

    // Never create a status file: the session may have ended meanwhile.
    auto content = read_text_file(path);
    if (!content) return false;
    auto parsed = parse_status_file(*content);
    if (!parsed) {
        log_.warn("detector: status file of {} is unreadable: {}", id.str(), parsed.error());
        return false;
    }

    StatusFile status = std::move(*parsed);
    status.state = SessionStatus::Working;
    status.timestamp = clock_();

    auto res = write_file_atomic(path, format_status_file(status));
    if (!res) {
        log_.warn("detector: cannot mark {} working: {}", id.str(), res.error());
        return false;
    }
    return true;
}

std::optional<PromptFile> StatusFileDetector::read_prompt(const SessionId& id) const {
    auto content = read_text_file(layout_.prompt_path(id));
    if (!content) return std::nullopt;

    auto prompt = parse_prompt_file(*content);
    if (!prompt) {
        log_.warn("detector: prompt file of {} is unreadable: {}", id.str(), prompt.error());
        return std::nullopt;
    }
    return *prompt;
}

bool StatusFileDetector::remove_prompt(const SessionId& id) const {
    std::error_code ec;
    return fs::remove(layout_.prompt_path(id), ec);
}
