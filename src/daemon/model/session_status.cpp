#include "model/session_status.hpp"

std::string_view to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Working: return "working";
        case SessionStatus::Idle: return "idle";
        case SessionStatus::NeedsInput: return "needs_input";
        case SessionStatus::NotRunning: return "not_running";
    }
    return "not_running";
}

std::optional<SessionStatus> parse_status(std::string_view text) {
    if (text == "working") return SessionStatus::Working;
    if (text == "idle") return SessionStatus::Idle;
    if (text == "needs_input") return SessionStatus::NeedsInput;
    if (text == "not_running") return SessionStatus::NotRunning;
    return std::nullopt;
}

std::string_view display_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Working: return "Working";
        case SessionStatus::Idle: return "Ready";
        case SessionStatus::NeedsInput: return "Needs Input";
        case SessionStatus::NotRunning: return "Not Running";
    }
    return "Not Running";
}

SessionStatus aggregate_status(std::span<const SessionStatus> statuses) {
    bool has_working = false;
    bool has_idle = false;

    for (auto s : statuses) {
        switch (s) {
            case SessionStatus::NeedsInput:
                return SessionStatus::NeedsInput;
            case SessionStatus::Working:
                has_working = true;
                break;
            case SessionStatus::Idle:
                has_idle = true;
                break;
            case SessionStatus::NotRunning:
                break;
        }
    }

    if (has_working) return SessionStatus::Working;
    if (has_idle) return SessionStatus::Idle;
    return SessionStatus::NotRunning;
}
