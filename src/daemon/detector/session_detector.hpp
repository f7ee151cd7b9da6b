#pragma once

#include "detector/status_files.hpp"
#include "model/records.hpp"
#include "model/session_id.hpp"
#include "model/session_status.hpp"

#include <optional>
#include <string>
#include <vector>

// One locally running session as seen on the latest detector tick.
struct LocalSession {
    SessionId id;
    SessionStatus status = SessionStatus::Idle;
    std::string project;
    std::optional<int> pid;
    Timestamp observed_at{};
};

// Source of local session state. poll() runs once per tick on the source
// actor and returns only sessions the detector still considers active.
class SessionDetector {
public:
    virtual ~SessionDetector() = default;
    virtual std::vector<LocalSession> poll() = 0;

    // Marks a session as working again after its prompt was answered.
    virtual bool mark_working(const SessionId& id) = 0;

    // The question a NeedsInput session is blocked on, if the hook wrote one.
    virtual std::optional<PromptFile> read_prompt(const SessionId& id) const = 0;
    virtual bool remove_prompt(const SessionId& id) const = 0;
};
