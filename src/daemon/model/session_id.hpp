#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

// Canonical session identifier. The status-file publisher and the response
// poller both key on this value, so the stripping rules live in one place.
class SessionId {
public:
    static constexpr std::string_view DEFAULT_SUFFIX = ".json";

    SessionId() = default;

    // "/tmp/session-relay-abc123.json" or "session-relay-abc123.json" -> "abc123".
    // Already canonical input is returned unchanged.
    static SessionId from_local(std::string_view local_id, std::string_view prefix,
                                std::string_view suffix = DEFAULT_SUFFIX);

    // Value read back from the record store; trusted to be canonical.
    static SessionId from_canonical(std::string value);

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }

    auto operator<=>(const SessionId&) const = default;

private:
    explicit SessionId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

template <>
struct std::hash<SessionId> {
    size_t operator()(const SessionId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};
