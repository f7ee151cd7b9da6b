#pragma once

#include <optional>
#include <span>
#include <string_view>

enum class SessionStatus { Working, Idle, NeedsInput, NotRunning };

// Wire form, e.g. "needs_input".
std::string_view to_string(SessionStatus status);
std::optional<SessionStatus> parse_status(std::string_view text);

std::string_view display_name(SessionStatus status);

// Priority: NeedsInput > Working > Idle > NotRunning. Empty input is NotRunning.
SessionStatus aggregate_status(std::span<const SessionStatus> statuses);
