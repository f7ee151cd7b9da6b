#include "request.hpp"

#include <charconv>
#include <format>
#include <vector>

namespace {

constexpr int kDefaultTimeoutMs = 30000;
// Respond and sweep wait on store round trips inside the daemon.
constexpr int kStoreTimeoutMs = 60000;
constexpr int kMaxHistoryLimit = 1000;

bool parse_limit(const std::string& s, int& out) {
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && end == s.data() + s.size() && out > 0 && out <= kMaxHistoryLimit;
}

} // namespace

std::expected<Request, std::string> build_request(std::span<const std::string> args) {
    if (args.empty()) return std::unexpected(std::string("missing command"));

    Request req{.command = args[0], .body = {}, .timeout_ms = kDefaultTimeoutMs, .raw = false};
    int limit = 10;
    std::string session_id;
    std::vector<std::string> positional;

    for (size_t i = 1; i < args.size(); i++) {
        const auto& arg = args[i];
        if (arg == "--json") {
            req.raw = true;
        } else if (arg == "--limit" || arg == "--session") {
            if (i + 1 >= args.size()) return std::unexpected(std::format("{} needs a value", arg));
            const auto& value = args[++i];
            if (arg == "--session") {
                session_id = value;
            } else if (!parse_limit(value, limit)) {
                return std::unexpected(
                    std::format("--limit must be between 1 and {}", kMaxHistoryLimit));
            }
        } else {
            positional.push_back(arg);
        }
    }

    const auto& cmd = req.command;
    if (cmd == "status" || cmd == "sessions" || cmd == "prompts") {
        req.body = {{"cmd", cmd}};
    } else if (cmd == "respond") {
        if (positional.size() < 2) {
            return std::unexpected(std::string("respond needs a prompt id and the answer text"));
        }
        std::string text = positional[1];
        for (size_t i = 2; i < positional.size(); i++) text += " " + positional[i];
        req.body = {{"cmd", "respond"}, {"prompt_id", positional[0]}, {"text", text}};
        req.timeout_ms = kStoreTimeoutMs;
    } else if (cmd == "sweep") {
        req.body = {{"cmd", "sweep"}};
        req.timeout_ms = kStoreTimeoutMs;
    } else if (cmd == "history") {
        req.body = {{"cmd", "history"}, {"limit", limit}};
        if (!session_id.empty()) req.body["session_id"] = session_id;
    } else {
        return std::unexpected(std::format("unknown command: {}", cmd));
    }
    return req;
}
