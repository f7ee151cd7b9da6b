#include "platform/client_paths.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "request.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                          Show daemon status");
    std::println(stderr, "  sessions                        List sessions");
    std::println(stderr, "  prompts                         List prompts waiting for an answer");
    std::println(stderr, "  respond <prompt-id> <text...>   Answer a prompt");
    std::println(stderr, "  sweep                           Delete stale published sessions now");
    std::println(stderr, "  history [--limit N] [--session ID]");
    std::println(stderr, "                                  Show delivered answers");
    std::println(stderr, "Options:");
    std::println(stderr, "  --json                          Print the raw response");
}

static void print_sessions(const json& response) {
    auto& list = response["sessions"];
    if (list.empty()) {
        std::println("No sessions");
        return;
    }
    for (auto& s : list) {
        std::println("{:<14} {:<24} {}", s.value("status", ""), s.value("project", ""),
                     s.value("id", ""));
        std::string detail = s.value("timestamp", "");
        if (s.contains("source_device")) detail += "  on " + s.value("source_device", "");
        if (s.contains("published")) detail += "  published " + s.value("published", "");
        std::println("  {}", detail);
    }
}

static void print_prompts(const json& response) {
    auto& list = response["prompts"];
    if (list.empty()) {
        std::println("No pending prompts");
        return;
    }
    for (auto& p : list) {
        std::println("[{}] {} ({})", p.value("id", ""), p.value("project", ""),
                     p.value("notification_type", ""));
        std::println("  {}", p.value("message", ""));
        if (p.contains("transcript_excerpt") && p["transcript_excerpt"].is_string()) {
            std::println("  > {}", p["transcript_excerpt"].get<std::string>());
        }
    }
}

static void print_status(const json& response) {
    std::println("Role: {}", response.value("role", "unknown"));
    if (response.contains("source")) {
        auto& s = response["source"];
        std::println("Source ({}): account {}, {} session(s), aggregate {}",
                     s.value("device", ""), s.value("account", ""),
                     s.value("sessions", 0), s.value("aggregate", ""));
        std::println("  injection: {}", s.value("injection", ""));
    }
    if (response.contains("remote")) {
        auto& r = response["remote"];
        std::println("Remote ({}): account {}, {} session(s), {} pending prompt(s)",
                     r.value("device", ""), r.value("account", ""), r.value("sessions", 0),
                     r.value("pending_prompts", 0));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    auto req = build_request(args);
    if (!req) {
        std::println(stderr, "{}", req.error());
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::default_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is session-relay running?");
        return 1;
    }

    if (req->raw) {
        if (!client.send(req->body)) {
            std::println(stderr, "Failed to send command");
            return 1;
        }
        auto response = client.recv(req->timeout_ms);
        if (!response) {
            std::println(stderr, "Error: {}", to_string(response.error()));
            return 1;
        }
        std::println("{}", response->dump(2));
        return response->value("status", "") == "ok" ? 0 : 1;
    }

    auto result = client.call(req->body, req->timeout_ms);
    if (!result) {
        std::println(stderr, "Error: {}", result.error());
        return 1;
    }
    const json& response = *result;
    const auto& command = req->command;

    if (command == "status") {
        print_status(response);
    } else if (command == "sessions") {
        print_sessions(response);
    } else if (command == "prompts") {
        print_prompts(response);
    } else if (command == "respond") {
        std::println("Answered {}", response["prompt"].value("id", ""));
    } else if (command == "sweep") {
        if (!response.value("ran", false)) {
            std::println("Sweep skipped");
        } else {
            std::println("Removed {} of {} stale session(s)", response.value("deleted", 0),
                         response.value("stale", 0));
        }
    } else if (command == "history") {
        for (auto& entry : response["entries"]) {
            std::println("[{}] {} ({}, from {})", entry.value("timestamp", ""),
                         entry.value("project", ""), entry.value("path", ""),
                         entry.value("from", ""));
            std::println("  {}", entry.value("text", ""));
        }
    }

    return 0;
}
