#include <catch2/catch_test_macros.hpp>

#include "request.hpp"

#include <string>
#include <vector>

namespace {

auto build(std::vector<std::string> args) {
    return build_request(args);
}

} // namespace

TEST_CASE("Control requests", "[client]") {
    SECTION("PlainCommands") {
        auto req = build({"sessions", "--json"});
        REQUIRE(req.has_value());
        REQUIRE(req->body == nlohmann::json{{"cmd", "sessions"}});
        REQUIRE(req->raw);
        REQUIRE(req->timeout_ms == 30000);
    }

    SECTION("RespondJoinsTheAnswer") {
        auto req = build({"respond", "s1-3", "yes,", "go", "ahead"});
        REQUIRE(req.has_value());
        REQUIRE(req->body["prompt_id"] == "s1-3");
        REQUIRE(req->body["text"] == "yes, go ahead");
        REQUIRE(req->timeout_ms == 60000);

        auto missing = build({"respond", "s1-3"});
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error() == "respond needs a prompt id and the answer text");
    }

    SECTION("HistoryOptions") {
        auto req = build({"history", "--limit", "25", "--session", "abc"});
        REQUIRE(req.has_value());
        REQUIRE(req->body["limit"] == 25);
        REQUIRE(req->body["session_id"] == "abc");

        auto defaults = build({"history"});
        REQUIRE(defaults.has_value());
        REQUIRE(defaults->body["limit"] == 10);
        REQUIRE_FALSE(defaults->body.contains("session_id"));
    }

    SECTION("BadLimitsAreRejected") {
        for (const char* bad : {"0", "-4", "ten", "12x", "1001"}) {
            auto req = build({"history", "--limit", bad});
            REQUIRE_FALSE(req.has_value());
            REQUIRE(req.error() == "--limit must be between 1 and 1000");
        }
        REQUIRE(build({"history", "--limit"}).error() == "--limit needs a value");
    }

    SECTION("UnknownCommand") {
        auto req = build({"restart"});
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error() == "unknown command: restart");
        REQUIRE_FALSE(build({}).has_value());
    }
}
