#include <catch2/catch_test_macros.hpp>

#include "model/session_id.hpp"
#include "model/session_status.hpp"

#include <unordered_set>
#include <vector>

TEST_CASE("SessionId", "[model]") {

    SECTION("StripsDirectoryPrefixAndSuffix") {
        auto id = SessionId::from_local("/tmp/session-relay-abc123.json", "session-relay-");
        REQUIRE(id.str() == "abc123");
    }

    SECTION("StripsFileNameWithoutDirectory") {
        auto id = SessionId::from_local("session-relay-abc123.json", "session-relay-");
        REQUIRE(id.str() == "abc123");
    }

    SECTION("CanonicalInputUnchanged") {
        auto id = SessionId::from_local("abc123", "session-relay-");
        REQUIRE(id.str() == "abc123");
    }

    SECTION("PublisherAndPollerAgree") {
        // The upload side sees file names, the poller sees store values.
        auto from_file = SessionId::from_local("/tmp/session-relay-7f3e.json", "session-relay-");
        auto from_store = SessionId::from_canonical("7f3e");
        REQUIRE(from_file == from_store);

        std::unordered_set<SessionId> ids{from_file};
        REQUIRE(ids.contains(from_store));
    }

    SECTION("OtherPrefixNotStripped") {
        auto id = SessionId::from_local("/tmp/other-abc.json", "session-relay-");
        REQUIRE(id.str() == "other-abc");
    }

    SECTION("DefaultIsEmpty") {
        SessionId id;
        REQUIRE(id.empty());
    }
}

TEST_CASE("SessionStatus", "[model]") {

    SECTION("WireNamesRoundTrip") {
        for (auto s : {SessionStatus::Working, SessionStatus::Idle, SessionStatus::NeedsInput,
                       SessionStatus::NotRunning}) {
            REQUIRE(parse_status(to_string(s)) == s);
        }
        REQUIRE(to_string(SessionStatus::NeedsInput) == "needs_input");
        REQUIRE_FALSE(parse_status("waiting").has_value());
    }

    SECTION("DisplayNames") {
        REQUIRE(display_name(SessionStatus::Idle) == "Ready");
        REQUIRE(display_name(SessionStatus::NeedsInput) == "Needs Input");
    }

    SECTION("AggregateEmptyIsNotRunning") {
        std::vector<SessionStatus> none;
        REQUIRE(aggregate_status(none) == SessionStatus::NotRunning);
    }

    SECTION("AggregateNeedsInputWins") {
        std::vector<SessionStatus> s{SessionStatus::Working, SessionStatus::NeedsInput,
                                     SessionStatus::Idle};
        REQUIRE(aggregate_status(s) == SessionStatus::NeedsInput);
    }

    SECTION("AggregateWorkingBeatsIdle") {
        std::vector<SessionStatus> s{SessionStatus::Idle, SessionStatus::Working};
        REQUIRE(aggregate_status(s) == SessionStatus::Working);
    }

    SECTION("AggregateIdleBeatsNotRunning") {
        std::vector<SessionStatus> s{SessionStatus::NotRunning, SessionStatus::Idle};
        REQUIRE(aggregate_status(s) == SessionStatus::Idle);
    }
}
