#include <catch2/catch_test_macros.hpp>

#include "model/records.hpp"
#include "store/http_protocol.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace http_protocol;

TEST_CASE("HTTP store protocol", "[store][http]") {

    SECTION("PathsAreEncoded") {
        REQUIRE(record_path("Session", "abc-1") == "/v1/records/Session/abc-1");
        REQUIRE(record_path("Session", "a/b c") == "/v1/records/Session/a%2Fb%20c");
        REQUIRE(subscription_path("session-changes") == "/v1/subscriptions/session-changes");
        REQUIRE(changes_path(-1, 25) == "/v1/changes?since=-1&wait=25");
    }

    SECTION("InsertOmitsChangeTag") {
        Record rec{.type = "Session", .id = "a", .fields = {{"status", "idle"}}};
        auto j = encode_record(rec);
        REQUIRE_FALSE(j.contains("changeTag"));
        REQUIRE(j["fields"]["status"] == "idle");

        rec.change_tag = 7;
        REQUIRE(encode_record(rec)["changeTag"] == 7);
    }

    SECTION("DecodeRecord") {
        auto rec = decode_record(R"({"id":"a","changeTag":3,"fields":{"status":"working"}})",
                                 "Session");
        REQUIRE(rec);
        REQUIRE(rec->type == "Session");
        REQUIRE(rec->change_tag == 3u);
        REQUIRE(rec->fields["status"] == "working");

        auto bad = decode_record(R"({"id":"a","fields":"oops"})", "Session");
        REQUIRE_FALSE(bad);
        REQUIRE(bad.error().kind == StoreErrorKind::Malformed);

        REQUIRE(decode_record("<html>", "Session").error().kind == StoreErrorKind::Malformed);
    }

    SECTION("EncodeQuery") {
        Query q{
            .type = "Prompt",
            .predicates = {{"sessionId", PredicateOp::Equal, "s1"},
                           {"timestamp", PredicateOp::GreaterOrEqual, 100}},
            .sort_field = "timestamp",
            .descending = true,
            .limit = 50,
        };
        auto j = encode_query(q, std::string("100"));
        REQUIRE(j["type"] == "Prompt");
        REQUIRE(j["filters"].size() == 2);
        REQUIRE(j["filters"][0]["op"] == "eq");
        REQUIRE(j["filters"][1]["op"] == "gte");
        REQUIRE(j["filters"][1]["value"] == 100);
        REQUIRE(j["sort"]["field"] == "timestamp");
        REQUIRE(j["sort"]["descending"] == true);
        REQUIRE(j["limit"] == 50);
        REQUIRE(j["cursor"] == "100");

        q.sort_field.clear();
        auto plain = encode_query(q, std::nullopt);
        REQUIRE_FALSE(plain.contains("sort"));
        REQUIRE_FALSE(plain.contains("cursor"));
    }

    SECTION("DecodeQueryPageKeepsBadRecordsAsNull") {
        auto page = decode_query_page(
            R"({"records":[{"id":"a","changeTag":1,"fields":{"sessionId":"a"}},
                           {"id":"b","fields":[1,2]}],
                "cursor":"2"})",
            "Session");
        REQUIRE(page);
        REQUIRE(page->records.size() == 2);
        REQUIRE(page->records[0].fields["sessionId"] == "a");
        REQUIRE(page->records[1].id == "b");
        REQUIRE(page->records[1].fields.is_null());
        REQUIRE(page->cursor == "2");
    }

    SECTION("EmptyCursorMeansLastPage") {
        auto page = decode_query_page(R"({"records":[],"cursor":""})", "Session");
        REQUIRE(page);
        REQUIRE_FALSE(page->cursor.has_value());
    }

    SECTION("SubscriptionsRoundTrip") {
        Subscription sub{.id = "prompt-changes", .record_type = "Prompt",
                         .fires_on_delete = false, .silent = true};
        json body = {{"subscriptions", json::array({encode_subscription(sub), json("junk")})}};
        auto subs = decode_subscriptions(body.dump());
        REQUIRE(subs);
        REQUIRE(subs->size() == 1);
        REQUIRE((*subs)[0].id == "prompt-changes");
        REQUIRE((*subs)[0].fires_on_create);
        REQUIRE_FALSE((*subs)[0].fires_on_delete);
    }

    SECTION("DecodeChangesSkipsUnknownReasons") {
        auto batch = decode_changes(R"({"changes":[
            {"subscriptionId":"session-changes","recordType":"Session","recordId":"a","reason":"deleted"},
            {"subscriptionId":"session-changes","recordType":"Session","recordId":"b","reason":"renamed"}
        ],"next":42})");
        REQUIRE(batch);
        REQUIRE(batch->next == 42);
        REQUIRE(batch->changes.size() == 1);
        REQUIRE(batch->changes[0].record_id == "a");
        REQUIRE(batch->changes[0].reason == ChangeReason::Deleted);
    }

    SECTION("StatusMapping") {
        REQUIRE(error_from_status(401, "").kind == StoreErrorKind::Unavailable);
        REQUIRE(error_from_status(503, "down").kind == StoreErrorKind::Unavailable);
        REQUIRE(error_from_status(404, R"({"error":"not_found"})").kind == StoreErrorKind::NotFound);
        REQUIRE(error_from_status(404, R"({"error":"unknown_type"})").kind ==
                StoreErrorKind::UnknownType);
        REQUIRE(error_from_status(409, "").kind == StoreErrorKind::Conflict);
        REQUIRE(error_from_status(400, R"({"error":"not_queryable","message":"status"})").kind ==
                StoreErrorKind::NotQueryable);
        REQUIRE(error_from_status(422, "{}").kind == StoreErrorKind::Malformed);
        REQUIRE(error_from_status(500, "boom").kind == StoreErrorKind::Transport);
    }

    SECTION("ErrorMessageCarriesStatus") {
        auto err = error_from_status(409, R"({"error":"conflict","message":"exists"})");
        REQUIRE(err.message == "HTTP 409: exists");
    }
}
