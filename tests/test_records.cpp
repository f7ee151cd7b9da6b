#include <catch2/catch_test_macros.hpp>

#include "model/records.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Records", "[model]") {
    auto ts = from_epoch_ms(1'700'000'123'456);

    SECTION("SessionFieldsUseStoreNames") {
        SessionRecord rec{
            .id = "abc",
            .status = SessionStatus::NeedsInput,
            .project = "relay",
            .timestamp = ts,
            .pid = 812,
            .source_device_name = "laptop",
        };
        auto fields = to_fields(rec);
        REQUIRE(fields["sessionId"] == "abc");
        REQUIRE(fields["status"] == "needs_input");
        REQUIRE(fields["timestamp"] == 1'700'000'123'456);
        REQUIRE(fields["sourceDeviceName"] == "laptop");
        REQUIRE(fields["pid"] == 812);

        auto back = session_from_fields(fields);
        REQUIRE(back);
        REQUIRE(*back == rec);
    }

    SECTION("SessionWithoutPidOmitsField") {
        SessionRecord rec{.id = "abc", .project = "p", .timestamp = ts, .source_device_name = "d"};
        auto fields = to_fields(rec);
        REQUIRE_FALSE(fields.contains("pid"));
        REQUIRE_FALSE(session_from_fields(fields)->pid.has_value());
    }

    SECTION("ApplyFieldsKeepsForeignFields") {
        json fields = {{"sessionId", "abc"}, {"note", "kept"}, {"status", "idle"}};
        SessionRecord rec{.id = "abc", .status = SessionStatus::Working, .project = "p",
                          .timestamp = ts, .source_device_name = "d"};
        apply_fields(rec, fields);
        REQUIRE(fields["note"] == "kept");
        REQUIRE(fields["status"] == "working");
    }

    SECTION("SessionDecodeFailures") {
        REQUIRE_FALSE(session_from_fields(json::array()));
        REQUIRE_FALSE(session_from_fields({{"sessionId", "a"}}));

        json unknown_status = {{"sessionId", "a"}, {"status", "sleeping"}, {"project", "p"},
                               {"timestamp", 1}, {"sourceDeviceName", "d"}};
        REQUIRE_FALSE(session_from_fields(unknown_status));

        json string_timestamp = {{"sessionId", "a"}, {"status", "idle"}, {"project", "p"},
                                 {"timestamp", "yesterday"}, {"sourceDeviceName", "d"}};
        REQUIRE_FALSE(session_from_fields(string_timestamp));
    }

    SECTION("PromptRespondedStoredAsInteger") {
        PromptRecord rec;
        rec.id = "abc-1";
        rec.session_id = "abc";
        rec.project = "p";
        rec.prompt_message = "Allow edit?";
        rec.notification_type = "permission_prompt";
        rec.timestamp = ts;
        auto fields = to_fields(rec);
        REQUIRE(fields["responded"] == 0);
        REQUIRE_FALSE(fields.contains("responseText"));

        apply_response(fields, "yes", ts + std::chrono::seconds(5), "phone");
        REQUIRE(fields["responded"] == 1);
        REQUIRE(fields["respondedFromDevice"] == "phone");

        auto back = prompt_from_fields(fields);
        REQUIRE(back);
        REQUIRE(back->responded);
        REQUIRE(back->response_text == "yes");
        REQUIRE(back->responded_at == ts + std::chrono::seconds(5));
    }

    SECTION("PromptOptionalFields") {
        json fields = {{"promptId", "x"}, {"sessionId", "s"}, {"project", "p"},
                       {"promptMessage", "m"}, {"notificationType", "idle_prompt"},
                       {"timestamp", 5}, {"transcriptExcerpt", "last lines"}};
        auto rec = prompt_from_fields(fields);
        REQUIRE(rec);
        REQUIRE_FALSE(rec->responded);
        REQUIRE(rec->transcript_excerpt == "last lines");
        REQUIRE_FALSE(rec->transcript_path.has_value());
        REQUIRE_FALSE(rec->pid.has_value());
    }

    SECTION("PromptMissingMessageIsMalformed") {
        json fields = {{"promptId", "x"}, {"sessionId", "s"}, {"project", "p"},
                       {"notificationType", "idle_prompt"}, {"timestamp", 5}};
        REQUIRE_FALSE(prompt_from_fields(fields));
    }

    SECTION("Iso8601") {
        auto t = from_epoch_ms(1'700'000'000'000);
        REQUIRE(format_iso8601(t) == "2023-11-14T22:13:20Z");
        REQUIRE(parse_iso8601("2023-11-14T22:13:20Z") == t);
        REQUIRE(parse_iso8601("2023-11-14T22:13:20.250Z") == t + std::chrono::milliseconds(250));
        REQUIRE_FALSE(parse_iso8601("last tuesday").has_value());
    }

    SECTION("IpcJsonShape") {
        SessionRecord rec{.id = "abc", .status = SessionStatus::Idle, .project = "p",
                          .timestamp = from_epoch_ms(1'700'000'000'000),
                          .source_device_name = "desk"};
        auto j = to_json(rec);
        REQUIRE(j["status"] == "idle");
        REQUIRE(j["timestamp"] == "2023-11-14T22:13:20Z");
        REQUIRE(j["source_device"] == "desk");
    }
}
