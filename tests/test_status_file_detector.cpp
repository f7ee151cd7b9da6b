#include <catch2/catch_test_macros.hpp>

#include "detector/status_file_detector.hpp"
#include "detector/status_files.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <unistd.h>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("sr_test_status_" + std::to_string(getpid()));
        fs::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream f(path / name);
        f << content;
    }
};

} // namespace

TEST_CASE("Status file parsing", "[detector]") {

    SECTION("IsoTimestamp") {
        auto s = parse_status_file(
            R"({"state":"needs_input","project":"api","timestamp":"2023-11-14T22:13:20Z","pid":99})");
        REQUIRE(s);
        REQUIRE(s->state == SessionStatus::NeedsInput);
        REQUIRE(s->project == "api");
        REQUIRE(s->timestamp == from_epoch_ms(1'700'000'000'000));
        REQUIRE(s->pid == 99);
    }

    SECTION("EpochSecondsAndDefaults") {
        auto s = parse_status_file(R"({"state":"idle","timestamp":1700000000,"pid":0})");
        REQUIRE(s);
        REQUIRE(s->project == "Unknown");
        REQUIRE(s->timestamp == from_epoch_ms(1'700'000'000'000));
        REQUIRE_FALSE(s->pid);
    }

    SECTION("Rejects") {
        REQUIRE_FALSE(parse_status_file("{}"));
        REQUIRE_FALSE(parse_status_file(R"({"state":"sleeping"})"));
        REQUIRE_FALSE(parse_status_file("[1]"));
        REQUIRE_FALSE(parse_status_file("{oops"));
    }

    SECTION("StatusFileRoundTrip") {
        StatusFile in{.state = SessionStatus::Working, .project = "web",
                      .timestamp = from_epoch_ms(1'700'000'000'000), .pid = 12};
        auto out = parse_status_file(format_status_file(in));
        REQUIRE(out);
        REQUIRE(out->state == in.state);
        REQUIRE(out->project == in.project);
        REQUIRE(out->timestamp == in.timestamp);
        REQUIRE(out->pid == in.pid);
    }

    SECTION("PromptFile") {
        auto p = parse_prompt_file(
            R"({"session_id":"abc","prompt_message":"Allow edit?","transcript_excerpt":"",)"
            R"("notification_type":"permission_prompt","timestamp":"2023-11-14T22:13:20Z"})");
        REQUIRE(p);
        REQUIRE(p->session_id == "abc");
        REQUIRE(p->project == "Unknown");
        REQUIRE(p->prompt_message == "Allow edit?");
        REQUIRE(p->notification_type == "permission_prompt");
        REQUIRE_FALSE(p->transcript_excerpt);

        REQUIRE_FALSE(parse_prompt_file(R"({"prompt_message":"x"})"));
    }
}

TEST_CASE("StatusFileLayout", "[detector]") {
    StatusFileLayout layout("/tmp", "session-relay-", "/var/tmp");
    auto id = SessionId::from_canonical("abc");

    REQUIRE(layout.status_path(id) == "/tmp/session-relay-abc.json");
    REQUIRE(layout.prompt_path(id) == "/tmp/session-relay-prompt-abc.json");
    REQUIRE(layout.response_path(id) == "/var/tmp/session-relay-response-abc.txt");

    REQUIRE(layout.is_status_file("session-relay-abc.json"));
    REQUIRE_FALSE(layout.is_status_file("session-relay-prompt-abc.json"));
    REQUIRE_FALSE(layout.is_status_file("session-relay-response-abc.json"));
    REQUIRE_FALSE(layout.is_status_file("session-relay-.json"));
    REQUIRE_FALSE(layout.is_status_file("session-relay-abc.txt"));
    REQUIRE_FALSE(layout.is_status_file("other-abc.json"));
}

TEST_CASE("StatusFileDetector", "[detector]") {
    TmpDir tmp;
    Logger log;
    StatusFileLayout layout(tmp.path.string(), "session-relay-", tmp.path.string());

    Timestamp now = from_epoch_ms(1'700'000'000'000);
    std::set<int> alive_pids = {100};
    StatusFileDetector detector(
        layout, {.local_timeout = 3600s, .pid_check_after = 60s}, [&] { return now; }, log,
        [&](int pid) { return alive_pids.contains(pid); });

    auto status_json = [&](const char* state, Timestamp at, int pid) {
        return format_status_file(
            StatusFile{.state = *parse_status(state), .project = "proj", .timestamp = at, .pid = pid});
    };

    SECTION("ListsSessionsSortedById") {
        tmp.write("session-relay-b.json", status_json("working", now, 100));
        tmp.write("session-relay-a.json", status_json("needs_input", now, 100));
        tmp.write("session-relay-prompt-a.json", R"({"session_id":"a"})");
        tmp.write("unrelated.json", "{}");

        auto sessions = detector.poll();
        REQUIRE(sessions.size() == 2);
        REQUIRE(sessions[0].id.str() == "a");
        REQUIRE(sessions[0].status == SessionStatus::NeedsInput);
        REQUIRE(sessions[0].pid == 100);
        REQUIRE(sessions[1].id.str() == "b");
        REQUIRE(detector.decode_errors() == 0);
    }

    SECTION("EmptyFilesAreSkippedSilently") {
        tmp.write("session-relay-a.json", "");
        REQUIRE(detector.poll().empty());
        REQUIRE(detector.decode_errors() == 0);
        REQUIRE(fs::exists(tmp.path / "session-relay-a.json"));
    }

    SECTION("UndecodableFilesAreCounted") {
        tmp.write("session-relay-a.json", "{not json");
        REQUIRE(detector.poll().empty());
        REQUIRE(detector.decode_errors() == 1);
    }

    SECTION("ExpiredFilesAreRemoved") {
        tmp.write("session-relay-old.json", status_json("idle", now - 3600s, 100));
        tmp.write("session-relay-new.json", status_json("idle", now - 3599s, 100));

        auto sessions = detector.poll();
        REQUIRE(sessions.size() == 1);
        REQUIRE(sessions[0].id.str() == "new");
        REQUIRE_FALSE(fs::exists(tmp.path / "session-relay-old.json"));
    }

    SECTION("DeadPidExpiresOnlyAfterGracePeriod") {
        tmp.write("session-relay-young.json", status_json("working", now - 30s, 555));
        tmp.write("session-relay-dead.json", status_json("working", now - 61s, 555));
        tmp.write("session-relay-live.json", status_json("working", now - 61s, 100));

        auto sessions = detector.poll();
        REQUIRE(sessions.size() == 2);
        REQUIRE(sessions[0].id.str() == "live");
        REQUIRE(sessions[1].id.str() == "young");
        REQUIRE_FALSE(fs::exists(tmp.path / "session-relay-dead.json"));
    }

    SECTION("MarkWorkingRewritesTheFile") {
        tmp.write("session-relay-a.json", status_json("needs_input", now - 10s, 100));
        now += 5s;
        REQUIRE(detector.mark_working(SessionId::from_canonical("a")));

        auto sessions = detector.poll();
        REQUIRE(sessions.size() == 1);
        REQUIRE(sessions[0].status == SessionStatus::Working);
        REQUIRE(sessions[0].project == "proj");
        REQUIRE(sessions[0].observed_at == now);
    }

    SECTION("MarkWorkingLeavesEndedSessionsAlone") {
        REQUIRE_FALSE(detector.mark_working(SessionId::from_canonical("gone")));
        REQUIRE(detector.poll().empty());

        tmp.write("session-relay-junk.json", "not json");
        REQUIRE_FALSE(detector.mark_working(SessionId::from_canonical("junk")));
        REQUIRE(*read_text_file(layout.status_path(SessionId::from_canonical("junk"))) == "not json");
    }

    SECTION("PromptFiles") {
        auto id = SessionId::from_canonical("a");
        REQUIRE_FALSE(detector.read_prompt(id));

        tmp.write("session-relay-prompt-a.json",
                  R"({"session_id":"a","project":"proj","prompt_message":"Continue?"})");
        auto prompt = detector.read_prompt(id);
        REQUIRE(prompt);
        REQUIRE(prompt->prompt_message == "Continue?");
        REQUIRE(prompt->notification_type == "idle_prompt");

        REQUIRE(detector.remove_prompt(id));
        REQUIRE_FALSE(detector.remove_prompt(id));
        REQUIRE_FALSE(detector.read_prompt(id));
    }

    SECTION("MissingDirectoryYieldsNothing") {
        StatusFileLayout gone((tmp.path / "missing").string(), "session-relay-", tmp.path.string());
        StatusFileDetector d(gone, {}, [&] { return now; }, log);
        REQUIRE(d.poll().empty());
        REQUIRE(d.decode_errors() == 1);
    }
}
