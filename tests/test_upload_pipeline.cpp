#include <catch2/catch_test_macros.hpp>

#include "model/records.hpp"
#include "store/memory_store.hpp"
#include "sync/account_monitor.hpp"
#include "sync/upload_pipeline.hpp"

#include "support/manual_scheduler.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

LocalSession local(const std::string& id, SessionStatus status) {
    return LocalSession{
        .id = SessionId::from_canonical(id),
        .status = status,
        .project = "proj-" + id,
        .pid = 4242,
        .observed_at = {},
    };
}

std::string stored_status(MemoryRecordStore& store, const std::string& id) {
    auto rec = store.fetch(record_type::SESSION, id);
    if (!rec) return "<missing>";
    return rec->fields[field::STATUS].get<std::string>();
}

// Wraps a store and hides the next fetch, as if another writer created the
// record between our fetch and our insert.
class RacingStore : public RecordStore {
public:
    explicit RacingStore(MemoryRecordStore& inner) : inner_(inner) {}

    std::expected<void, StoreError> check_account() override { return inner_.check_account(); }
    std::expected<Record, StoreError> fetch(const std::string& type,
                                            const std::string& id) override {
        ++fetches;
        if (hide_next_fetch) {
            hide_next_fetch = false;
            return std::unexpected(StoreError{StoreErrorKind::NotFound, id});
        }
        return inner_.fetch(type, id);
    }
    std::expected<Record, StoreError> save(const Record& record) override {
        if (delete_before_save && record.change_tag) {
            delete_before_save = false;
            (void)inner_.remove(record.type, record.id);
        }
        return inner_.save(record);
    }
    std::expected<void, StoreError> remove(const std::string& type,
                                           const std::string& id) override {
        return inner_.remove(type, id);
    }
    std::expected<QueryPage, StoreError> query(const Query& q,
                                               const std::optional<std::string>& cursor) override {
        return inner_.query(q, cursor);
    }
    std::expected<std::vector<Subscription>, StoreError> subscriptions() override {
        return inner_.subscriptions();
    }
    std::expected<void, StoreError> save_subscription(const Subscription& sub) override {
        return inner_.save_subscription(sub);
    }
    std::expected<void, StoreError> remove_subscription(const std::string& id) override {
        return inner_.remove_subscription(id);
    }

    bool hide_next_fetch = false;
    bool delete_before_save = false;
    int fetches = 0;

private:
    MemoryRecordStore& inner_;
};

} // namespace

TEST_CASE("UploadPipeline", "[sync][upload]") {
    ManualScheduler sched;
    MemoryRecordStore store;
    Logger log;
    AccountMonitor account(store, log);

    UploadPipeline::Options opts{
        .debounce = 500ms,
        .heartbeat_interval = 60s,
        .device_name = "laptop",
    };
    UploadPipeline pipeline(sched, store, account, opts, log);

    SECTION("FirstSightIsWrittenAfterDebounce") {
        pipeline.publish({local("a", SessionStatus::Working)});
        REQUIRE(pipeline.has_pending(SessionId::from_canonical("a")));

        sched.advance(499ms);
        REQUIRE(store.count(record_type::SESSION) == 0);

        sched.advance(1ms);
        REQUIRE(stored_status(store, "a") == "working");
        REQUIRE(pipeline.published_status(SessionId::from_canonical("a")) ==
                SessionStatus::Working);

        auto rec = store.fetch(record_type::SESSION, "a");
        REQUIRE(rec->fields[field::SOURCE_DEVICE] == "laptop");
        REQUIRE(rec->fields[field::PROJECT] == "proj-a");
        REQUIRE(rec->fields[field::PID] == 4242);
        REQUIRE(rec->fields[field::TIMESTAMP] == to_epoch_ms(sched.now()));
    }

    SECTION("RapidChangesCoalesceIntoOneWrite") {
        pipeline.publish({local("a", SessionStatus::Working)});
        sched.advance(200ms);
        pipeline.publish({local("a", SessionStatus::NeedsInput)});
        sched.advance(200ms);
        pipeline.publish({local("a", SessionStatus::Idle)});

        // The last change re-armed the timer, so nothing has fired yet.
        sched.advance(499ms);
        REQUIRE(store.count(record_type::SESSION) == 0);

        sched.advance(1ms);
        REQUIRE(stored_status(store, "a") == "idle");
        REQUIRE(store.stats().inserts == 1);
        REQUIRE(store.stats().updates == 0);
        REQUIRE(pipeline.stats().writes_ok == 1);
    }

    SECTION("UnchangedSessionWaitsForHeartbeat") {
        pipeline.publish({local("a", SessionStatus::Idle)});
        sched.advance(500ms);
        REQUIRE(pipeline.stats().writes_ok == 1);

        sched.advance(10s);
        pipeline.publish({local("a", SessionStatus::Idle)});
        REQUIRE_FALSE(pipeline.has_pending(SessionId::from_canonical("a")));

        sched.advance(50s);
        pipeline.publish({local("a", SessionStatus::Idle)});
        REQUIRE(pipeline.has_pending(SessionId::from_canonical("a")));
        sched.advance(500ms);

        REQUIRE(pipeline.stats().writes_ok == 2);
        REQUIRE(pipeline.stats().heartbeats == 1);
        REQUIRE(store.fetch(record_type::SESSION, "a")->fields[field::TIMESTAMP] ==
                to_epoch_ms(sched.now()));
    }

    SECTION("UnavailableAccountSkipsAndRetries") {
        store.set_available(false);
        pipeline.publish({local("a", SessionStatus::Working)});
        sched.advance(500ms);

        REQUIRE(pipeline.stats().skipped_unavailable == 1);
        REQUIRE(pipeline.stats().writes_failed == 0);
        REQUIRE_FALSE(pipeline.published_status(SessionId::from_canonical("a")));
        REQUIRE_FALSE(account.available());

        store.set_available(true);
        pipeline.publish({local("a", SessionStatus::Working)});
        sched.advance(500ms);

        REQUIRE(stored_status(store, "a") == "working");
        REQUIRE(pipeline.published_status(SessionId::from_canonical("a")) ==
                SessionStatus::Working);
        REQUIRE(account.available());
    }

    SECTION("StaleCompletionDoesNotRollBackPublishedStatus") {
        sched.hold_detached(true);

        pipeline.publish({local("a", SessionStatus::Working)});
        sched.advance(500ms);
        pipeline.publish({local("a", SessionStatus::NeedsInput)});
        sched.advance(500ms);
        REQUIRE(sched.held_detached() == 2);

        // Newer write lands first.
        REQUIRE(sched.release_newest());
        sched.drain();
        REQUIRE(pipeline.published_status(SessionId::from_canonical("a")) ==
                SessionStatus::NeedsInput);

        REQUIRE(sched.release_newest());
        sched.drain();
        REQUIRE(pipeline.published_status(SessionId::from_canonical("a")) ==
                SessionStatus::NeedsInput);
        REQUIRE(pipeline.stats().writes_ok == 2);
    }

    SECTION("InFlightWriteIsNotCancelledByALaterChange") {
        sched.hold_detached(true);
        pipeline.publish({local("a", SessionStatus::Working)});
        sched.advance(500ms);
        REQUIRE(sched.held_detached() == 1);

        pipeline.publish({local("a", SessionStatus::Idle)});
        REQUIRE(sched.held_detached() == 1);

        sched.hold_detached(false);
        sched.advance(500ms);
        REQUIRE(sched.detached_total() == 2);
        REQUIRE(stored_status(store, "a") == "idle");
    }

    SECTION("SessionsLeavingTheLocalSetArePruned") {
        pipeline.publish({local("a", SessionStatus::Working), local("b", SessionStatus::Idle)});
        REQUIRE(pipeline.tracked() == 2);
        REQUIRE(sched.pending_timers() == 2);

        pipeline.publish({local("b", SessionStatus::Idle)});
        REQUIRE(pipeline.tracked() == 1);
        REQUIRE(sched.pending_timers() == 1);

        sched.advance(500ms);
        REQUIRE(store.fetch(record_type::SESSION, "a").error().kind == StoreErrorKind::NotFound);
        REQUIRE(stored_status(store, "b") == "idle");
    }

    SECTION("DestroyedPipelineIgnoresLateCompletions") {
        auto owned = std::make_unique<UploadPipeline>(sched, store, account, opts, log);
        sched.hold_detached(true);
        owned->publish({local("z", SessionStatus::Working)});
        sched.advance(500ms);

        // The write finishes but its completion is still queued for the actor.
        REQUIRE(sched.release_one());
        owned.reset();
        sched.drain();
        REQUIRE(stored_status(store, "z") == "working");
    }
}

TEST_CASE("UploadPipeline with zero heartbeat", "[sync][upload]") {
    ManualScheduler sched;
    MemoryRecordStore store;
    Logger log;
    AccountMonitor account(store, log);
    UploadPipeline pipeline(sched, store, account,
                            {.debounce = 500ms, .heartbeat_interval = 0ms, .device_name = "d"},
                            log);

    pipeline.publish({local("a", SessionStatus::Idle)});
    sched.advance(500ms);
    REQUIRE(pipeline.stats().writes_ok == 1);

    // Every tick with nothing pending re-writes the record.
    pipeline.publish({local("a", SessionStatus::Idle)});
    REQUIRE(pipeline.has_pending(SessionId::from_canonical("a")));
    sched.advance(500ms);
    REQUIRE(pipeline.stats().writes_ok == 2);
    REQUIRE(store.stats().updates == 1);
}

TEST_CASE("upsert_session", "[sync][upload]") {
    MemoryRecordStore store;
    SessionRecord rec{
        .id = "s1",
        .status = SessionStatus::Working,
        .project = "p",
        .timestamp = from_epoch_ms(1000),
        .pid = std::nullopt,
        .source_device_name = "laptop",
    };

    SECTION("CreatesThenUpdates") {
        auto created = UploadPipeline::upsert_session(store, rec);
        REQUIRE(created);

        rec.status = SessionStatus::Idle;
        auto updated = UploadPipeline::upsert_session(store, rec);
        REQUIRE(updated);
        REQUIRE(*updated->change_tag > *created->change_tag);
        REQUIRE(stored_status(store, "s1") == "idle");
    }

    SECTION("KeepsFieldsWrittenByOthers") {
        store.put_raw(record_type::SESSION, "s1",
                      {{field::SESSION_ID, "s1"}, {field::STATUS, "idle"}, {"note", "keep"}});
        REQUIRE(UploadPipeline::upsert_session(store, rec));
        auto got = store.fetch(record_type::SESSION, "s1");
        REQUIRE(got->fields["note"] == "keep");
        REQUIRE(got->fields[field::STATUS] == "working");
    }

    SECTION("ConcurrentCreateRetriesAsUpdate") {
        RacingStore racing(store);
        REQUIRE(store.save(Record{.type = record_type::SESSION, .id = "s1",
                                  .fields = to_fields(rec), .change_tag = std::nullopt}));
        racing.hide_next_fetch = true;
        rec.status = SessionStatus::NeedsInput;

        auto res = UploadPipeline::upsert_session(racing, rec);
        REQUIRE(res);
        REQUIRE(racing.fetches == 2);
        REQUIRE(stored_status(store, "s1") == "needs_input");
    }

    SECTION("DeletedBetweenFetchAndSaveIsRecreated") {
        RacingStore racing(store);
        REQUIRE(UploadPipeline::upsert_session(store, rec));
        racing.delete_before_save = true;

        auto res = UploadPipeline::upsert_session(racing, rec);
        REQUIRE(res);
        REQUIRE(store.count(record_type::SESSION) == 1);
    }

    SECTION("UnavailableIsReturned") {
        store.set_available(false);
        auto res = UploadPipeline::upsert_session(store, rec);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == StoreErrorKind::Unavailable);
    }
}
