#include <catch2/catch_test_macros.hpp>

#include "model/records.hpp"
#include "store/memory_store.hpp"
#include "sync/cleanup_sweep.hpp"
#include "sync/session_fetcher.hpp"

#include "support/manual_scheduler.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>

using namespace std::chrono_literals;

namespace {

SessionRecord remote(const std::string& id, const std::string& device, Timestamp at) {
    return SessionRecord{
        .id = id,
        .status = SessionStatus::Idle,
        .project = "p",
        .timestamp = at,
        .pid = std::nullopt,
        .source_device_name = device,
    };
}

void put(MemoryRecordStore& store, const SessionRecord& rec) {
    REQUIRE(store.save(Record{.type = record_type::SESSION, .id = rec.id,
                              .fields = to_fields(rec), .change_tag = std::nullopt}));
}

std::unordered_set<SessionId> ids(std::initializer_list<const char*> values) {
    std::unordered_set<SessionId> out;
    for (const auto* v : values) out.insert(SessionId::from_canonical(v));
    return out;
}

} // namespace

TEST_CASE("CleanupSweep::compute_stale", "[sync][cleanup]") {
    auto t = from_epoch_ms(1000);
    std::vector<SessionRecord> recs = {
        remote("a", "laptop", t),
        remote("b", "laptop", t),
        remote("c", "desktop", t),
    };

    auto stale = CleanupSweep::compute_stale(recs, ids({"a"}), "laptop");
    REQUIRE(stale == std::vector<std::string>{"b"});

    // Another device's records are never ours to delete.
    REQUIRE(CleanupSweep::compute_stale(recs, {}, "desktop") == std::vector<std::string>{"c"});
    REQUIRE(CleanupSweep::compute_stale(recs, ids({"a", "b"}), "laptop").empty());
}

TEST_CASE("CleanupSweep", "[sync][cleanup]") {
    ManualScheduler sched;
    MemoryRecordStore store;
    Logger log;
    SessionFetcher fetcher(store, 300s, [&] { return sched.now(); });

    std::unordered_set<SessionId> local = ids({"live"});
    CleanupSweep sweep(sched, store, fetcher, "laptop", 3, [&] { return local; }, log);

    std::optional<CleanupSweep::Outcome> last;
    auto capture = [&](const CleanupSweep::Outcome& o) { last = o; };
    auto now = sched.now();

    SECTION("DeletesOnlyThisDevicesStaleRecords") {
        put(store, remote("live", "laptop", now));
        put(store, remote("gone", "laptop", now));
        put(store, remote("theirs", "desktop", now));

        REQUIRE(sweep.run_now(capture));
        sched.drain();

        REQUIRE(last);
        REQUIRE(last->ran);
        REQUIRE(last->remote == 3);
        REQUIRE(last->stale == 1);
        REQUIRE(last->deleted == 1);
        REQUIRE(store.fetch(record_type::SESSION, "gone").error().kind == StoreErrorKind::NotFound);
        REQUIRE(store.fetch(record_type::SESSION, "theirs"));
        REQUIRE(store.fetch(record_type::SESSION, "live"));
        REQUIRE_FALSE(sweep.running());
    }

    SECTION("EmptyResultSkips") {
        put(store, remote("old", "laptop", now - 1h));
        REQUIRE(sweep.run_now(capture));
        sched.drain();

        REQUIRE(last);
        REQUIRE_FALSE(last->ran);
        REQUIRE(last->error.empty());
        REQUIRE(sweep.stats().skipped == 1);
        REQUIRE(store.count(record_type::SESSION) == 1);
    }

    SECTION("FetchErrorSkips") {
        put(store, remote("gone", "laptop", now));
        store.set_available(false);
        REQUIRE(sweep.run_now(capture));
        sched.drain();

        REQUIRE(last);
        REQUIRE_FALSE(last->ran);
        REQUIRE_FALSE(last->error.empty());

        store.set_available(true);
        REQUIRE(store.count(record_type::SESSION) == 1);
    }

    SECTION("SecondSweepWhileRunningIsRefused") {
        put(store, remote("gone", "laptop", now));
        sched.hold_detached(true);
        REQUIRE(sweep.run_now());
        REQUIRE(sweep.running());

        REQUIRE_FALSE(sweep.run_now(capture));
        REQUIRE(last);
        REQUIRE_FALSE(last->ran);
        REQUIRE(last->error == "a sweep is already running");

        sched.hold_detached(false);
        sched.drain();
        REQUIRE_FALSE(sweep.running());
        REQUIRE(sweep.stats().deleted == 1);
    }

    SECTION("AlreadyDeletedCountsAsDeleted") {
        put(store, remote("gone", "laptop", now));
        sched.hold_detached(true);
        REQUIRE(sweep.run_now(capture));
        REQUIRE(sched.release_one()); // fetch
        sched.drain();                // stale set computed, delete queued
        REQUIRE(sched.held_detached() == 1);

        REQUIRE(store.remove(record_type::SESSION, "gone"));
        sched.hold_detached(false);
        sched.drain();

        REQUIRE(last);
        REQUIRE(last->deleted == 1);
        REQUIRE(sweep.stats().delete_failed == 0);
    }

    SECTION("LocalSetIsReadWhenTheFetchReturns") {
        put(store, remote("late", "laptop", now));
        sched.hold_detached(true);
        REQUIRE(sweep.run_now(capture));
        REQUIRE(sched.release_one());

        // The session appeared locally while the read was in flight.
        local.insert(SessionId::from_canonical("late"));
        sched.hold_detached(false);
        sched.drain();

        REQUIRE(last);
        REQUIRE(last->stale == 0);
        REQUIRE(store.fetch(record_type::SESSION, "late"));
    }

    SECTION("RunsEveryNthTick") {
        put(store, remote("gone", "laptop", now));
        sweep.on_tick();
        sweep.on_tick();
        REQUIRE(sched.detached_total() == 0);
        sweep.on_tick();
        REQUIRE(sched.detached_total() == 1);
        sched.drain();
        REQUIRE(sweep.stats().sweeps == 1);
    }
}
