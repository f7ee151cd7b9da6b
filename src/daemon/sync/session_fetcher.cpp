#include "sync/session_fetcher.hpp"

#include <algorithm>
#include <unordered_set>

SessionFetcher::SessionFetcher(RecordStore& store, std::chrono::seconds ttl, Clock clock)
    : store_(store), ttl_(ttl), clock_(std::move(clock)) {}

std::expected<SessionFetcher::Result, StoreError> SessionFetcher::fetch_active() const {
    auto cutoff = clock_() - ttl_;

    Query query{
        .type = record_type::SESSION,
        .predicates = {{field::TIMESTAMP, PredicateOp::GreaterOrEqual, to_epoch_ms(cutoff)}},
        .sort_field = field::TIMESTAMP,
        .descending = true,
        .limit = PAGE_SIZE,
    };

    Result result;
    std::unordered_set<std::string> seen;
    std::optional<std::string> cursor;
    do {
        auto page = store_.query(query, cursor);
        if (!page) return std::unexpected(page.error());

        for (const auto& rec : page->records) {
            auto session = session_from_fields(rec.fields);
            if (!session) {
                ++result.malformed;
                continue;
            }
            // Pages may overlap when records move between requests.
            if (!seen.insert(session->id).second) continue;
            result.sessions.push_back(std::move(*session));
        }
        cursor = page->cursor;
    } while (cursor);

    // The window is re-applied at return time: pages fetched earlier may
    // hold records that have aged out since.
    auto now_cutoff = clock_() - ttl_;
    std::erase_if(result.sessions,
                  [&](const SessionRecord& s) { return s.timestamp < now_cutoff; });

    std::ranges::stable_sort(result.sessions, std::ranges::greater{}, &SessionRecord::timestamp);
    return result;
}

std::expected<SessionRecord, StoreError> SessionFetcher::fetch_one(const std::string& id) const {
    auto rec = store_.fetch(record_type::SESSION, id);
    if (!rec) return std::unexpected(rec.error());

    auto session = session_from_fields(rec->fields);
    if (!session) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed, id + ": " + session.error()});
    }
    if (session->timestamp < clock_() - ttl_) {
        return std::unexpected(StoreError{StoreErrorKind::NotFound, id + " is outside the window"});
    }
    return *session;
}
