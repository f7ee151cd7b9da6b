#include "store/memory_store.hpp"

#include "store/query_eval.hpp"

#include <algorithm>
#include <charconv>

MemoryRecordStore::MemoryRecordStore() : MemoryRecordStore(Options{}) {}

MemoryRecordStore::MemoryRecordStore(Options options) : options_(std::move(options)) {}

MemoryRecordStore::~MemoryRecordStore() = default;

std::expected<void, StoreError> MemoryRecordStore::check_account() {
    if (!available_.load()) {
        return std::unexpected(StoreError{StoreErrorKind::Unavailable, "account not available"});
    }
    return {};
}

std::expected<Record, StoreError> MemoryRecordStore::fetch(const std::string& type,
                                                           const std::string& id) {
    if (auto ok = check_account(); !ok) return std::unexpected(ok.error());

    std::lock_guard lock(mu_);
    stats_.fetches++;
    auto it = records_.find({type, id});
    if (it == records_.end()) {
        return std::unexpected(StoreError{StoreErrorKind::NotFound, type + "/" + id});
    }
    return it->second;
}

std::expected<Record, StoreError> MemoryRecordStore::save(const Record& record) {
    if (auto ok = check_account(); !ok) return std::unexpected(ok.error());

    ChangeReason reason;
    Record stored;
    {
        std::lock_guard lock(mu_);
        auto it = records_.find({record.type, record.id});
        bool exists = it != records_.end();

        if (!record.change_tag && exists) {
            return std::unexpected(StoreError{StoreErrorKind::Conflict,
                                              record.type + "/" + record.id + " already exists"});
        }
        if (record.change_tag && !exists) {
            return std::unexpected(StoreError{StoreErrorKind::NotFound,
                                              record.type + "/" + record.id + " was deleted"});
        }

        stored = record;
        stored.change_tag = next_tag_++;
        records_[{record.type, record.id}] = stored;
        known_types_.insert(record.type);

        reason = exists ? ChangeReason::Updated : ChangeReason::Created;
        if (exists) {
            stats_.updates++;
        } else {
            stats_.inserts++;
        }
    }

    notify(record.type, record.id, reason);
    return stored;
}

std::expected<void, StoreError> MemoryRecordStore::remove(const std::string& type,
                                                          const std::string& id) {
    if (auto ok = check_account(); !ok) return std::unexpected(ok.error());

    {
        std::lock_guard lock(mu_);
        if (records_.erase({type, id}) == 0) {
            return std::unexpected(StoreError{StoreErrorKind::NotFound, type + "/" + id});
        }
        stats_.removes++;
    }

    notify(type, id, ChangeReason::Deleted);
    return {};
}

std::expected<void, StoreError> MemoryRecordStore::check_query(const Query& query) const {
    if (query.predicates.empty() && !options_.allow_unfiltered_queries) {
        return std::unexpected(StoreError{StoreErrorKind::NotQueryable,
                                          "unfiltered query on " + query.type + " not permitted"});
    }
    for (const auto& p : query.predicates) {
        if (!options_.indexed_fields.contains(p.field)) {
            return std::unexpected(StoreError{StoreErrorKind::NotQueryable,
                                              "field '" + p.field + "' is not indexed"});
        }
    }
    if (!query.sort_field.empty() && !options_.indexed_fields.contains(query.sort_field)) {
        return std::unexpected(StoreError{StoreErrorKind::NotQueryable,
                                          "field '" + query.sort_field + "' is not sortable"});
    }
    return {};
}

std::expected<QueryPage, StoreError> MemoryRecordStore::query(
    const Query& query, const std::optional<std::string>& cursor) {
    if (auto ok = check_account(); !ok) return std::unexpected(ok.error());
    if (auto ok = check_query(query); !ok) return std::unexpected(ok.error());

    size_t offset = 0;
    if (cursor) {
        auto [ptr, ec] = std::from_chars(cursor->data(), cursor->data() + cursor->size(), offset);
        if (ec != std::errc{}) {
            return std::unexpected(StoreError{StoreErrorKind::Malformed, "bad cursor"});
        }
    }

    std::vector<Record> matched;
    {
        std::lock_guard lock(mu_);
        stats_.queries++;
        if (!known_types_.contains(query.type)) {
            return std::unexpected(StoreError{StoreErrorKind::UnknownType,
                                              "record type " + query.type + " does not exist"});
        }
        for (const auto& [key, rec] : records_) {
            if (query_matches(rec, query)) matched.push_back(rec);
        }
    }

    std::ranges::sort(matched, [&](const Record& a, const Record& b) {
        return sorts_before(a, b, query);
    });

    size_t limit = query.limit == 0 ? matched.size() : query.limit;
    QueryPage page;
    for (size_t i = offset; i < matched.size() && page.records.size() < limit; i++) {
        page.records.push_back(std::move(matched[i]));
    }
    size_t next = offset + page.records.size();
    if (next < matched.size()) {
        page.cursor = std::to_string(next);
    }
    return page;
}

std::expected<std::vector<Subscription>, StoreError> MemoryRecordStore::subscriptions() {
    if (auto ok = check_account(); !ok) return std::unexpected(ok.error());

    std::lock_guard lock(mu_);
    std::vector<Subscription> subs;
    for (const auto& [id, sub] : subscriptions_) subs.push_back(sub);
    return subs;
}

std::expected<void, StoreError> MemoryRecordStore::save_subscription(const Subscription& sub) {
    if (auto ok = check_account(); !ok) return std::unexpected(ok.error());

    std::lock_guard lock(mu_);
    if (!known_types_.contains(sub.record_type)) {
        return std::unexpected(StoreError{StoreErrorKind::UnknownType,
                                          "record type " + sub.record_type + " does not exist"});
    }
    subscriptions_[sub.id] = sub;
    return {};
}

std::expected<void, StoreError> MemoryRecordStore::remove_subscription(const std::string& id) {
    if (auto ok = check_account(); !ok) return std::unexpected(ok.error());

    std::lock_guard lock(mu_);
    if (subscriptions_.erase(id) == 0) {
        return std::unexpected(StoreError{StoreErrorKind::NotFound, "subscription " + id});
    }
    return {};
}

void MemoryRecordStore::put_raw(const std::string& type, const std::string& id,
                                nlohmann::json fields) {
    {
        std::lock_guard lock(mu_);
        records_[{type, id}] = Record{
            .type = type, .id = id, .fields = std::move(fields), .change_tag = next_tag_++};
        known_types_.insert(type);
    }
    notify(type, id, ChangeReason::Updated);
}

size_t MemoryRecordStore::count(const std::string& type) const {
    std::lock_guard lock(mu_);
    return static_cast<size_t>(std::ranges::count_if(
        records_, [&](const auto& entry) { return entry.first.first == type; }));
}

MemoryRecordStore::Stats MemoryRecordStore::stats() const {
    std::lock_guard lock(mu_);
    return stats_;
}

void MemoryRecordStore::attach(MemoryPushChannel* channel) {
    std::lock_guard lock(channels_mu_);
    channels_.push_back(channel);
}

void MemoryRecordStore::detach(MemoryPushChannel* channel) {
    std::lock_guard lock(channels_mu_);
    std::erase(channels_, channel);
}

void MemoryRecordStore::notify(const std::string& type, const std::string& id,
                               ChangeReason reason) {
    std::vector<ChangeNotification> notes;
    {
        std::lock_guard lock(mu_);
        for (const auto& [sub_id, sub] : subscriptions_) {
            if (sub.record_type == type && sub.fires_on(reason)) {
                notes.push_back({sub_id, type, id, reason});
            }
        }
    }
    if (notes.empty()) return;

    std::vector<MemoryPushChannel*> channels;
    {
        std::lock_guard lock(channels_mu_);
        channels = channels_;
    }
    for (auto* ch : channels) {
        for (const auto& n : notes) ch->deliver(n);
    }
}

MemoryPushChannel::MemoryPushChannel(MemoryRecordStore& store) : store_(store) {}

MemoryPushChannel::~MemoryPushChannel() {
    stop();
}

bool MemoryPushChannel::start(Handler handler) {
    {
        std::lock_guard lock(mu_);
        if (handler_) return true;
        handler_ = std::move(handler);
    }
    store_.attach(this);
    return true;
}

void MemoryPushChannel::stop() {
    store_.detach(this);
    std::lock_guard lock(mu_);
    handler_ = nullptr;
}

void MemoryPushChannel::deliver(const ChangeNotification& note) {
    if (dropping_.load()) return;

    Handler handler;
    {
        std::lock_guard lock(mu_);
        handler = handler_;
    }
    if (handler) handler(note);
}
