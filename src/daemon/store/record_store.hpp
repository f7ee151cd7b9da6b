#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class StoreErrorKind {
    Unavailable,  // account/session unreachable; skip and retry next cycle
    NotFound,     // record id absent
    UnknownType,  // record type never written yet
    Conflict,     // insert on an existing id
    NotQueryable, // predicate or sort on a field the store does not index
    Malformed,    // record body does not decode
    Transport,    // I/O failure or timeout
};

std::string_view to_string(StoreErrorKind kind);

struct StoreError {
    StoreErrorKind kind;
    std::string message;

    // Not-found and unknown-type both mean "nothing there yet".
    bool is_absent() const {
        return kind == StoreErrorKind::NotFound || kind == StoreErrorKind::UnknownType;
    }
};

std::string describe(const StoreError& err);

struct Record {
    std::string type;
    std::string id;
    nlohmann::json fields = nlohmann::json::object();

    // Set by the store on every read. A record saved without a tag is an
    // insert and fails with Conflict when the id already exists.
    std::optional<uint64_t> change_tag;
};

enum class PredicateOp { Equal, GreaterOrEqual };

struct Predicate {
    std::string field;
    PredicateOp op;
    nlohmann::json value;
};

struct Query {
    std::string type;
    std::vector<Predicate> predicates; // AND-ed
    std::string sort_field;            // empty: store order
    bool descending = true;
    size_t limit = 100;
};

struct QueryPage {
    std::vector<Record> records;
    std::optional<std::string> cursor; // set while more pages remain
};

enum class ChangeReason { Created, Updated, Deleted };

std::string_view to_string(ChangeReason reason);
std::optional<ChangeReason> parse_change_reason(std::string_view text);

struct Subscription {
    std::string id;
    std::string record_type;
    bool fires_on_create = true;
    bool fires_on_update = true;
    bool fires_on_delete = true;
    // Silent subscriptions wake the receiver without a user-visible alert.
    bool silent = true;
    std::string alert_body;

    bool fires_on(ChangeReason reason) const;
};

struct ChangeNotification {
    std::string subscription_id;
    std::string record_type;
    std::string record_id; // may be empty when the channel coalesced changes
    ChangeReason reason = ChangeReason::Updated;
};

// Shared keyed record service. Implementations must be safe to call from
// several worker threads at once.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::expected<void, StoreError> check_account() = 0;

    virtual std::expected<Record, StoreError> fetch(const std::string& type,
                                                    const std::string& id) = 0;

    // Insert when record.change_tag is empty, otherwise overwrite. Returns the
    // stored record with its new change tag.
    virtual std::expected<Record, StoreError> save(const Record& record) = 0;

    virtual std::expected<void, StoreError> remove(const std::string& type,
                                                   const std::string& id) = 0;

    virtual std::expected<QueryPage, StoreError> query(const Query& query,
                                                       const std::optional<std::string>& cursor) = 0;

    virtual std::expected<std::vector<Subscription>, StoreError> subscriptions() = 0;
    virtual std::expected<void, StoreError> save_subscription(const Subscription& sub) = 0;
    virtual std::expected<void, StoreError> remove_subscription(const std::string& id) = 0;
};

// Delivers change notifications for registered subscriptions. The handler is
// invoked on the channel's own thread.
class PushChannel {
public:
    using Handler = std::function<void(const ChangeNotification&)>;

    virtual ~PushChannel() = default;
    virtual bool start(Handler handler) = 0;
    virtual void stop() = 0;
};
