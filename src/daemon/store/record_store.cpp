#include "store/record_store.hpp"

std::string_view to_string(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::Unavailable: return "unavailable";
        case StoreErrorKind::NotFound: return "not_found";
        case StoreErrorKind::UnknownType: return "unknown_type";
        case StoreErrorKind::Conflict: return "conflict";
        case StoreErrorKind::NotQueryable: return "not_queryable";
        case StoreErrorKind::Malformed: return "malformed";
        case StoreErrorKind::Transport: return "transport";
    }
    return "transport";
}

std::string describe(const StoreError& err) {
    if (err.message.empty()) return std::string(to_string(err.kind));
    return std::string(to_string(err.kind)) + ": " + err.message;
}

std::string_view to_string(ChangeReason reason) {
    switch (reason) {
        case ChangeReason::Created: return "created";
        case ChangeReason::Updated: return "updated";
        case ChangeReason::Deleted: return "deleted";
    }
    return "updated";
}

std::optional<ChangeReason> parse_change_reason(std::string_view text) {
    if (text == "created") return ChangeReason::Created;
    if (text == "updated") return ChangeReason::Updated;
    if (text == "deleted") return ChangeReason::Deleted;
    return std::nullopt;
}

bool Subscription::fires_on(ChangeReason reason) const {
    switch (reason) {
        case ChangeReason::Created: return fires_on_create;
        case ChangeReason::Updated: return fires_on_update;
        case ChangeReason::Deleted: return fires_on_delete;
    }
    return false;
}
