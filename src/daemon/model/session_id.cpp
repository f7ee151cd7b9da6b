#include "model/session_id.hpp"

SessionId SessionId::from_local(std::string_view local_id, std::string_view prefix,
                                std::string_view suffix) {
    auto slash = local_id.find_last_of('/');
    if (slash != std::string_view::npos) {
        local_id.remove_prefix(slash + 1);
    }

    if (!prefix.empty() && local_id.starts_with(prefix)) {
        local_id.remove_prefix(prefix.size());
    }
    if (!suffix.empty() && local_id.ends_with(suffix)) {
        local_id.remove_suffix(suffix.size());
    }
    return SessionId(std::string(local_id));
}

SessionId SessionId::from_canonical(std::string value) {
    return SessionId(std::move(value));
}
