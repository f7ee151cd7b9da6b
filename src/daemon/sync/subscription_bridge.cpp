#include "sync/subscription_bridge.hpp"

#include "model/records.hpp"

#include <set>

SubscriptionBridge::SubscriptionBridge(RecordStore& store, const Logger& log)
    : SubscriptionBridge(store, default_subscriptions(), log) {}

SubscriptionBridge::SubscriptionBridge(RecordStore& store, std::vector<Subscription> wanted,
                                       const Logger& log)
    : store_(store), wanted_(std::move(wanted)), log_(log) {}

std::vector<Subscription> SubscriptionBridge::default_subscriptions() {
    return {
        Subscription{
            .id = subscription_id::SESSION_CHANGES,
            .record_type = record_type::SESSION,
            .fires_on_create = true,
            .fires_on_update = true,
            .fires_on_delete = true,
            .silent = true,
            .alert_body = "",
        },
        Subscription{
            .id = subscription_id::PROMPT_CHANGES,
            .record_type = record_type::PROMPT,
            .fires_on_create = true,
            .fires_on_update = true,
            .fires_on_delete = false,
            .silent = true,
            .alert_body = "",
        },
    };
}

std::map<std::string, SubscriptionBridge::Registration> SubscriptionBridge::ensure_subscriptions() {
    std::map<std::string, Registration> result;

    auto existing = store_.subscriptions();
    if (!existing) {
        log_.warn("store: cannot list subscriptions: {}", describe(existing.error()));
        for (const auto& sub : wanted_) result[sub.id] = Registration::Failed;
        std::lock_guard lock(mu_);
        last_ = result;
        return result;
    }

    std::set<std::string> present;
    for (const auto& sub : *existing) present.insert(sub.id);

    for (const auto& sub : wanted_) {
        if (present.contains(sub.id)) {
            result[sub.id] = Registration::AlreadyPresent;
            continue;
        }

        auto saved = store_.save_subscription(sub);
        if (saved) {
            log_.info("store: registered subscription {}", sub.id);
            result[sub.id] = Registration::Registered;
        } else if (saved.error().kind == StoreErrorKind::UnknownType) {
            log_.debug("store: {} has no records yet, deferring {}", sub.record_type, sub.id);
            result[sub.id] = Registration::Deferred;
        } else {
            log_.warn("store: registering {} failed: {}", sub.id, describe(saved.error()));
            result[sub.id] = Registration::Failed;
        }
    }

    std::lock_guard lock(mu_);
    last_ = result;
    return result;
}

std::map<std::string, SubscriptionBridge::Registration> SubscriptionBridge::registrations() const {
    std::lock_guard lock(mu_);
    return last_;
}

bool SubscriptionBridge::has_deferred() const {
    std::lock_guard lock(mu_);
    if (last_.empty()) return true;
    for (const auto& [id, reg] : last_) {
        if (reg == Registration::Deferred || reg == Registration::Failed) return true;
    }
    return false;
}

std::expected<void, StoreError> SubscriptionBridge::remove_subscriptions() {
    for (const auto& sub : wanted_) {
        auto res = store_.remove_subscription(sub.id);
        if (!res && res.error().kind != StoreErrorKind::NotFound) {
            return std::unexpected(res.error());
        }
    }
    std::lock_guard lock(mu_);
    last_.clear();
    return {};
}

SubscriptionBridge::RefreshPlan SubscriptionBridge::plan(const ChangeNotification& note) {
    bool session = note.record_type == record_type::SESSION ||
                   note.subscription_id == subscription_id::SESSION_CHANGES;
    bool prompt = note.record_type == record_type::PROMPT ||
                  note.subscription_id == subscription_id::PROMPT_CHANGES;

    if (!session && !prompt) return {RefreshKind::Ignore, {}};
    if (note.record_id.empty()) return {RefreshKind::FullRefresh, {}};

    bool deleted = note.reason == ChangeReason::Deleted;
    if (session) {
        return {deleted ? RefreshKind::DropSession : RefreshKind::FetchSession, note.record_id};
    }
    return {deleted ? RefreshKind::DropPrompt : RefreshKind::FetchPrompt, note.record_id};
}

std::string_view to_string(SubscriptionBridge::Registration reg) {
    switch (reg) {
        case SubscriptionBridge::Registration::Registered: return "registered";
        case SubscriptionBridge::Registration::AlreadyPresent: return "present";
        case SubscriptionBridge::Registration::Deferred: return "deferred";
        case SubscriptionBridge::Registration::Failed: return "failed";
    }
    return "unknown";
}
