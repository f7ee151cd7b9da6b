#pragma once

#include "logger.hpp"
#include "store/record_store.hpp"

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace subscription_id {
inline constexpr char SESSION_CHANGES[] = "session-changes";
inline constexpr char PROMPT_CHANGES[] = "prompt-changes";
} // namespace subscription_id

// Registers the change subscriptions a remote monitor needs and turns
// incoming notifications into refresh actions. Registration is blocking and
// runs on a worker.
class SubscriptionBridge {
public:
    enum class Registration { Registered, AlreadyPresent, Deferred, Failed };

    enum class RefreshKind {
        FetchSession,  // re-read one Session record
        DropSession,   // a Session record was deleted
        FetchPrompt,   // re-read one Prompt record
        DropPrompt,
        FullRefresh,   // notification without a usable record id
        Ignore,        // not one of ours
    };

    struct RefreshPlan {
        RefreshKind kind = RefreshKind::Ignore;
        std::string record_id;
    };

    SubscriptionBridge(RecordStore& store, const Logger& log);
    SubscriptionBridge(RecordStore& store, std::vector<Subscription> wanted, const Logger& log);

    // Session: create, update, delete. Prompt: create, update. All silent.
    static std::vector<Subscription> default_subscriptions();

    // Idempotent: subscriptions already present (by id) are left alone.
    // Subscriptions on a record type the store has never seen are deferred
    // and retried on the next call.
    std::map<std::string, Registration> ensure_subscriptions();

    // True until every subscription is registered or already present.
    bool has_deferred() const;
    std::map<std::string, Registration> registrations() const;

    // Removes every subscription this bridge manages. NotFound is success.
    std::expected<void, StoreError> remove_subscriptions();

    static RefreshPlan plan(const ChangeNotification& note);

    const std::vector<Subscription>& wanted() const { return wanted_; }

private:
    RecordStore& store_;
    std::vector<Subscription> wanted_;
    const Logger& log_;

    // Read by the IPC status command while a worker may be registering.
    mutable std::mutex mu_;
    std::map<std::string, Registration> last_;
};

std::string_view to_string(SubscriptionBridge::Registration reg);
