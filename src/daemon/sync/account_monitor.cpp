#include "sync/account_monitor.hpp"

AccountMonitor::AccountMonitor(RecordStore& store, const Logger& log)
    : store_(store), log_(log) {}

bool AccountMonitor::refresh() {
    auto res = store_.check_account();
    if (res) {
        set(true, "");
    } else {
        set(false, describe(res.error()));
    }
    return res.has_value();
}

bool AccountMonitor::ensure() {
    if (available_.load()) return true;
    return refresh();
}

void AccountMonitor::note_error(const StoreError& err) {
    if (err.kind == StoreErrorKind::Unavailable || err.kind == StoreErrorKind::Transport) {
        set(false, describe(err));
    }
}

void AccountMonitor::set(bool available, const std::string& why) {
    bool was = available_.exchange(available);
    bool first = !checked_.exchange(true);
    if (was == available && !first) return;

    if (available) {
        log_.info("store: account available");
    } else {
        log_.warn("store: account unavailable ({}), writes are skipped until it returns", why);
    }
}
