#include "logger.hpp"

#include <cstdio>
#include <mutex>
#include <print>

namespace {

// Worker threads log too; keep lines whole.
std::mutex g_log_mu;

std::string_view level_tag(Logger::Level level) {
    switch (level) {
        case Logger::Level::Debug: return "debug: ";
        case Logger::Level::Info: return "";
        case Logger::Level::Warn: return "warning: ";
        case Logger::Level::Error: return "error: ";
    }
    return "";
}

} // namespace

void Logger::write(Level level, std::string_view msg) const {
    std::lock_guard lock(g_log_mu);
    std::println(stderr, "[session-relay] {}{}", level_tag(level), msg);
}
