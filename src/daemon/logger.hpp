#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

// Daemon log sink on stderr. debug/info are printed only with --verbose;
// warnings and errors always are. Callers prefix the component themselves
// ("upload: ...", "store: ...").
class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    explicit Logger(bool verbose = false) : verbose_(verbose) {}

    bool verbose() const { return verbose_; }
    void set_verbose(bool verbose) { verbose_ = verbose; }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) const {
        if (verbose_) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) const {
        if (verbose_) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) const {
        write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) const {
        write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    void write(Level level, std::string_view msg) const;

private:
    bool verbose_;
};
