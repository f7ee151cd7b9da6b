#pragma once

#include <expected>
#include <string>

// Places text where the user can paste it.
class ClipboardSink {
public:
    virtual ~ClipboardSink() = default;
    virtual std::expected<void, std::string> copy(const std::string& text) = 0;
};

// User-visible desktop notification.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual std::expected<void, std::string> notify(const std::string& title,
                                                    const std::string& body) = 0;
};
