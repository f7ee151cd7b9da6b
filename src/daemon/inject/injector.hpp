#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct InjectError {
    enum class Kind {
        CapabilityDenied, // the platform refused; needs a one-time user grant
        Failed,           // anything else (no target, tool missing, I/O error)
    };

    Kind kind = Kind::Failed;
    std::string message;
};

// Types text into the input of the terminal running a given process.
class Injector {
public:
    virtual ~Injector() = default;

    virtual std::expected<void, InjectError> inject(const std::string& text,
                                                    std::optional<int> pid) = 0;

    // Shown to the user when injection is denied.
    virtual std::string_view remediation() const = 0;
};
