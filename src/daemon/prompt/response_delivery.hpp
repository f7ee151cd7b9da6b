#pragma once

#include "detector/session_detector.hpp"
#include "detector/status_files.hpp"
#include "inject/injector.hpp"
#include "logger.hpp"
#include "model/records.hpp"
#include "output/output.hpp"

#include <string>
#include <string_view>

// Injection capability as last observed. Never cached as final: every
// delivery tries to inject again.
enum class Capability { Unknown, Granted, Denied };

std::string_view to_string(Capability cap);

// Routes an answered prompt into its local session. Runs on the source actor.
class ResponseDelivery {
public:
    enum class Path { Injected, Fallback };

    struct Outcome {
        Path path = Path::Injected;
        bool fallback_file_written = false;
        bool clipboard_written = false;
        std::string detail;

        // False when injection failed and no fallback took the text either.
        bool reached_user() const {
            return path == Path::Injected || fallback_file_written || clipboard_written;
        }
    };

    ResponseDelivery(Injector& injector, ClipboardSink& clipboard, Notifier& notifier,
                     SessionDetector& detector, StatusFileLayout layout, const Logger& log);

    // Injects the response; on any failure writes the fallback file, copies
    // to the clipboard and notifies. Once the text reached the user the
    // session is marked working and its local prompt file removed.
    Outcome deliver(const PromptRecord& prompt);

    Capability capability() const { return capability_; }

private:
    void fallback(const PromptRecord& prompt, const SessionId& session, Outcome& out);

    Injector& injector_;
    ClipboardSink& clipboard_;
    Notifier& notifier_;
    SessionDetector& detector_;
    StatusFileLayout layout_;
    const Logger& log_;
    Capability capability_ = Capability::Unknown;
};

std::string_view to_string(ResponseDelivery::Path path);
