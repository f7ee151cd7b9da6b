#include "prompt/response_delivery.hpp"

#include <format>

std::string_view to_string(Capability cap) {
    switch (cap) {
        case Capability::Unknown: return "unknown";
        case Capability::Granted: return "granted";
        case Capability::Denied: return "denied";
    }
    return "unknown";
}

std::string_view to_string(ResponseDelivery::Path path) {
    return path == ResponseDelivery::Path::Injected ? "injected" : "fallback";
}

ResponseDelivery::ResponseDelivery(Injector& injector, ClipboardSink& clipboard,
                                   Notifier& notifier, SessionDetector& detector,
                                   StatusFileLayout layout, const Logger& log)
    : injector_(injector), clipboard_(clipboard), notifier_(notifier), detector_(detector),
      layout_(std::move(layout)), log_(log) {}

ResponseDelivery::Outcome ResponseDelivery::deliver(const PromptRecord& prompt) {
    auto session = SessionId::from_canonical(prompt.session_id);
    const auto& text = prompt.response_text.value_or("");
    Outcome out;

    auto injected = injector_.inject(text, prompt.pid);
    if (injected) {
        if (capability_ != Capability::Granted) log_.info("prompt: injection available");
        capability_ = Capability::Granted;
        out.path = Path::Injected;
        log_.info("prompt: injected response into {}", session.str());
    } else {
        const auto& err = injected.error();
        if (err.kind == InjectError::Kind::CapabilityDenied) {
            // Tell the user once per transition into the denied state.
            if (capability_ != Capability::Denied) {
                log_.warn("prompt: injection denied: {}", err.message);
                auto res = notifier_.notify("session-relay cannot type responses",
                                            std::string(injector_.remediation()));
                if (!res) log_.warn("prompt: notification failed: {}", res.error());
            }
            capability_ = Capability::Denied;
        } else {
            log_.warn("prompt: injection into {} failed: {}", session.str(), err.message);
        }
        out.path = Path::Fallback;
        out.detail = err.message;
        fallback(prompt, session, out);
    }

    if (!out.reached_user()) return out;

    if (!detector_.mark_working(session)) {
        log_.debug("prompt: no status file to mark working for {}", session.str());
    }
    detector_.remove_prompt(session);

    return out;
}

void ResponseDelivery::fallback(const PromptRecord& prompt, const SessionId& session,
                                Outcome& out) {
    const auto& text = prompt.response_text.value_or("");
    auto path = layout_.response_path(session);

    auto written = write_file_atomic(path, text);
    if (written) {
        out.fallback_file_written = true;
    } else {
        log_.error("prompt: cannot write fallback file: {}", written.error());
    }

    auto copied = clipboard_.copy(text);
    if (copied) {
        out.clipboard_written = true;
    } else {
        log_.warn("prompt: clipboard copy failed: {}", copied.error());
    }

    if (!out.fallback_file_written && !out.clipboard_written) {
        log_.error("prompt: response for {} could not be delivered anywhere", session.str());
        return;
    }

    auto body = std::format("Response for {} is on the clipboard and in {}", prompt.project, path);
    auto notified = notifier_.notify("Response received", body);
    if (!notified) log_.warn("prompt: notification failed: {}", notified.error());
}
