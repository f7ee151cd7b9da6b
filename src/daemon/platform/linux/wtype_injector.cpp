#include "platform/linux/wtype_injector.hpp"
#include "platform/linux/subprocess.hpp"

#include <unistd.h>

WtypeInjector::WtypeInjector(bool submit) : submit_(submit) {}

std::expected<void, InjectError> WtypeInjector::inject(const std::string& text,
                                                       std::optional<int> /*pid*/) {
    auto res = run_process({"wtype", "-"}, text);
    if (!res) return std::unexpected(InjectError{InjectError::Kind::Failed, res.error()});

    // wtype missing or the compositor lacks the virtual-keyboard protocol.
    if (res->code == 127) {
        return std::unexpected(
            InjectError{InjectError::Kind::CapabilityDenied, "wtype is not available"});
    }
    if (res->code != 0) {
        return std::unexpected(InjectError{
            InjectError::Kind::CapabilityDenied,
            "wtype failed with code " + std::to_string(res->code)});
    }

    if (!submit_) return {};

    ::usleep(10000);
    auto enter = run_process({"wtype", "-k", "Return"});
    if (!enter) return std::unexpected(InjectError{InjectError::Kind::Failed, enter.error()});
    if (enter->code != 0) {
        return std::unexpected(InjectError{
            InjectError::Kind::Failed, "wtype Return failed with code " + std::to_string(enter->code)});
    }
    return {};
}

std::string_view WtypeInjector::remediation() const {
    return "Install wtype and run a compositor that supports the virtual-keyboard protocol.";
}
