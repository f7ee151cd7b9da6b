#pragma once

#include "inject/injector.hpp"

// source.injection = "none": every answer takes the fallback path.
class DisabledInjector : public Injector {
public:
    std::expected<void, InjectError> inject(const std::string&, std::optional<int>) override {
        return std::unexpected(InjectError{InjectError::Kind::Failed, "injection disabled"});
    }

    std::string_view remediation() const override {
        return "Set source.injection to \"tty\" or \"wtype\" to type answers into sessions.";
    }
};
