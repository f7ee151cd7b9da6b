#pragma once

#include "inject/injector.hpp"

// Types into the focused Wayland window with wtype. The target pid is not
// used: the session's terminal must have focus.
class WtypeInjector : public Injector {
public:
    // Sends Return after the text when submit is set.
    explicit WtypeInjector(bool submit = true);

    std::expected<void, InjectError> inject(const std::string& text,
                                            std::optional<int> pid) override;
    std::string_view remediation() const override;

private:
    bool submit_;
};
