#pragma once

#include "inject/injector.hpp"

// Pushes text into the input queue of the terminal a process reads from,
// using TIOCSTI on /proc/<pid>/fd/0. Kernels with legacy_tiocsti disabled
// refuse this without CAP_SYS_ADMIN.
class TtyInjector : public Injector {
public:
    explicit TtyInjector(bool submit = true);

    std::expected<void, InjectError> inject(const std::string& text,
                                            std::optional<int> pid) override;
    std::string_view remediation() const override;

private:
    bool submit_;
};
