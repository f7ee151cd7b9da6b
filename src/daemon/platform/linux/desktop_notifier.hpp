#pragma once

#include "output/output.hpp"

// Desktop notifications through notify-send.
class DesktopNotifier : public Notifier {
public:
    explicit DesktopNotifier(std::string app_name = "session-relay");

    std::expected<void, std::string> notify(const std::string& title,
                                            const std::string& body) override;

private:
    std::string app_name_;
};
