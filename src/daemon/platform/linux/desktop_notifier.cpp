#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/subprocess.hpp"

DesktopNotifier::DesktopNotifier(std::string app_name) : app_name_(std::move(app_name)) {}

std::expected<void, std::string> DesktopNotifier::notify(const std::string& title,
                                                         const std::string& body) {
    auto res = run_process({"notify-send", "--app-name=" + app_name_, title, body});
    if (!res) return std::unexpected(res.error());

    if (res->code == 127) return std::unexpected(std::string("notify-send not found"));
    if (res->code != 0) {
        return std::unexpected("notify-send exited with code " + std::to_string(res->code));
    }
    return {};
}
