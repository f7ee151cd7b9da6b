#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/subprocess.hpp"

std::expected<void, std::string> WaylandClipboardOutput::copy(const std::string& text) {
    auto res = run_process({"wl-copy"}, text);
    if (!res) return std::unexpected(res.error());

    if (res->code == 127) return std::unexpected(std::string("wl-copy not found"));
    if (res->code != 0) {
        return std::unexpected("wl-copy exited with code " + std::to_string(res->code));
    }
    return {};
}
