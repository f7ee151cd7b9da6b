#pragma once

#include "output/output.hpp"

// Copies text with wl-copy.
class WaylandClipboardOutput : public ClipboardSink {
public:
    std::expected<void, std::string> copy(const std::string& text) override;
};
