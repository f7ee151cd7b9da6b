#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/session-relay or ~/.config/session-relay
std::string config_dir();

// $XDG_DATA_HOME/session-relay or ~/.local/share/session-relay
std::string data_dir();

// Unix socket the CLI talks to.
std::string ipc_endpoint();

// Name this machine is published under when device_name is not configured.
std::string host_name();

} // namespace platform
