#pragma once

#include <string>

namespace platform {

// Empty when neither the XDG variable nor $HOME is set.
std::string config_dir();
std::string data_dir();

std::string ipc_endpoint();

// $SWAYSOCK, then $I3SOCK. Empty when neither is set.
std::string wm_socket();

} // namespace platform
