#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string xdg_dir(const char* var, const char* home_suffix) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/i3pm";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + home_suffix + "/i3pm";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/i3pm.sock";
    return "/tmp/i3pm.sock";
}

std::string wm_socket() {
    if (const char* sway = std::getenv("SWAYSOCK"); sway && *sway) return sway;
    if (const char* i3 = std::getenv("I3SOCK"); i3 && *i3) return i3;
    return {};
}

} // namespace platform
