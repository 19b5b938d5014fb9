#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/live-answer";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/live-answer";
}

std::string log_path() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/live-answer.log";
    return "/tmp/live-answer.log";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/live-answer.sock";
    return "/tmp/live-answer.sock";
}

} // namespace platform
