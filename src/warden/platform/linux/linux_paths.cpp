#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/agent-warden";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/agent-warden";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/agent-warden";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/agent-warden";
}

std::string log_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "agent-warden" / "logs").string();
}

} // namespace platform
