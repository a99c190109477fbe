#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>

namespace tether::util {

std::filesystem::path Platform::get_config_directory() {
    tether::util::Logger::debug("Platform: Detecting config directory");
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        auto path = std::filesystem::path(xdg) / "tether";
        tether::util::Logger::info("Platform: Config directory: " + path.string());
        return path;
    }
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / ".config" / "tether";
        tether::util::Logger::info("Platform: Config directory: " + path.string());
        return path;
    }
    tether::util::Logger::warn("Platform: HOME env var not set, using fallback: .config/tether");
    return ".config/tether";
}

std::filesystem::path Platform::get_config_file() {
    return get_config_directory() / "config.toml";
}

std::string Platform::get_display_name() {
    auto display = std::getenv("DISPLAY");
    return display ? std::string(display) : std::string();
}

}  // namespace tether::util
