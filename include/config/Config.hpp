#pragma once

#include "model/Geometry.hpp"
#include <filesystem>
#include <string>

namespace tether::config {

struct Config {
    // Target settings
    std::string target_title = "Steam";
    model::Offset offset{-617, 7};

    // Tracking settings
    int poll_interval_ms = 5;

    // Overlay settings
    int overlay_width = 170;
    int overlay_height = 25;
    std::string overlay_color = "#32373f";

    // Logging settings
    std::string log_file = "/tmp/tether_debug.log";
    std::string log_level = "info";
};

class ConfigLoader {
public:
    static constexpr int MIN_POLL_INTERVAL_MS = 1;

    // Reads the user config file if present, defaults otherwise
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config load_from_string(const std::string& text);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

private:
    static Config create_default_config();
};

}  // namespace tether::config
