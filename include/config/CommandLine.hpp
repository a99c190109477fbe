#pragma once

#include "config/Config.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tether::config {

enum class RunMode {
    Track,        // default: follow the target window
    List,         // print visible top-level windows
    Calibrate,    // print the offset of a second window from the target
    WriteConfig,  // write a default config file and exit
    Help,
};

struct CommandLine {
    RunMode mode = RunMode::Track;
    std::optional<std::string> target_title;
    std::optional<model::Offset> offset;
    std::optional<int> poll_interval_ms;
    std::optional<std::filesystem::path> config_path;
    std::string calibrate_title;

    // Non-empty when the arguments could not be parsed
    std::string error;
};

CommandLine parse_command_line(const std::vector<std::string>& args);

// Command line values win over the config file
void apply_overrides(Config& cfg, const CommandLine& cli);

std::string usage_text();

}  // namespace tether::config
