#include "config/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace tether::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Leaves `out` untouched on malformed input
void parse_int(const std::string& key, const std::string& value, int& out) {
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        tether::util::Logger::warn("Config: Ignoring invalid integer for '" + key + "': " + value);
        return;
    }
    out = parsed;
}

// Body of a "..." value, honouring \" and \\ escapes. Text after the closing
// quote (a trailing comment) is dropped.
std::string unquote(const std::string& value) {
    std::string result;
    for (size_t i = 1; i < value.size(); ++i) {
        char c = value[i];
        if (c == '"') break;
        if (c == '\\' && i + 1 < value.size()) c = value[++i];
        result += c;
    }
    return result;
}

std::string quote(const std::string& value) {
    std::string result = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') result += '\\';
        result += c;
    }
    result += '"';
    return result;
}

}  // namespace

Config ConfigLoader::load_config() {
    tether::util::Logger::info("Config: Loading configuration");

    auto config_file = tether::util::Platform::get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    tether::util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    tether::util::Logger::debug("Config: Loading from file " + path.string());

    std::ifstream file(path);
    if (!file) {
        tether::util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return create_default_config();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Config ConfigLoader::load_from_string(const std::string& text) {
    Config cfg = create_default_config();

    std::istringstream input(text);
    std::string line, current_section;
    while (std::getline(input, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            tether::util::Logger::warn("Config: Skipping malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Trailing comment after an unquoted value
        if (!value.empty() && value.front() != '"') {
            auto hash = value.find('#');
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }

        if (value.length() >= 2 && value.front() == '"') {
            value = unquote(value);
        }

        if (current_section == "target") {
            // Window titles are compared trimmed, so the configured one is too
            if (key == "title") cfg.target_title = tether::util::trim_whitespace(value);
            else if (key == "offset_x") parse_int(key, value, cfg.offset.dx);
            else if (key == "offset_y") parse_int(key, value, cfg.offset.dy);
        }
        else if (current_section == "tracking") {
            if (key == "poll_interval_ms") parse_int(key, value, cfg.poll_interval_ms);
        }
        else if (current_section == "overlay") {
            if (key == "width") parse_int(key, value, cfg.overlay_width);
            else if (key == "height") parse_int(key, value, cfg.overlay_height);
            else if (key == "color") cfg.overlay_color = value;
        }
        else if (current_section == "logging") {
            if (key == "file") cfg.log_file = value;
            else if (key == "level") cfg.log_level = value;
        }
    }

    if (cfg.poll_interval_ms < MIN_POLL_INTERVAL_MS) {
        tether::util::Logger::warn("Config: poll_interval_ms below " + std::to_string(MIN_POLL_INTERVAL_MS) +
            ", clamping");
        cfg.poll_interval_ms = MIN_POLL_INTERVAL_MS;
    }
    if (cfg.overlay_width < 1) cfg.overlay_width = 1;
    if (cfg.overlay_height < 1) cfg.overlay_height = 1;

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    tether::util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            tether::util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        tether::util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    file << "# tether config\n\n";

    file << "[target]\n";
    file << "# Exact window title, case-sensitive (leading/trailing whitespace ignored)\n";
    file << "title = " << quote(cfg.target_title) << "\n";
    file << "# Overlay position relative to the target's top-right corner\n";
    file << "offset_x = " << cfg.offset.dx << "\n";
    file << "offset_y = " << cfg.offset.dy << "\n\n";

    file << "[tracking]\n";
    file << "# How often the target window is polled\n";
    file << "poll_interval_ms = " << cfg.poll_interval_ms << "\n\n";

    file << "[overlay]\n";
    file << "width = " << cfg.overlay_width << "\n";
    file << "height = " << cfg.overlay_height << "\n";
    file << "color = " << quote(cfg.overlay_color) << "\n\n";

    file << "[logging]\n";
    file << "file = " << quote(cfg.log_file) << "\n";
    file << "# debug, info, warn, error\n";
    file << "level = " << quote(cfg.log_level) << "\n";

    return static_cast<bool>(file);
}

Config ConfigLoader::create_default_config() {
    return Config{};
}

}  // namespace tether::config
