#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>
#include <string_view>

namespace tether::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open, the tracker logs from a hot loop
static std::string log_path = "/tmp/tether_debug.log";
static Logger::Level min_level = Logger::Level::Debug;

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    // Re-init after config load: same file keeps what startup already wrote
    if (log_file.is_open()) {
        if (path == log_path) return;
        log_file.close();
    }
    log_path = path;
    log_file.open(log_path, std::ios::trunc);
    if (!log_file) {
        std::cerr << "tether: cannot open log file " << log_path << std::endl;
    }
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

bool Logger::parse_level(const std::string& name, Level& out) {
    if (name == "debug") { out = Level::Debug; return true; }
    if (name == "info")  { out = Level::Info;  return true; }
    if (name == "warn")  { out = Level::Warn;  return true; }
    if (name == "error") { out = Level::Error; return true; }
    return false;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) return;
    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace tether::util
