#pragma once

#include <string>

namespace tether::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Truncates `path`, unless it is the file already open
    static void init(const std::string& path = "/tmp/tether_debug.log");
    static void set_level(Level level);
    static bool parse_level(const std::string& name, Level& out);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace tether::util
