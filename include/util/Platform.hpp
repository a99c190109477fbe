#pragma once

#include <filesystem>
#include <string>

namespace tether::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_config_file();

    // $DISPLAY, or empty when unset
    static std::string get_display_name();
};

}  // namespace tether::util
