#include "tracking/WindowLocator.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <exception>
#include <format>

namespace tether::tracking {

WindowLocator::WindowLocator(platform::WindowSystem& windows)
    : windows_(windows) {}

std::optional<model::WindowHandle> WindowLocator::find_window_by_exact_title(const std::string& title) {
    tether::util::Logger::debug("Locator: Searching for window titled '" + title + "'");

    std::optional<model::WindowHandle> found;
    size_t examined = 0;

    bool enumerated = false;
    try {
        enumerated = windows_.enumerate_top_level_windows([&](model::WindowHandle window) {
            ++examined;
            if (!windows_.is_visible(window)) {
                return true;
            }
            auto raw = windows_.get_title(window, MAX_TITLE_UTF16_UNITS);
            if (!raw) {
                return true;  // window vanished mid-enumeration
            }
            if (tether::util::trim_whitespace(*raw) == title) {
                found = window;
                return false;  // stop at first match
            }
            return true;
        });
    } catch (const std::exception& e) {
        tether::util::Logger::error("Locator: Window enumeration threw: " + std::string(e.what()));
        return std::nullopt;
    }

    if (!enumerated) {
        tether::util::Logger::error("Locator: Could not enumerate top-level windows");
        return std::nullopt;
    }

    if (found) {
        tether::util::Logger::info(std::format("Locator: Found '{}' as 0x{:08X} after {} windows",
            title, *found, examined));
    } else {
        tether::util::Logger::info(std::format("Locator: No visible window titled '{}' among {} windows",
            title, examined));
    }
    return found;
}

std::vector<WindowListing> WindowLocator::list_visible_windows() {
    std::vector<WindowListing> listing;

    bool enumerated = false;
    try {
        enumerated = windows_.enumerate_top_level_windows([&](model::WindowHandle window) {
            if (!windows_.is_visible(window)) return true;
            auto raw = windows_.get_title(window, MAX_TITLE_UTF16_UNITS);
            if (raw) {
                listing.push_back({window, tether::util::trim_whitespace(*raw)});
            }
            return true;
        });
    } catch (const std::exception& e) {
        tether::util::Logger::error("Locator: Window enumeration threw: " + std::string(e.what()));
        return {};
    }

    if (!enumerated) {
        tether::util::Logger::error("Locator: Could not enumerate top-level windows");
    }
    return listing;
}

std::optional<model::WindowHandle> locate_target(platform::WindowSystem& windows, const std::string& title,
                                                 std::ostream& out, std::ostream& err) {
    WindowLocator locator(windows);
    auto target = locator.find_window_by_exact_title(title);
    if (!target) {
        tether::util::Logger::error("Locator: Target window '" + title + "' not found");
        err << "[!] Target window '" << title << "' not found" << std::endl;
        return std::nullopt;
    }
    out << std::format("[+] Found target window handle: 0x{:08X}", *target) << std::endl;
    return target;
}

}  // namespace tether::tracking
