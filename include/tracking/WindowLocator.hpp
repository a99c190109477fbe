#pragma once

#include "model/Geometry.hpp"
#include "platform/WindowSystem.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tether::tracking {

// Title buffer bound, in UTF-16 code units. Longer titles are truncated
// before comparison.
constexpr std::size_t MAX_TITLE_UTF16_UNITS = 512;

struct WindowListing {
    model::WindowHandle handle = 0;
    std::string title;  // trimmed
};

class WindowLocator {
public:
    explicit WindowLocator(platform::WindowSystem& windows);

    // First visible top-level window whose trimmed title equals `title`.
    // Point-in-time: windows opened or renamed later are not seen.
    std::optional<model::WindowHandle> find_window_by_exact_title(const std::string& title);

    // Every visible top-level window with a readable title, in OS order
    std::vector<WindowListing> list_visible_windows();

private:
    platform::WindowSystem& windows_;
};

// Startup lookup of the target. Reports "[+] Found target window handle: 0x..."
// on `out`, or "[!] Target window '...' not found" on `err`. An empty result
// means the caller must not start tracking.
std::optional<model::WindowHandle> locate_target(platform::WindowSystem& windows, const std::string& title,
                                                 std::ostream& out, std::ostream& err);

}  // namespace tether::tracking
