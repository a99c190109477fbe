#pragma once

#include "model/Geometry.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tether::platform {

// Read-only view of the desktop's top-level windows.
//
// Every query may fail at any time (the window can be destroyed between two
// calls); failures are reported as std::nullopt / false, never by throwing.
class WindowSystem {
public:
    using Visitor = std::function<bool(model::WindowHandle)>;

    virtual ~WindowSystem() = default;

    // Calls visit() for each top-level window in OS order until it returns
    // false. Returns false if the window list itself could not be read.
    virtual bool enumerate_top_level_windows(const Visitor& visit) = 0;

    // Map state, not occlusion
    virtual bool is_visible(model::WindowHandle window) = 0;

    // UTF-8 title, truncated to max_utf16_units UTF-16 code units
    virtual std::optional<std::string> get_title(model::WindowHandle window, std::size_t max_utf16_units) = 0;

    virtual std::optional<model::Rect> get_rectangle(model::WindowHandle window) = 0;
    virtual std::optional<model::WindowHandle> get_foreground_window() = 0;
    virtual std::optional<bool> is_minimized(model::WindowHandle window) = 0;
};

}  // namespace tether::platform
