#pragma once

#include "platform/WindowSystem.hpp"
#include "platform/X11Display.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether::platform {

// WindowSystem over Xlib and EWMH root/window properties:
//   top-level windows  _NET_CLIENT_LIST (XQueryTree on the root as fallback)
//   title              _NET_WM_NAME, then WM_NAME
//   foreground         _NET_ACTIVE_WINDOW
//   minimized          _NET_WM_STATE_HIDDEN, or ICCCM WM_STATE == Iconic
//   rectangle          client geometry grown by _NET_FRAME_EXTENTS
// A destroyed XID makes the query fail instead of raising a fatal X error.
class X11WindowSystem : public WindowSystem {
public:
    explicit X11WindowSystem(X11Display& display);

    bool enumerate_top_level_windows(const Visitor& visit) override;
    bool is_visible(model::WindowHandle window) override;
    std::optional<std::string> get_title(model::WindowHandle window, std::size_t max_utf16_units) override;
    std::optional<model::Rect> get_rectangle(model::WindowHandle window) override;
    std::optional<model::WindowHandle> get_foreground_window() override;
    std::optional<bool> is_minimized(model::WindowHandle window) override;

private:
    std::optional<std::vector<unsigned long>> read_client_list();
    std::optional<std::vector<unsigned long>> read_root_children();

    X11Display& display_;
};

}  // namespace tether::platform
