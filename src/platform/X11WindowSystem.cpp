#include "platform/X11WindowSystem.hpp"
#include "platform/X11ErrorTrap.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <algorithm>

namespace tether::platform {

namespace {

constexpr long MAX_PROPERTY_LONGS = 0x7fffffffL;

// Format-32 property as a list of longs. Empty optional when the property is
// missing, of another type, or the request failed.
std::optional<std::vector<unsigned long>> read_long_property(Display* display, Window window,
                                                             Atom property, Atom type) {
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long count = 0;
    unsigned long bytes_after = 0;
    unsigned char* data = nullptr;

    int status = XGetWindowProperty(display, window, property, 0, MAX_PROPERTY_LONGS, False, type,
                                    &actual_type, &actual_format, &count, &bytes_after, &data);
    if (status != Success) {
        return std::nullopt;
    }
    if (actual_type != type || actual_format != 32) {
        if (data) XFree(data);
        return std::nullopt;
    }

    // Format 32 data arrives as an array of C longs, whatever their width
    auto* values = reinterpret_cast<unsigned long*>(data);
    std::vector<unsigned long> result(values, values + count);
    XFree(data);
    return result;
}

std::optional<std::string> read_string_property(Display* display, Window window,
                                                Atom property, Atom type) {
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long count = 0;
    unsigned long bytes_after = 0;
    unsigned char* data = nullptr;

    int status = XGetWindowProperty(display, window, property, 0, MAX_PROPERTY_LONGS, False, type,
                                    &actual_type, &actual_format, &count, &bytes_after, &data);
    if (status != Success) {
        return std::nullopt;
    }
    if (actual_type != type || actual_format != 8 || !data) {
        if (data) XFree(data);
        return std::nullopt;
    }

    std::string result(reinterpret_cast<char*>(data), count);
    XFree(data);
    return result;
}

// Legacy WM_NAME as UTF-8. STRING is Latin-1; COMPOUND_TEXT and friends go
// through Xlib's locale converters.
std::optional<std::string> read_wm_name(Display* display, Window window) {
    XTextProperty property{};
    if (!XGetWMName(display, window, &property) || !property.value) {
        return std::nullopt;
    }

    std::optional<std::string> result;
    if (property.encoding == XA_STRING && property.format == 8) {
        result = tether::util::latin1_to_utf8(
            std::string(reinterpret_cast<char*>(property.value), property.nitems));
    } else {
        char** list = nullptr;
        int count = 0;
        int status = Xutf8TextPropertyToTextList(display, &property, &list, &count);
        if (status >= Success && list) {
            if (count > 0 && list[0]) result = std::string(list[0]);
            XFreeStringList(list);
        } else {
            tether::util::Logger::debug("X11: Cannot convert WM_NAME encoding");
        }
    }

    XFree(property.value);
    return result;
}

}  // namespace

X11WindowSystem::X11WindowSystem(X11Display& display)
    : display_(display) {}

std::optional<std::vector<unsigned long>> X11WindowSystem::read_client_list() {
    Display* display = display_.get();
    X11ErrorTrap trap(display);
    auto clients = read_long_property(display, display_.root(),
                                      display_.atom("_NET_CLIENT_LIST"), XA_WINDOW);
    if (trap.failed()) return std::nullopt;
    return clients;
}

std::optional<std::vector<unsigned long>> X11WindowSystem::read_root_children() {
    Display* display = display_.get();
    X11ErrorTrap trap(display);

    Window root_return = 0;
    Window parent_return = 0;
    Window* children = nullptr;
    unsigned int count = 0;
    if (!XQueryTree(display, display_.root(), &root_return, &parent_return, &children, &count)) {
        return std::nullopt;
    }

    std::vector<unsigned long> result(children, children + count);
    if (children) XFree(children);
    if (trap.failed()) return std::nullopt;
    return result;
}

bool X11WindowSystem::enumerate_top_level_windows(const Visitor& visit) {
    // Read the whole list first: the visitor issues its own trapped requests
    auto windows = read_client_list();
    if (!windows) {
        tether::util::Logger::debug("X11: _NET_CLIENT_LIST unavailable, falling back to XQueryTree");
        windows = read_root_children();
    }
    if (!windows) {
        tether::util::Logger::error("X11: Cannot list top-level windows");
        return false;
    }

    for (unsigned long window : *windows) {
        if (!visit(static_cast<model::WindowHandle>(window))) break;
    }
    return true;
}

bool X11WindowSystem::is_visible(model::WindowHandle window) {
    Display* display = display_.get();
    X11ErrorTrap trap(display);

    XWindowAttributes attributes;
    if (!XGetWindowAttributes(display, static_cast<Window>(window), &attributes)) {
        return false;
    }
    if (trap.failed()) return false;
    return attributes.map_state == IsViewable;
}

std::optional<std::string> X11WindowSystem::get_title(model::WindowHandle window, std::size_t max_utf16_units) {
    Display* display = display_.get();
    X11ErrorTrap trap(display);

    auto title = read_string_property(display, static_cast<Window>(window),
                                      display_.atom("_NET_WM_NAME"), display_.atom("UTF8_STRING"));
    if (!title) {
        title = read_wm_name(display, static_cast<Window>(window));
    }
    if (trap.failed()) return std::nullopt;

    return tether::util::truncate_utf16(title.value_or(std::string()), max_utf16_units);
}

std::optional<model::Rect> X11WindowSystem::get_rectangle(model::WindowHandle window) {
    Display* display = display_.get();
    X11ErrorTrap trap(display);
    Window handle = static_cast<Window>(window);

    XWindowAttributes attributes;
    if (!XGetWindowAttributes(display, handle, &attributes)) {
        return std::nullopt;
    }

    int x = 0;
    int y = 0;
    Window child = 0;
    if (!XTranslateCoordinates(display, handle, display_.root(), 0, 0, &x, &y, &child)) {
        return std::nullopt;
    }

    // left, right, top, bottom decoration sizes set by the window manager
    auto extents = read_long_property(display, handle, display_.atom("_NET_FRAME_EXTENTS"), XA_CARDINAL);
    if (trap.failed()) return std::nullopt;

    model::Rect rect{x, y, x + attributes.width, y + attributes.height};
    if (extents && extents->size() >= 4) {
        rect.left -= static_cast<int>((*extents)[0]);
        rect.right += static_cast<int>((*extents)[1]);
        rect.top -= static_cast<int>((*extents)[2]);
        rect.bottom += static_cast<int>((*extents)[3]);
    }
    return rect;
}

std::optional<model::WindowHandle> X11WindowSystem::get_foreground_window() {
    Display* display = display_.get();
    X11ErrorTrap trap(display);

    auto active = read_long_property(display, display_.root(),
                                     display_.atom("_NET_ACTIVE_WINDOW"), XA_WINDOW);
    if (trap.failed() || !active) return std::nullopt;

    // An empty list or 0 means no window has focus
    if (active->empty()) return model::WindowHandle{0};
    return static_cast<model::WindowHandle>(active->front());
}

std::optional<bool> X11WindowSystem::is_minimized(model::WindowHandle window) {
    Display* display = display_.get();
    X11ErrorTrap trap(display);
    Window handle = static_cast<Window>(window);

    // Probe existence first: a missing property is not an error, a missing window is
    XWindowAttributes attributes;
    if (!XGetWindowAttributes(display, handle, &attributes)) {
        return std::nullopt;
    }

    auto states = read_long_property(display, handle, display_.atom("_NET_WM_STATE"), XA_ATOM);
    const Atom wm_state = display_.atom("WM_STATE");
    auto icccm_state = read_long_property(display, handle, wm_state, wm_state);
    if (trap.failed()) return std::nullopt;

    if (states) {
        const Atom hidden = display_.atom("_NET_WM_STATE_HIDDEN");
        if (std::find(states->begin(), states->end(), hidden) != states->end()) {
            return true;
        }
    }
    if (icccm_state && !icccm_state->empty() && icccm_state->front() == IconicState) {
        return true;
    }
    return false;
}

}  // namespace tether::platform
