#include "platform/X11Overlay.hpp"
#include "platform/X11ErrorTrap.hpp"
#include "util/Logger.hpp"
#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <format>
#include <utility>

namespace tether::platform {

X11Overlay::X11Overlay(X11Display& display, Options options)
    : display_(display), options_(std::move(options)) {}

X11Overlay::~X11Overlay() {
    if (window_ && !destroyed_ && display_.is_open()) {
        X11ErrorTrap trap(display_.get());
        XDestroyWindow(display_.get(), window_);
        if (trap.failed()) {
            tether::util::Logger::debug("X11: Overlay window was already gone");
        }
        window_ = 0;
    }
}

unsigned long X11Overlay::allocate_background() {
    Display* display = display_.get();
    int screen = DefaultScreen(display);
    Colormap colormap = DefaultColormap(display, screen);

    XColor color;
    if (XParseColor(display, colormap, options_.color.c_str(), &color) &&
        XAllocColor(display, colormap, &color)) {
        return color.pixel;
    }
    tether::util::Logger::warn("X11: Cannot allocate overlay color '" + options_.color + "', using black");
    return BlackPixel(display, screen);
}

bool X11Overlay::realize() {
    if (window_) return true;  // Already realized
    Display* display = display_.get();

    XSetWindowAttributes attributes{};
    attributes.override_redirect = True;  // no frame, never managed or reparented
    attributes.background_pixel = allocate_background();
    attributes.border_pixel = 0;
    attributes.event_mask = ExposureMask | StructureNotifyMask | VisibilityChangeMask;

    const model::Point origin = position_.value_or(model::Point{0, 0});

    X11ErrorTrap trap(display);
    Window window = XCreateWindow(display, display_.root(),
                                  origin.x, origin.y,
                                  static_cast<unsigned int>(options_.width),
                                  static_cast<unsigned int>(options_.height),
                                  0, CopyFromParent, InputOutput, CopyFromParent,
                                  CWOverrideRedirect | CWBackPixel | CWBorderPixel | CWEventMask,
                                  &attributes);
    if (trap.failed() || !window) {
        tether::util::Logger::error(std::format("X11: XCreateWindow failed (error {})", trap.error_code()));
        return false;
    }
    window_ = window;

    XStoreName(display, window_, options_.title.c_str());
    XChangeProperty(display, window_, display_.atom("_NET_WM_NAME"), display_.atom("UTF8_STRING"), 8,
                    PropModeReplace, reinterpret_cast<const unsigned char*>(options_.title.data()),
                    static_cast<int>(options_.title.size()));

    // Compositors honour the type even for unmanaged windows
    Atom type = display_.atom("_NET_WM_WINDOW_TYPE_NOTIFICATION");
    XChangeProperty(display, window_, display_.atom("_NET_WM_WINDOW_TYPE"), XA_ATOM, 32,
                    PropModeReplace, reinterpret_cast<unsigned char*>(&type), 1);

    tether::util::Logger::info(std::format("X11: Overlay realized as 0x{:08X} ({}x{})",
        window_, options_.width, options_.height));

    if (want_visible_) {
        XMapRaised(display, window_);
        mapped_ = true;
    }
    display_.flush();
    return true;
}

void X11Overlay::set_visible(bool visible) {
    want_visible_ = visible;
    if (!window_ || destroyed_) return;
    if (visible == mapped_) return;

    Display* display = display_.get();
    if (visible) {
        // Raise as well: override-redirect windows do not stay above by themselves
        XMapRaised(display, window_);
    } else {
        XUnmapWindow(display, window_);
    }
    mapped_ = visible;
    display_.flush();
}

void X11Overlay::move_to(int x, int y) {
    const model::Point target{x, y};
    if (position_ && *position_ == target) return;
    position_ = target;

    if (!window_ || destroyed_) return;
    XMoveWindow(display_.get(), window_, x, y);
    display_.flush();
}

std::optional<model::WindowHandle> X11Overlay::native_handle() {
    if (!window_ || destroyed_) return std::nullopt;
    return static_cast<model::WindowHandle>(window_);
}

void X11Overlay::process_events() {
    Display* display = display_.get();
    while (XPending(display) > 0) {
        XEvent event;
        XNextEvent(display, &event);

        switch (event.type) {
            case Expose:
                if (event.xexpose.count == 0) paint();
                break;
            case VisibilityNotify:
                // Unmanaged windows get buried when the WM raises a frame; climb back up
                if (mapped_ && event.xvisibility.state != VisibilityUnobscured) {
                    XRaiseWindow(display, window_);
                    display_.flush();
                }
                break;
            case DestroyNotify:
                if (event.xdestroywindow.window == window_) {
                    tether::util::Logger::warn("X11: Overlay window destroyed externally");
                    destroyed_ = true;
                    mapped_ = false;
                }
                break;
            default:
                break;
        }
    }
}

void X11Overlay::paint() {
    if (!window_ || destroyed_) return;
    // Background pixel does the drawing; just make sure it is current
    XClearWindow(display_.get(), window_);
    display_.flush();
}

}  // namespace tether::platform
