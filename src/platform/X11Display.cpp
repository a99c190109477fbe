#include "platform/X11Display.hpp"
#include "platform/X11ErrorTrap.hpp"
#include "util/Logger.hpp"
#include <X11/Xlib.h>
#include <format>

namespace tether::platform {

namespace {

// Error code seen by the active trap; 0 when none
int g_trapped_error = 0;

int trap_handler(Display*, XErrorEvent* event) {
    g_trapped_error = event->error_code;
    return 0;
}

// Outside a trap: log and carry on rather than exit
int logging_handler(Display* display, XErrorEvent* event) {
    char text[256] = {};
    XGetErrorText(display, event->error_code, text, sizeof(text));
    tether::util::Logger::debug(std::format("X11: Untrapped error {} (request {}, resource 0x{:X}): {}",
        static_cast<int>(event->error_code), static_cast<int>(event->request_code),
        event->resourceid, text));
    return 0;
}

}  // namespace

X11ErrorTrap::X11ErrorTrap(Display* display)
    : display_(display) {
    // Errors from earlier requests belong to whoever issued them
    XSync(display_, False);
    g_trapped_error = 0;
    previous_ = XSetErrorHandler(trap_handler);
}

X11ErrorTrap::~X11ErrorTrap() {
    XSync(display_, False);
    XSetErrorHandler(previous_);
}

bool X11ErrorTrap::failed() {
    XSync(display_, False);
    return g_trapped_error != 0;
}

int X11ErrorTrap::error_code() const {
    return g_trapped_error;
}

X11Display::X11Display() {}

X11Display::~X11Display() {
    if (display_) {
        XCloseDisplay(display_);
        display_ = nullptr;
    }
}

bool X11Display::open(const std::string& name) {
    if (display_) return true;  // Already open

    display_ = XOpenDisplay(name.empty() ? nullptr : name.c_str());
    if (!display_) {
        tether::util::Logger::error("X11: Failed to open display '" + name + "'");
        return false;
    }

    XSetErrorHandler(logging_handler);
    tether::util::Logger::info(std::format("X11: Connected to {} (screen {})",
        DisplayString(display_), DefaultScreen(display_)));
    return true;
}

unsigned long X11Display::root() const {
    return DefaultRootWindow(display_);
}

int X11Display::connection_fd() const {
    return ConnectionNumber(display_);
}

unsigned long X11Display::atom(const std::string& name) {
    auto it = atoms_.find(name);
    if (it != atoms_.end()) return it->second;

    Atom value = XInternAtom(display_, name.c_str(), False);
    atoms_.emplace(name, value);
    return value;
}

void X11Display::flush() {
    XFlush(display_);
}

}  // namespace tether::platform
