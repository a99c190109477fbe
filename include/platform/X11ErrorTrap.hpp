#pragma once

#include <X11/Xlib.h>

namespace tether::platform {

// Captures protocol errors (BadWindow on a destroyed XID, ...) raised while
// alive, instead of letting Xlib's default handler exit the process.
// Not reentrant: one trap at a time.
class X11ErrorTrap {
public:
    explicit X11ErrorTrap(Display* display);
    ~X11ErrorTrap();

    X11ErrorTrap(const X11ErrorTrap&) = delete;
    X11ErrorTrap& operator=(const X11ErrorTrap&) = delete;

    // Syncs with the server, then reports whether any request failed
    bool failed();
    int error_code() const;

private:
    Display* display_;
    XErrorHandler previous_;
};

}  // namespace tether::platform
