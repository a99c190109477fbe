#pragma once

#include <string>
#include <unordered_map>

// Keep Xlib's macros (None, Bool, Status...) out of every includer
typedef struct _XDisplay Display;

namespace tether::platform {

// Owns the X connection shared by the window system and the overlay.
// Single-threaded: use only from the thread that runs the tracker.
class X11Display {
public:
    X11Display();
    ~X11Display();

    X11Display(const X11Display&) = delete;
    X11Display& operator=(const X11Display&) = delete;

    // name: display string, empty for $DISPLAY
    [[nodiscard]] bool open(const std::string& name = "");
    bool is_open() const { return display_ != nullptr; }

    Display* get() const { return display_; }
    unsigned long root() const;
    int connection_fd() const;

    // Interned once, then cached
    unsigned long atom(const std::string& name);

    void flush();

private:
    Display* display_ = nullptr;
    std::unordered_map<std::string, unsigned long> atoms_;
};

}  // namespace tether::platform
