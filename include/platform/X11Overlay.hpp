#pragma once

#include "model/Geometry.hpp"
#include "platform/OverlaySurface.hpp"
#include "platform/X11Display.hpp"
#include <optional>
#include <string>

namespace tether::platform {

// Borderless, override-redirect window filled with a solid colour.
// Commands issued before realize() are remembered and applied on creation.
class X11Overlay : public OverlaySurface {
public:
    struct Options {
        int width = 170;
        int height = 25;
        std::string color = "#32373f";
        std::string title = "tether overlay";
    };

    X11Overlay(X11Display& display, Options options);
    ~X11Overlay() override;

    X11Overlay(const X11Overlay&) = delete;
    X11Overlay& operator=(const X11Overlay&) = delete;

    // Creates the native window. False if the server refused it.
    [[nodiscard]] bool realize();

    void set_visible(bool visible) override;
    void move_to(int x, int y) override;
    std::optional<model::WindowHandle> native_handle() override;

    // Drains pending X events (Expose, VisibilityNotify, DestroyNotify)
    void process_events();
    bool is_destroyed() const { return destroyed_; }

private:
    unsigned long allocate_background();
    void paint();

    X11Display& display_;
    Options options_;

    unsigned long window_ = 0;
    bool destroyed_ = false;

    bool want_visible_ = false;
    bool mapped_ = false;
    std::optional<model::Point> position_;
};

}  // namespace tether::platform
