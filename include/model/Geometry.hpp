#pragma once

#include <cstdint>

namespace tether::model {

// Opaque OS window identifier (an X11 XID). Zero never names a window.
using WindowHandle = std::uint64_t;

// Absolute desktop pixel coordinates, right >= left and bottom >= top.
struct Rect {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }

    bool operator==(const Rect&) const = default;
};

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point&) const = default;
};

// Anchor of the overlay relative to the target's top-right corner
struct Offset {
    int dx = 0;
    int dy = 0;

    bool operator==(const Offset&) const = default;
};

}  // namespace tether::model
