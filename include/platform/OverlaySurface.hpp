#pragma once

#include "model/Geometry.hpp"
#include <optional>

namespace tether::platform {

// The drawable the tracker drives. Content rendering is the surface's business.
class OverlaySurface {
public:
    virtual ~OverlaySurface() = default;

    virtual void set_visible(bool visible) = 0;
    virtual void move_to(int x, int y) = 0;

    // Absent until the surface has been realized by the toolkit
    virtual std::optional<model::WindowHandle> native_handle() = 0;
};

}  // namespace tether::platform
