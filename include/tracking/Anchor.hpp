#pragma once

#include "model/Geometry.hpp"

namespace tether::tracking {

// Where the overlay's top-left goes for a given target rectangle:
// (target.right + dx, target.top + dy)
inline model::Point anchor_position(const model::Rect& target, const model::Offset& offset) {
    return {target.right + offset.dx, target.top + offset.dy};
}

// Inverse of anchor_position: the offset that keeps an overlay currently at
// overlay.left/overlay.top where it is. Used by --calibrate.
inline model::Offset anchor_offset(const model::Rect& target, const model::Rect& overlay) {
    return {overlay.left - target.right, overlay.top - target.top};
}

}  // namespace tether::tracking
