#include "tracking/OverlayTracker.hpp"
#include "tracking/Anchor.hpp"
#include "util/Logger.hpp"
#include <exception>
#include <format>

namespace tether::tracking {

std::string_view to_string(Coverage coverage) {
    switch (coverage) {
        case Coverage::TargetForeground:  return "target in foreground";
        case Coverage::OverlayForeground: return "overlay in foreground";
        case Coverage::NoTarget:          return "no target window";
        case Coverage::TargetMinimized:   return "target minimized";
        case Coverage::OtherForeground:   return "another window in foreground";
        case Coverage::QueryFailed:       return "window query failed";
    }
    return "unknown";
}

std::string_view to_string(OverlayState state) {
    switch (state) {
        case OverlayState::Unknown: return "unknown";
        case OverlayState::Visible: return "visible";
        case OverlayState::Hidden:  return "hidden";
    }
    return "unknown";
}

OverlayTracker::OverlayTracker(platform::WindowSystem& windows,
                               platform::OverlaySurface& overlay,
                               std::optional<model::WindowHandle> target,
                               model::Offset offset)
    : windows_(windows),
      overlay_(overlay),
      target_(target && *target != 0 ? target : std::nullopt),
      offset_(offset) {}

TickResult OverlayTracker::tick() {
    TickResult result;

    refresh_overlay_handle();

    result.coverage = compute_coverage();
    result.covered = is_covered(result.coverage);

    // Visibility before position within one tick
    apply_visibility(result.covered, result);
    reposition(result);

    return result;
}

void OverlayTracker::refresh_overlay_handle() {
    if (overlay_handle_) return;

    try {
        auto handle = overlay_.native_handle();
        if (handle && *handle != 0) {
            overlay_handle_ = handle;
            tether::util::Logger::debug(std::format("Tracker: Overlay realized as 0x{:08X}", *handle));
        }
    } catch (const std::exception& e) {
        tether::util::Logger::debug("Tracker: Overlay handle not available yet: " + std::string(e.what()));
    }
}

Coverage OverlayTracker::compute_coverage() {
    if (!target_) {
        return Coverage::NoTarget;
    }

    try {
        auto minimized = windows_.is_minimized(*target_);
        if (!minimized) {
            return Coverage::QueryFailed;
        }
        if (*minimized) {
            return Coverage::TargetMinimized;
        }

        auto foreground = windows_.get_foreground_window();
        if (!foreground) {
            return Coverage::QueryFailed;
        }
        if (*foreground == *target_) {
            return Coverage::TargetForeground;
        }
        // Focusing the overlay itself must not hide it
        if (overlay_handle_ && *foreground == *overlay_handle_) {
            return Coverage::OverlayForeground;
        }
        return Coverage::OtherForeground;
    } catch (const std::exception& e) {
        tether::util::Logger::debug("Tracker: Coverage query threw: " + std::string(e.what()));
        return Coverage::QueryFailed;
    }
}

void OverlayTracker::apply_visibility(bool covered, TickResult& result) {
    const OverlayState wanted = covered ? OverlayState::Hidden : OverlayState::Visible;
    if (state_ == wanted) {
        return;
    }

    try {
        overlay_.set_visible(!covered);
    } catch (const std::exception& e) {
        // State stays as it was so the command is retried next tick
        tether::util::Logger::warn("Tracker: set_visible failed: " + std::string(e.what()));
        return;
    }

    tether::util::Logger::info(std::format("Tracker: Overlay {} -> {} ({})",
        to_string(state_), to_string(wanted), to_string(result.coverage)));
    state_ = wanted;
    result.visibility_changed = true;
}

void OverlayTracker::reposition(TickResult& result) {
    if (!target_) return;

    std::optional<model::Rect> rect;
    try {
        rect = windows_.get_rectangle(*target_);
    } catch (const std::exception& e) {
        tether::util::Logger::debug("Tracker: Rectangle query threw: " + std::string(e.what()));
    }

    if (!rect) {
        if (!rect_failing_) {
            tether::util::Logger::debug("Tracker: Target rectangle unreadable, holding last position");
            rect_failing_ = true;
        }
        return;
    }
    if (rect_failing_) {
        tether::util::Logger::debug("Tracker: Target rectangle readable again");
        rect_failing_ = false;
    }

    const model::Point position = anchor_position(*rect, offset_);
    try {
        overlay_.move_to(position.x, position.y);
    } catch (const std::exception& e) {
        tether::util::Logger::warn("Tracker: move_to failed: " + std::string(e.what()));
        return;
    }
    last_position_ = position;
    result.moved_to = position;
}

}  // namespace tether::tracking
