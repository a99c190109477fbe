#pragma once

#include "model/Geometry.hpp"
#include "platform/OverlaySurface.hpp"
#include "platform/WindowSystem.hpp"
#include <optional>
#include <string_view>

namespace tether::tracking {

// Visibility of the overlay as last commanded by the tracker
enum class OverlayState {
    Unknown,  // before the first tick; the surface's own state is not trusted
    Visible,
    Hidden,
};

// Why a tick decided the overlay should be shown or hidden
enum class Coverage {
    TargetForeground,   // shown
    OverlayForeground,  // shown
    NoTarget,
    TargetMinimized,
    OtherForeground,
    QueryFailed,
};

inline bool is_covered(Coverage coverage) {
    return coverage != Coverage::TargetForeground && coverage != Coverage::OverlayForeground;
}

std::string_view to_string(Coverage coverage);
std::string_view to_string(OverlayState state);

struct TickResult {
    Coverage coverage = Coverage::NoTarget;
    bool covered = true;
    bool visibility_changed = false;
    std::optional<model::Point> moved_to;  // empty when the target rect was unreadable
};

// Keeps one overlay glued to one target window by polling.
//
// Each tick:
//   1. decides whether the overlay is covered (fail-safe: any doubt hides it)
//   2. shows/hides the overlay only when that decision changes
//   3. moves the overlay to anchor_position(target rect, offset) if the rect
//      can be read, independent of step 1
// No exception leaves tick(); a destroyed target simply keeps the overlay
// hidden for the rest of the session.
class OverlayTracker {
public:
    OverlayTracker(platform::WindowSystem& windows,
                   platform::OverlaySurface& overlay,
                   std::optional<model::WindowHandle> target,
                   model::Offset offset);

    TickResult tick();

    // Step 1 on its own, no commands issued
    Coverage compute_coverage();

    OverlayState state() const { return state_; }
    const std::optional<model::Point>& last_position() const { return last_position_; }
    std::optional<model::WindowHandle> target() const { return target_; }
    model::Offset offset() const { return offset_; }
    std::optional<model::WindowHandle> overlay_handle() const { return overlay_handle_; }

private:
    void refresh_overlay_handle();
    void apply_visibility(bool covered, TickResult& result);
    void reposition(TickResult& result);

    platform::WindowSystem& windows_;
    platform::OverlaySurface& overlay_;
    const std::optional<model::WindowHandle> target_;
    const model::Offset offset_;

    // Lazily acquired; stable once known
    std::optional<model::WindowHandle> overlay_handle_;

    OverlayState state_ = OverlayState::Unknown;
    std::optional<model::Point> last_position_;

    // Only log a failure streak at its edges, not every tick
    bool rect_failing_ = false;
};

}  // namespace tether::tracking
