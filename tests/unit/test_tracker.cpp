#include "../framework/SimpleTest.hpp"
#include "../framework/FakeDesktop.hpp"
#include "tracking/OverlayTracker.hpp"

using namespace tether;
using tether::test::FakeDesktop;
using tether::test::FakeOverlay;
using tether::tracking::Coverage;
using tether::tracking::OverlayState;
using tether::tracking::OverlayTracker;

namespace {

constexpr model::WindowHandle TARGET = 0x100;
constexpr model::WindowHandle OVERLAY = 0x200;
constexpr model::WindowHandle OTHER = 0x300;

const model::Rect TARGET_RECT{100, 50, 300, 400};
const model::Offset OFFSET{-617, 7};

void setup_desktop(FakeDesktop& desktop) {
    desktop.add_window(TARGET, "Steam", TARGET_RECT);
    desktop.add_window(OTHER, "Terminal", {0, 0, 800, 600});
    desktop.set_foreground(TARGET);
}

}  // namespace

TEST_CASE(test_absent_target_is_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, std::nullopt, OFFSET);

    auto result = tracker.tick();
    ASSERT_TRUE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::NoTarget);
    ASSERT_FALSE(result.moved_to.has_value());
    ASSERT_FALSE(overlay.visible());
}

TEST_CASE(test_zero_handle_counts_as_absent) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, model::WindowHandle{0}, OFFSET);

    ASSERT_FALSE(tracker.target().has_value());
    ASSERT_TRUE(tracker.tick().covered);
}

TEST_CASE(test_destroyed_target_is_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.destroy(TARGET);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_TRUE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::QueryFailed);
}

TEST_CASE(test_minimized_target_is_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.set_minimized(TARGET, true);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    // Minimized wins even while the target holds the foreground
    auto result = tracker.tick();
    ASSERT_TRUE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::TargetMinimized);
}

TEST_CASE(test_other_foreground_is_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.set_foreground(OTHER);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_TRUE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::OtherForeground);
}

TEST_CASE(test_no_foreground_window_is_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.set_foreground(0);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    ASSERT_TRUE(tracker.tick().covered);
}

TEST_CASE(test_foreground_query_failure_is_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.fail_foreground(true);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_TRUE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::QueryFailed);
    // Position is a separate failure domain
    ASSERT_TRUE(result.moved_to.has_value());
}

TEST_CASE(test_target_foreground_is_not_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_FALSE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::TargetForeground);
}

TEST_CASE(test_overlay_foreground_is_not_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.set_foreground(OVERLAY);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_FALSE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::OverlayForeground);
}

TEST_CASE(test_overlay_foreground_before_realize_is_covered) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.set_foreground(OVERLAY);
    // Handle shows up on the third query
    FakeOverlay overlay(OVERLAY, 2);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    ASSERT_TRUE(tracker.tick().covered);
    ASSERT_TRUE(tracker.tick().covered);
    ASSERT_FALSE(tracker.tick().covered);
    ASSERT_TRUE(tracker.overlay_handle().has_value());
}

TEST_CASE(test_overlay_handle_is_queried_until_known) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY, 1);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    for (int i = 0; i < 5; ++i) tracker.tick();
    ASSERT_EQ(overlay.handle_queries, 2);
    ASSERT_EQ(*tracker.overlay_handle(), OVERLAY);
}

TEST_CASE(test_first_tick_forces_state) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    ASSERT_TRUE(tracker.state() == OverlayState::Unknown);
    auto result = tracker.tick();
    // The surface already looked visible; the tracker still commands it once
    ASSERT_TRUE(result.visibility_changed);
    ASSERT_EQ(overlay.show_count, 1);
    ASSERT_TRUE(tracker.state() == OverlayState::Visible);
}

TEST_CASE(test_repeated_ticks_issue_no_visibility_commands) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    for (int i = 0; i < 10; ++i) tracker.tick();
    ASSERT_EQ(overlay.show_count, 1);
    ASSERT_EQ(overlay.hide_count, 0);

    desktop.set_foreground(OTHER);
    for (int i = 0; i < 10; ++i) tracker.tick();
    ASSERT_EQ(overlay.show_count, 1);
    ASSERT_EQ(overlay.hide_count, 1);
    ASSERT_TRUE(tracker.state() == OverlayState::Hidden);
}

TEST_CASE(test_position_formula) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_TRUE(result.moved_to.has_value());
    ASSERT_EQ(result.moved_to->x, -317);
    ASSERT_EQ(result.moved_to->y, 57);
    ASSERT_TRUE(overlay.position == (model::Point{-317, 57}));
}

TEST_CASE(test_position_follows_moving_target) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, {10, -5});

    tracker.tick();
    desktop.move(TARGET, {400, 200, 900, 700});
    tracker.tick();
    ASSERT_TRUE(overlay.position == (model::Point{910, 195}));
}

TEST_CASE(test_position_updates_while_hidden) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.set_foreground(OTHER);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_TRUE(result.covered);
    ASSERT_TRUE(result.moved_to.has_value());
}

TEST_CASE(test_rect_failure_keeps_position_and_visibility) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    tracker.tick();
    ASSERT_EQ(overlay.move_count, 1);

    desktop.set_rect_fails(TARGET, true);
    auto result = tracker.tick();
    ASSERT_FALSE(result.moved_to.has_value());
    ASSERT_FALSE(result.covered);
    ASSERT_EQ(overlay.move_count, 1);
    ASSERT_TRUE(overlay.position == (model::Point{-317, 57}));
    ASSERT_TRUE(*tracker.last_position() == (model::Point{-317, 57}));
    ASSERT_TRUE(tracker.state() == OverlayState::Visible);

    desktop.set_rect_fails(TARGET, false);
    ASSERT_TRUE(tracker.tick().moved_to.has_value());
    ASSERT_EQ(overlay.move_count, 2);
}

TEST_CASE(test_throwing_query_does_not_escape_tick) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    desktop.throw_on_minimized(true);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    auto result = tracker.tick();
    ASSERT_TRUE(result.covered);
    ASSERT_TRUE(result.coverage == Coverage::QueryFailed);
    // The rectangle query is independent and still succeeds
    ASSERT_TRUE(result.moved_to.has_value());
}

TEST_CASE(test_compute_coverage_issues_no_commands) {
    FakeDesktop desktop;
    setup_desktop(desktop);
    FakeOverlay overlay(OVERLAY);
    OverlayTracker tracker(desktop, overlay, TARGET, OFFSET);

    ASSERT_TRUE(tracker.compute_coverage() == Coverage::TargetForeground);
    ASSERT_EQ(overlay.show_count + overlay.hide_count + overlay.move_count, 0);
}

int main(int argc, char** argv) {
    return tether::test::TestRunner::instance().run_all("TRACKER TESTS", argc, argv);
}
