#include "config/CommandLine.hpp"
#include "config/Config.hpp"
#include "events/Scheduler.hpp"
#include "platform/X11Display.hpp"
#include "platform/X11Overlay.hpp"
#include "platform/X11WindowSystem.hpp"
#include "tracking/Anchor.hpp"
#include "tracking/OverlayTracker.hpp"
#include "tracking/WindowLocator.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <clocale>
#include <csignal>
#include <cstring>
#include <format>
#include <iostream>
#include <poll.h>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

constexpr const char* TRACKER_TASK = "overlay-tracker";

// Global shutdown flag, polled by the main loop
std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true);
}

int list_windows(tether::platform::WindowSystem& windows) {
    tether::tracking::WindowLocator locator(windows);
    for (const auto& entry : locator.list_visible_windows()) {
        std::cout << std::format("0x{:08X}  {}\n", entry.handle, entry.title);
    }
    return 0;
}

int calibrate(tether::platform::WindowSystem& windows, tether::model::WindowHandle target,
              const std::string& overlay_title) {
    tether::tracking::WindowLocator locator(windows);
    auto overlay = locator.find_window_by_exact_title(overlay_title);
    if (!overlay) {
        std::cerr << "[!] Window '" << overlay_title << "' not found" << std::endl;
        return 1;
    }

    auto target_rect = windows.get_rectangle(target);
    auto overlay_rect = windows.get_rectangle(*overlay);
    if (!target_rect || !overlay_rect) {
        std::cerr << "[!] Could not read window geometry" << std::endl;
        return 1;
    }

    auto offset = tether::tracking::anchor_offset(*target_rect, *overlay_rect);
    tether::util::Logger::info(std::format("Main: Calibrated offset ({}, {})", offset.dx, offset.dy));
    std::cout << std::format("Offset from target's top-right corner: ({}, {})\n", offset.dx, offset.dy);
    std::cout << std::format("[target]\noffset_x = {}\noffset_y = {}\n", offset.dx, offset.dy);
    return 0;
}

int run_tracking(tether::platform::X11Display& display, tether::platform::WindowSystem& windows,
                 tether::model::WindowHandle target, const tether::config::Config& config) {
    tether::platform::X11Overlay overlay(display, {
        .width = config.overlay_width,
        .height = config.overlay_height,
        .color = config.overlay_color,
    });
    if (!overlay.realize()) {
        std::cerr << "[!] Could not create the overlay window" << std::endl;
        return 1;
    }

    tether::tracking::OverlayTracker tracker(windows, overlay, target, config.offset);

    tether::events::Scheduler scheduler;
    scheduler.schedule(TRACKER_TASK, std::chrono::milliseconds(config.poll_interval_ms),
        [&tracker]() { tracker.tick(); });

    // First tick right away so the overlay never shows in the wrong state
    tracker.tick();

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // kill command

    tether::util::Logger::info(std::format("Main: Tracking every {}ms with offset ({}, {})",
        config.poll_interval_ms, config.offset.dx, config.offset.dy));

    pollfd pfd{display.connection_fd(), POLLIN, 0};
    while (!g_shutdown.load()) {
        overlay.process_events();
        if (overlay.is_destroyed()) {
            // No tick may run against a disposed surface
            scheduler.unschedule(TRACKER_TASK);
            break;
        }

        scheduler.process();

        auto wait = scheduler.time_until_next(tether::events::Scheduler::Clock::now(), 100ms);
        int ready = poll(&pfd, 1, static_cast<int>(wait.count()));
        if (ready < 0 && errno != EINTR) {
            tether::util::Logger::error("Main: poll failed: " + std::string(std::strerror(errno)));
            break;
        }
    }

    scheduler.unschedule(TRACKER_TASK);
    tether::util::Logger::info("Main: Tracking stopped");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        tether::util::Logger::init();
        tether::util::Logger::info("tether starting...");

        auto cli = tether::config::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
        if (!cli.error.empty()) {
            std::cerr << "tether: " << cli.error << "\n\n" << tether::config::usage_text();
            return 2;
        }
        if (cli.mode == tether::config::RunMode::Help) {
            std::cout << tether::config::usage_text();
            return 0;
        }

        auto config = cli.config_path
            ? tether::config::ConfigLoader::load_from_file(*cli.config_path)
            : tether::config::ConfigLoader::load_config();
        tether::config::apply_overrides(config, cli);

        // Switch to the configured log file and level
        tether::util::Logger::init(config.log_file);
        tether::util::Logger::Level level = tether::util::Logger::Level::Debug;
        if (tether::util::Logger::parse_level(config.log_level, level)) {
            tether::util::Logger::set_level(level);
        } else {
            tether::util::Logger::warn("Main: Unknown log level '" + config.log_level + "', keeping debug");
        }
        tether::util::Logger::info("Configuration loaded");

        if (cli.mode == tether::config::RunMode::WriteConfig) {
            auto path = cli.config_path.value_or(tether::util::Platform::get_config_file());
            if (!tether::config::ConfigLoader::save_config(config, path)) {
                std::cerr << "[!] Could not write " << path.string() << std::endl;
                return 1;
            }
            std::cout << "Wrote " << path.string() << std::endl;
            return 0;
        }

        // Xlib converts legacy window titles through the current locale
        std::setlocale(LC_CTYPE, "");

        tether::platform::X11Display display;
        if (!display.open(tether::util::Platform::get_display_name())) {
            std::cerr << "[!] Cannot connect to the X server (is DISPLAY set?)" << std::endl;
            return 1;
        }
        tether::platform::X11WindowSystem windows(display);

        if (cli.mode == tether::config::RunMode::List) {
            return list_windows(windows);
        }

        // Located once; a target closed later is never re-acquired
        auto target = tether::tracking::locate_target(windows, config.target_title, std::cout, std::cerr);
        if (!target) {
            return 1;
        }

        if (cli.mode == tether::config::RunMode::Calibrate) {
            return calibrate(windows, *target, cli.calibrate_title);
        }

        return run_tracking(display, windows, *target, config);

    } catch (const std::exception& e) {
        tether::util::Logger::error("Main: Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
