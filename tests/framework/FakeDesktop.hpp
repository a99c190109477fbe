#pragma once

#include "platform/OverlaySurface.hpp"
#include "platform/WindowSystem.hpp"
#include "util/UnicodeUtils.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tether::test {

// Scriptable desktop: windows appear, move, minimize and die on command.
// Destroyed windows fail every query, like a stale XID.
class FakeDesktop : public platform::WindowSystem {
public:
    struct Window {
        std::string title;
        model::Rect rect;
        bool visible = true;
        bool minimized = false;
        bool rect_fails = false;
    };

    void add_window(model::WindowHandle handle, const std::string& title,
                    model::Rect rect = {}, bool visible = true) {
        windows_[handle] = Window{title, rect, visible};
        order_.push_back(handle);
    }

    void destroy(model::WindowHandle handle) { windows_.erase(handle); }
    void move(model::WindowHandle handle, model::Rect rect) { windows_.at(handle).rect = rect; }
    void set_minimized(model::WindowHandle handle, bool minimized) { windows_.at(handle).minimized = minimized; }
    void set_rect_fails(model::WindowHandle handle, bool fails) { windows_.at(handle).rect_fails = fails; }
    void set_foreground(model::WindowHandle handle) { foreground_ = handle; }

    void fail_enumeration(bool fail) { enumeration_fails_ = fail; }
    void fail_foreground(bool fail) { foreground_fails_ = fail; }
    void throw_on_minimized(bool on) { throw_on_minimized_ = on; }

    int title_reads() const { return title_reads_; }

    bool enumerate_top_level_windows(const Visitor& visit) override {
        if (enumeration_fails_) return false;
        for (auto handle : order_) {
            if (!windows_.count(handle)) continue;
            if (!visit(handle)) break;
        }
        return true;
    }

    bool is_visible(model::WindowHandle handle) override {
        auto it = windows_.find(handle);
        return it != windows_.end() && it->second.visible;
    }

    std::optional<std::string> get_title(model::WindowHandle handle, std::size_t max_utf16_units) override {
        ++title_reads_;
        auto it = windows_.find(handle);
        if (it == windows_.end()) return std::nullopt;
        return util::truncate_utf16(it->second.title, max_utf16_units);
    }

    std::optional<model::Rect> get_rectangle(model::WindowHandle handle) override {
        auto it = windows_.find(handle);
        if (it == windows_.end() || it->second.rect_fails) return std::nullopt;
        return it->second.rect;
    }

    std::optional<model::WindowHandle> get_foreground_window() override {
        if (foreground_fails_) return std::nullopt;
        return foreground_;
    }

    std::optional<bool> is_minimized(model::WindowHandle handle) override {
        if (throw_on_minimized_) throw std::runtime_error("simulated query crash");
        auto it = windows_.find(handle);
        if (it == windows_.end()) return std::nullopt;
        return it->second.minimized;
    }

private:
    std::map<model::WindowHandle, Window> windows_;
    std::vector<model::WindowHandle> order_;
    model::WindowHandle foreground_ = 0;

    bool enumeration_fails_ = false;
    bool foreground_fails_ = false;
    bool throw_on_minimized_ = false;
    int title_reads_ = 0;
};

// Records every command the tracker sends
class FakeOverlay : public platform::OverlaySurface {
public:
    // Handle appears only after `realize_after` native_handle() calls
    explicit FakeOverlay(std::optional<model::WindowHandle> handle = std::nullopt, int realize_after = 0)
        : handle_(handle), realize_after_(realize_after) {}

    void set_visible(bool visible) override {
        visible_ = visible;
        if (visible) ++show_count; else ++hide_count;
    }

    void move_to(int x, int y) override {
        position = model::Point{x, y};
        ++move_count;
    }

    std::optional<model::WindowHandle> native_handle() override {
        ++handle_queries;
        if (handle_queries <= realize_after_) return std::nullopt;
        return handle_;
    }

    bool visible() const { return visible_; }

    int show_count = 0;
    int hide_count = 0;
    int move_count = 0;
    int handle_queries = 0;
    std::optional<model::Point> position;

private:
    std::optional<model::WindowHandle> handle_;
    int realize_after_ = 0;
    bool visible_ = true;  // toolkits typically start shown
};

}  // namespace tether::test
