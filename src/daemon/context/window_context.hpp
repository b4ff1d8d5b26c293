#pragma once

#include <chrono>
#include <string>

struct WindowContext {
    std::string app_id;          // Wayland app_id or X11 WM_CLASS instance (e.g. "kitty")
    std::string app_class;       // X11 WM_CLASS class or its Wayland equivalent (e.g. "Firefox")
    std::string window_title;    // may be empty
    std::chrono::steady_clock::time_point observed_at{};  // time of the focus event, not of relay
    std::string source_adapter;  // diagnostics only

    // Same window as far as a consumer can tell. Timestamps and source are ignored.
    bool same_window(const WindowContext& other) const {
        return app_id == other.app_id && app_class == other.app_class &&
               window_title == other.window_title;
    }
};
