#pragma once

#include "env/environment_info.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    // Same precedence class as WINCTX_DE_OVERRIDE / WINCTX_WM_OVERRIDE,
    // which win when both are set.
    PartialOverrides overrides;

    // Extra window manager or desktop names routed to the wlroots adapter.
    std::vector<std::string> wlroots_compositors;

    // Timeouts are capped at INT_MAX: libdbus and poll() take int milliseconds.
    struct Dbus {
        uint32_t call_timeout_ms = 2000;
    } dbus;

    struct Wayland {
        uint32_t roundtrip_timeout_ms = 2000;
    } wayland;

    struct Retry {
        uint32_t max_attempts = 5;
        uint32_t initial_delay_ms = 250;
        uint32_t max_delay_ms = 5000;
    } retry;

    struct Gnome {
        uint32_t poll_interval_ms = 250;
    } gnome;

    struct Kwin {
        std::string script_name = "winctx-kwin-focus";
        // main.js to (re)load. Empty: search the XDG data directories.
        std::string script_path;
    } kwin;

    static Config load(const std::string& path);
    static Config load_default();
};
