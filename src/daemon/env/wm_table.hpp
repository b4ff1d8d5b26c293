#pragma once

#include "env/environment_info.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Kernel TASK_COMM_LEN is 16 including the terminator.
inline constexpr size_t COMM_MAX = 15;

struct KnownWm {
    std::string_view process;    // binary name as launched
    std::string_view canonical;  // logical name used everywhere downstream
    DesktopEnv desktop;          // desktop that ships it, Unknown for standalone WMs
};

std::span<const KnownWm> known_window_managers();

// Map synonyms (mutter, kwin_wayland_wrapper, Hyprland, cinnamon, ...) to one
// logical name. Unknown names pass through unchanged; idempotent.
std::string canonical_wm_name(std::string_view name);

// The WM a desktop normally runs, used when no process matched.
// nullopt when the desktop has none or it depends on an unknown session type.
std::optional<std::string> wm_for_desktop(DesktopEnv de, SessionType session);

// Exact comparison against each process's comm, respecting truncation to
// COMM_MAX characters. Returns every matching table entry in table order.
std::vector<const KnownWm*> match_exact(const std::vector<std::string>& comms);

// Case-insensitive substring comparison, for wrapper-launched binaries whose
// comm carries a prefix or suffix (".sway-wrapped", "Hyprland-wrapp").
std::vector<const KnownWm*> match_relaxed(const std::vector<std::string>& comms);

// Choose among several matches: the entry belonging to `de` first, then table order.
const KnownWm* pick_match(const std::vector<const KnownWm*>& matches, DesktopEnv de);
