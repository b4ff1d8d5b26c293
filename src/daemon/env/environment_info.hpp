#pragma once

#include <optional>
#include <string>
#include <string_view>

enum class DesktopEnv {
    Kde,
    Gnome,
    Cosmic,
    Sway,
    Hyprland,
    Xfce,
    Cinnamon,
    Lxqt,
    Mate,
    Budgie,
    Pantheon,
    Niri,
    Wayfire,
    Labwc,
    River,
    MiracleWm,
    Unknown,
};

enum class SessionType { X11, Wayland, Unknown };

// Placeholder used instead of an empty window manager name when no
// detection method succeeded. Consumers must treat it as a hard failure.
inline constexpr std::string_view WM_UNIDENTIFIED = "WM_unidentified_by_logic";

std::string_view to_string(DesktopEnv de);
std::string_view to_string(SessionType st);

// Lower-case name as printed by to_string(). Unrecognized names map to Unknown.
DesktopEnv parse_desktop_env(std::string_view name);
SessionType parse_session_type(std::string_view name);

// Explicit values that bypass detection for one field each.
struct PartialOverrides {
    std::optional<std::string> desktop_env;
    std::optional<std::string> window_manager;

    bool empty() const { return !desktop_env && !window_manager; }

    // Fields set here win; unset fields fall through to `lower`.
    PartialOverrides over(const PartialOverrides& lower) const;
};

struct EnvironmentInfo {
    std::string distro_id;
    std::string distro_version;
    std::string variant_id;
    DesktopEnv desktop_env = DesktopEnv::Unknown;
    SessionType session_type = SessionType::Unknown;
    std::string window_manager{WM_UNIDENTIFIED};
    PartialOverrides overrides;

    bool wm_identified() const { return window_manager != WM_UNIDENTIFIED; }

    // Name of the desktop as given: the override verbatim when one is set,
    // otherwise to_string(desktop_env).
    std::string desktop_name() const;
};
