#include "env/environment_info.hpp"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<DesktopEnv, std::string_view>, 17> DESKTOP_NAMES = {{
    {DesktopEnv::Kde, "kde"},
    {DesktopEnv::Gnome, "gnome"},
    {DesktopEnv::Cosmic, "cosmic"},
    {DesktopEnv::Sway, "sway"},
    {DesktopEnv::Hyprland, "hyprland"},
    {DesktopEnv::Xfce, "xfce"},
    {DesktopEnv::Cinnamon, "cinnamon"},
    {DesktopEnv::Lxqt, "lxqt"},
    {DesktopEnv::Mate, "mate"},
    {DesktopEnv::Budgie, "budgie"},
    {DesktopEnv::Pantheon, "pantheon"},
    {DesktopEnv::Niri, "niri"},
    {DesktopEnv::Wayfire, "wayfire"},
    {DesktopEnv::Labwc, "labwc"},
    {DesktopEnv::River, "river"},
    {DesktopEnv::MiracleWm, "miracle-wm"},
    {DesktopEnv::Unknown, "unknown"},
}};

} // namespace

std::string_view to_string(DesktopEnv de) {
    for (const auto& [value, name] : DESKTOP_NAMES) {
        if (value == de) return name;
    }
    return "unknown";
}

std::string_view to_string(SessionType st) {
    switch (st) {
        case SessionType::X11: return "x11";
        case SessionType::Wayland: return "wayland";
        case SessionType::Unknown: break;
    }
    return "unknown";
}

DesktopEnv parse_desktop_env(std::string_view name) {
    for (const auto& [value, known] : DESKTOP_NAMES) {
        if (known == name) return value;
    }
    return DesktopEnv::Unknown;
}

SessionType parse_session_type(std::string_view name) {
    if (name == "x11") return SessionType::X11;
    if (name == "wayland") return SessionType::Wayland;
    return SessionType::Unknown;
}

PartialOverrides PartialOverrides::over(const PartialOverrides& lower) const {
    PartialOverrides merged = lower;
    if (desktop_env) merged.desktop_env = desktop_env;
    if (window_manager) merged.window_manager = window_manager;
    return merged;
}

std::string EnvironmentInfo::desktop_name() const {
    if (overrides.desktop_env) return *overrides.desktop_env;
    return std::string(to_string(desktop_env));
}
