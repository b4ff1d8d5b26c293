#include "env/wm_table.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::array<KnownWm, 26> KNOWN_WMS = {{
    {"gnome-shell", "gnome-shell", DesktopEnv::Gnome},
    {"mutter", "gnome-shell", DesktopEnv::Gnome},
    {"kwin_wayland", "kwin_wayland", DesktopEnv::Kde},
    {"kwin_wayland_wrapper", "kwin_wayland", DesktopEnv::Kde},
    {"kwin_x11", "kwin_x11", DesktopEnv::Kde},
    {"cosmic-comp", "cosmic-comp", DesktopEnv::Cosmic},
    {"sway", "sway", DesktopEnv::Sway},
    {"Hyprland", "hyprland", DesktopEnv::Hyprland},
    {"xfwm4", "xfwm4", DesktopEnv::Xfce},
    {"cinnamon", "muffin", DesktopEnv::Cinnamon},
    {"muffin", "muffin", DesktopEnv::Cinnamon},
    {"marco", "marco", DesktopEnv::Mate},
    {"budgie-wm", "budgie-wm", DesktopEnv::Budgie},
    {"gala", "gala", DesktopEnv::Pantheon},
    {"niri", "niri", DesktopEnv::Niri},
    {"wayfire", "wayfire", DesktopEnv::Wayfire},
    {"labwc", "labwc", DesktopEnv::Labwc},
    {"river", "river", DesktopEnv::River},
    {"miracle-wm", "miracle-wm", DesktopEnv::MiracleWm},
    {"miriway-shell", "miriway", DesktopEnv::Unknown},
    {"dwl", "dwl", DesktopEnv::Unknown},
    {"hikari", "hikari", DesktopEnv::Unknown},
    {"openbox", "openbox", DesktopEnv::Unknown},
    {"qtile", "qtile", DesktopEnv::Unknown},
    {"i3", "i3", DesktopEnv::Unknown},
    {"awesome", "awesome", DesktopEnv::Unknown},
}};

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::span<const KnownWm> known_window_managers() {
    return KNOWN_WMS;
}

std::string canonical_wm_name(std::string_view name) {
    for (const auto& wm : KNOWN_WMS) {
        if (wm.process == name || wm.canonical == name) return std::string(wm.canonical);
    }
    // Case variants such as "HYPRLAND" or "Mutter" from hand-written overrides.
    auto lower = to_lower(name);
    for (const auto& wm : KNOWN_WMS) {
        if (to_lower(wm.process) == lower || wm.canonical == lower) return std::string(wm.canonical);
    }
    return std::string(name);
}

std::optional<std::string> wm_for_desktop(DesktopEnv de, SessionType session) {
    switch (de) {
        case DesktopEnv::Gnome: return "gnome-shell";
        case DesktopEnv::Kde:
            if (session == SessionType::Wayland) return "kwin_wayland";
            if (session == SessionType::X11) return "kwin_x11";
            return std::nullopt;
        case DesktopEnv::Cosmic: return "cosmic-comp";
        case DesktopEnv::Sway: return "sway";
        case DesktopEnv::Hyprland: return "hyprland";
        case DesktopEnv::Xfce: return "xfwm4";
        case DesktopEnv::Cinnamon: return "muffin";
        case DesktopEnv::Mate: return "marco";
        case DesktopEnv::Budgie: return "budgie-wm";
        case DesktopEnv::Pantheon: return "gala";
        case DesktopEnv::Niri: return "niri";
        case DesktopEnv::Wayfire: return "wayfire";
        case DesktopEnv::Labwc: return "labwc";
        case DesktopEnv::River: return "river";
        case DesktopEnv::MiracleWm: return "miracle-wm";
        case DesktopEnv::Lxqt:
        case DesktopEnv::Unknown:
            break;
    }
    return std::nullopt;
}

std::vector<const KnownWm*> match_exact(const std::vector<std::string>& comms) {
    std::vector<const KnownWm*> matches;
    for (const auto& wm : KNOWN_WMS) {
        auto truncated = wm.process.substr(0, COMM_MAX);
        bool found = std::any_of(comms.begin(), comms.end(),
                                 [&](const std::string& comm) { return comm == truncated; });
        if (found) matches.push_back(&wm);
    }
    return matches;
}

std::vector<const KnownWm*> match_relaxed(const std::vector<std::string>& comms) {
    std::vector<std::string> lowered;
    for (const auto& comm : comms) {
        if (comm.size() <= COMM_MAX) lowered.push_back(to_lower(comm));
    }

    std::vector<const KnownWm*> matches;
    for (const auto& wm : KNOWN_WMS) {
        auto needle = to_lower(wm.process.substr(0, COMM_MAX));
        bool found = std::any_of(lowered.begin(), lowered.end(), [&](const std::string& comm) {
            return comm.find(needle) != std::string::npos;
        });
        if (found) matches.push_back(&wm);
    }
    return matches;
}

const KnownWm* pick_match(const std::vector<const KnownWm*>& matches, DesktopEnv de) {
    if (matches.empty()) return nullptr;
    if (de != DesktopEnv::Unknown) {
        for (auto* wm : matches) {
            if (wm->desktop == de) return wm;
        }
    }
    return matches.front();
}
