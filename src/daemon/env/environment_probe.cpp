#include "env/environment_probe.hpp"

#include "env/os_release.hpp"
#include "env/wm_table.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::pair<std::string_view, DesktopEnv>, 26> DESKTOP_ALIASES = {{
    {"kde", DesktopEnv::Kde},
    {"plasma", DesktopEnv::Kde},
    {"plasmawayland", DesktopEnv::Kde},
    {"plasmax11", DesktopEnv::Kde},
    {"gnome", DesktopEnv::Gnome},
    {"gnome-classic", DesktopEnv::Gnome},
    {"gnome-xorg", DesktopEnv::Gnome},
    {"gnome-wayland", DesktopEnv::Gnome},
    {"cosmic", DesktopEnv::Cosmic},
    {"sway", DesktopEnv::Sway},
    {"hyprland", DesktopEnv::Hyprland},
    {"xfce", DesktopEnv::Xfce},
    {"xfce4", DesktopEnv::Xfce},
    {"x-cinnamon", DesktopEnv::Cinnamon},
    {"cinnamon", DesktopEnv::Cinnamon},
    {"lxqt", DesktopEnv::Lxqt},
    {"mate", DesktopEnv::Mate},
    {"budgie", DesktopEnv::Budgie},
    {"budgie-desktop", DesktopEnv::Budgie},
    {"pantheon", DesktopEnv::Pantheon},
    {"niri", DesktopEnv::Niri},
    {"wayfire", DesktopEnv::Wayfire},
    {"labwc", DesktopEnv::Labwc},
    {"river", DesktopEnv::River},
    {"miracle-wm", DesktopEnv::MiracleWm},
    {"miracle", DesktopEnv::MiracleWm},
}};

// "/usr/share/xsessions/plasma" -> "plasma"
std::string_view basename(std::string_view path) {
    auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

DesktopEnv desktop_from_name(std::string_view name) {
    auto lower = to_lower(basename(name));
    for (const auto& [alias, de] : DESKTOP_ALIASES) {
        if (alias == lower) return de;
    }
    return DesktopEnv::Unknown;
}

EnvironmentProbe::EnvironmentProbe(const SystemSource& source) : source_(source) {}

EnvironmentInfo EnvironmentProbe::detect(const PartialOverrides& overrides) const {
    EnvironmentInfo info;
    info.overrides = overrides;

    auto distro = detect_distro(source_);
    info.distro_id = std::move(distro.id);
    info.distro_version = std::move(distro.version);
    info.variant_id = std::move(distro.variant);

    info.session_type = detect_session();

    if (overrides.desktop_env) {
        info.desktop_env = desktop_from_name(*overrides.desktop_env);
    } else {
        info.desktop_env = detect_desktop();
    }

    if (overrides.window_manager) {
        info.window_manager = *overrides.window_manager;
    } else {
        info.window_manager = detect_wm(info);
    }

    return info;
}

SessionType EnvironmentProbe::detect_session() const {
    if (auto type = source_.env("XDG_SESSION_TYPE")) {
        auto st = parse_session_type(to_lower(*type));
        if (st != SessionType::Unknown) return st;
    }

    // "tty" or unset: fall back to whichever display the session exported.
    auto non_empty = [&](const char* name) {
        auto value = source_.env(name);
        return value && !value->empty();
    };
    if (non_empty("WAYLAND_DISPLAY")) return SessionType::Wayland;
    if (non_empty("DISPLAY")) return SessionType::X11;
    return SessionType::Unknown;
}

DesktopEnv EnvironmentProbe::detect_desktop() const {
    if (auto current = source_.env("XDG_CURRENT_DESKTOP")) {
        std::string_view rest = *current;
        while (!rest.empty()) {
            auto colon = rest.find(':');
            auto de = desktop_from_name(rest.substr(0, colon));
            if (de != DesktopEnv::Unknown) return de;
            if (colon == std::string_view::npos) break;
            rest.remove_prefix(colon + 1);
        }
    }

    for (const char* name : {"XDG_SESSION_DESKTOP", "DESKTOP_SESSION"}) {
        if (auto value = source_.env(name)) {
            auto de = desktop_from_name(*value);
            if (de != DesktopEnv::Unknown) return de;
        }
    }

    static constexpr std::array<std::pair<const char*, DesktopEnv>, 4> MARKERS = {{
        {"KDE_FULL_SESSION", DesktopEnv::Kde},
        {"GNOME_DESKTOP_SESSION_ID", DesktopEnv::Gnome},
        {"SWAYSOCK", DesktopEnv::Sway},
        {"HYPRLAND_INSTANCE_SIGNATURE", DesktopEnv::Hyprland},
    }};
    for (const auto& [name, de] : MARKERS) {
        if (source_.env(name)) return de;
    }

    return DesktopEnv::Unknown;
}

std::string EnvironmentProbe::detect_wm(const EnvironmentInfo& info) const {
    std::vector<std::string> comms;
    for (auto& proc : source_.processes()) {
        comms.push_back(std::move(proc.comm));
    }

    if (auto* wm = pick_match(match_exact(comms), info.desktop_env)) {
        return std::string(wm->canonical);
    }

    if (wraps_binaries(info.distro_id)) {
        if (auto* wm = pick_match(match_relaxed(comms), info.desktop_env)) {
            return std::string(wm->canonical);
        }
    }

    if (auto wm = wm_for_desktop(info.desktop_env, info.session_type)) {
        return *wm;
    }

    return std::string(WM_UNIDENTIFIED);
}
