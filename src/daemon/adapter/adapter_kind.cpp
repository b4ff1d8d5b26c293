#include "adapter/adapter_kind.hpp"

#include "env/wm_table.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace {

constexpr std::array<std::string_view, 12> WLROOTS_COMPOSITORS = {
    "sway", "hyprland", "labwc", "niri", "river", "wayfire",
    "miracle-wm", "qtile", "miriway", "dwl", "cage", "hikari",
};

// Run under X11 only; served by the in-process X11 adapter.
constexpr std::array<std::string_view, 9> X11_WINDOW_MANAGERS = {
    "kwin_x11", "xfwm4", "muffin", "marco", "budgie-wm", "gala", "openbox", "i3", "awesome",
};

std::string_view family(AdapterKind kind) {
    switch (kind) {
        case AdapterKind::X11: return "X11";
        case AdapterKind::GnomeExtension: return "Gnome";
        case AdapterKind::Kwin: return "Kwin";
        case AdapterKind::Cosmic: return "Cosmic";
        case AdapterKind::Wlroots: return "Wlroots";
    }
    return "";
}

} // namespace

std::string_view to_string(AdapterKind kind) {
    switch (kind) {
        case AdapterKind::X11: return "x11";
        case AdapterKind::GnomeExtension: return "gnome";
        case AdapterKind::Kwin: return "kwin";
        case AdapterKind::Cosmic: return "cosmic";
        case AdapterKind::Wlroots: return "wlroots";
    }
    return "unknown";
}

std::optional<AdapterKind> parse_adapter_kind(std::string_view name) {
    for (auto kind : {AdapterKind::X11, AdapterKind::GnomeExtension, AdapterKind::Kwin,
                      AdapterKind::Cosmic, AdapterKind::Wlroots}) {
        if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
}

BusIdentity bus_identity(AdapterKind kind) {
    if (kind == AdapterKind::X11) return {};
    auto name = std::format("org.winctx.{}", family(kind));
    return {
        .name = name,
        .path = std::format("/org/winctx/{}", family(kind)),
        .interface = name,
    };
}

std::string_view expected_backend(AdapterKind kind) {
    switch (kind) {
        case AdapterKind::X11:
            return "X11 display with EWMH _NET_ACTIVE_WINDOW";
        case AdapterKind::GnomeExtension:
            return "GNOME Shell extension focused-window-dbus@flexagoon.com";
        case AdapterKind::Kwin:
            return "KWin script reporting to org.winctx.Kwin";
        case AdapterKind::Cosmic:
            return "COSMIC zcosmic_toplevel_info_v1 protocol";
        case AdapterKind::Wlroots:
            return "wlroots zwlr_foreign_toplevel_manager_v1 protocol";
    }
    return "unknown backend";
}

bool is_wlroots_compositor(std::string_view wm, const std::vector<std::string>& extra) {
    if (std::find(WLROOTS_COMPOSITORS.begin(), WLROOTS_COMPOSITORS.end(), wm) !=
        WLROOTS_COMPOSITORS.end()) {
        return true;
    }
    return std::find(extra.begin(), extra.end(), wm) != extra.end();
}

std::optional<AdapterKind> select_adapter(const EnvironmentInfo& env,
                                          const std::vector<std::string>& extra_wlroots) {
    if (!env.wm_identified()) return std::nullopt;

    auto wm = canonical_wm_name(env.window_manager);

    // Without an explicit WM the session type is authoritative: every
    // X11 window manager exposes the EWMH properties.
    if (!env.overrides.window_manager && env.session_type == SessionType::X11) {
        return AdapterKind::X11;
    }

    if (wm == "gnome-shell") return AdapterKind::GnomeExtension;
    if (wm == "kwin_wayland") return AdapterKind::Kwin;
    if (wm == "cosmic-comp") return AdapterKind::Cosmic;
    if (is_wlroots_compositor(wm, extra_wlroots)) return AdapterKind::Wlroots;
    if (std::find(X11_WINDOW_MANAGERS.begin(), X11_WINDOW_MANAGERS.end(), wm) !=
        X11_WINDOW_MANAGERS.end()) {
        return AdapterKind::X11;
    }

    if (is_wlroots_compositor(env.desktop_name(), extra_wlroots)) return AdapterKind::Wlroots;

    return std::nullopt;
}
