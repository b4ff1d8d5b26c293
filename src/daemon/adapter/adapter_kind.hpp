#pragma once

#include "env/environment_info.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class AdapterKind { X11, GnomeExtension, Kwin, Cosmic, Wlroots };

std::string_view to_string(AdapterKind kind);

// Command-line name: "x11", "gnome", "kwin", "cosmic", "wlroots".
std::optional<AdapterKind> parse_adapter_kind(std::string_view name);

// D-Bus identity of a gated adapter. Empty for X11, which has no service.
struct BusIdentity {
    std::string name;       // org.winctx.Gnome
    std::string path;       // /org/winctx/Gnome
    std::string interface;  // same as name
};

BusIdentity bus_identity(AdapterKind kind);

// The backend an adapter needs, used in failure messages.
std::string_view expected_backend(AdapterKind kind);

// Window managers served by the wlroots foreign-toplevel adapter.
bool is_wlroots_compositor(std::string_view wm, const std::vector<std::string>& extra = {});

// Which adapter the environment calls for. A window manager override decides
// regardless of session type. nullopt when the window manager is the sentinel
// or has no adapter.
std::optional<AdapterKind> select_adapter(const EnvironmentInfo& env,
                                          const std::vector<std::string>& extra_wlroots = {});
