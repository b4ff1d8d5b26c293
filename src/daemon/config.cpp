#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Empty strings count as unset.
std::optional<std::string> optional_string(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    auto value = obj[key].get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

uint32_t timeout_ms(const json& obj, const char* key, uint32_t fallback) {
    if (!obj.contains(key)) return fallback;
    constexpr auto max = static_cast<uint32_t>(std::numeric_limits<int>::max());
    return std::min(obj[key].get<uint32_t>(), max);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("overrides")) {
            auto& o = j["overrides"];
            cfg.overrides.desktop_env = optional_string(o, "desktop_env");
            cfg.overrides.window_manager = optional_string(o, "window_manager");
        }

        if (j.contains("wlroots_compositors")) {
            cfg.wlroots_compositors = j["wlroots_compositors"].get<std::vector<std::string>>();
        }

        if (j.contains("dbus")) {
            auto& d = j["dbus"];
            cfg.dbus.call_timeout_ms = timeout_ms(d, "call_timeout_ms", cfg.dbus.call_timeout_ms);
        }

        if (j.contains("wayland")) {
            auto& w = j["wayland"];
            cfg.wayland.roundtrip_timeout_ms =
                timeout_ms(w, "roundtrip_timeout_ms", cfg.wayland.roundtrip_timeout_ms);
        }

        if (j.contains("retry")) {
            auto& r = j["retry"];
            if (r.contains("max_attempts")) cfg.retry.max_attempts = r["max_attempts"].get<uint32_t>();
            if (r.contains("initial_delay_ms")) cfg.retry.initial_delay_ms = r["initial_delay_ms"].get<uint32_t>();
            if (r.contains("max_delay_ms")) cfg.retry.max_delay_ms = r["max_delay_ms"].get<uint32_t>();
        }

        if (j.contains("gnome")) {
            auto& g = j["gnome"];
            if (g.contains("poll_interval_ms")) cfg.gnome.poll_interval_ms = g["poll_interval_ms"].get<uint32_t>();
        }

        if (j.contains("kwin")) {
            auto& k = j["kwin"];
            if (k.contains("script_name")) cfg.kwin.script_name = k["script_name"].get<std::string>();
            cfg.kwin.script_path = optional_string(k, "script_path").value_or("");
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
