#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <unistd.h>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "winctx_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        auto written = ::write(fd, content.data(), content.size());
        (void)written;
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.overrides.empty());
        REQUIRE(cfg.wlroots_compositors.empty());
        REQUIRE(cfg.dbus.call_timeout_ms == 2000);
        REQUIRE(cfg.retry.max_attempts == 5);
        REQUIRE(cfg.retry.initial_delay_ms == 250);
        REQUIRE(cfg.retry.max_delay_ms == 5000);
        REQUIRE(cfg.gnome.poll_interval_ms == 250);
        REQUIRE(cfg.kwin.script_name == "winctx-kwin-focus");
        REQUIRE(cfg.kwin.script_path.empty());
        REQUIRE(cfg.wayland.roundtrip_timeout_ms == 2000);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "overrides": { "desktop_env": "KDE", "window_manager": "kwin_wayland" },
            "wlroots_compositors": ["mango", "jay"],
            "dbus": { "call_timeout_ms": 500 },
            "retry": { "max_attempts": 3, "initial_delay_ms": 100, "max_delay_ms": 1000 },
            "gnome": { "poll_interval_ms": 400 },
            "kwin": { "script_name": "focus-relay", "script_path": "/opt/relay/main.js" },
            "wayland": { "roundtrip_timeout_ms": 750 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.overrides.desktop_env == "KDE");
        REQUIRE(cfg.overrides.window_manager == "kwin_wayland");
        REQUIRE(cfg.wlroots_compositors == std::vector<std::string>{"mango", "jay"});
        REQUIRE(cfg.dbus.call_timeout_ms == 500);
        REQUIRE(cfg.retry.max_attempts == 3);
        REQUIRE(cfg.retry.initial_delay_ms == 100);
        REQUIRE(cfg.retry.max_delay_ms == 1000);
        REQUIRE(cfg.gnome.poll_interval_ms == 400);
        REQUIRE(cfg.kwin.script_name == "focus-relay");
        REQUIRE(cfg.kwin.script_path == "/opt/relay/main.js");
        REQUIRE(cfg.wayland.roundtrip_timeout_ms == 750);
    }

    SECTION("TimeoutsCappedAtIntMax") {
        TmpFile f(R"({
            "dbus": { "call_timeout_ms": 4294967295 },
            "wayland": { "roundtrip_timeout_ms": 3000000000 }
        })");

        auto cfg = Config::load(f.path);
        constexpr auto max = static_cast<uint32_t>(std::numeric_limits<int>::max());
        REQUIRE(cfg.dbus.call_timeout_ms == max);
        REQUIRE(cfg.wayland.roundtrip_timeout_ms == max);
        // A capped value stays a positive timeout once narrowed to int.
        REQUIRE(static_cast<int>(cfg.dbus.call_timeout_ms) > 0);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "retry": { "max_attempts": 8 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.retry.max_attempts == 8);
        // Other fields retain defaults
        REQUIRE(cfg.retry.initial_delay_ms == 250);
        REQUIRE(cfg.dbus.call_timeout_ms == 2000);
        REQUIRE(cfg.overrides.empty());
    }

    SECTION("EmptyOverridesAreUnset") {
        TmpFile f(R"({ "overrides": { "desktop_env": "", "window_manager": null } })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.overrides.desktop_env.has_value());
        REQUIRE_FALSE(cfg.overrides.window_manager.has_value());
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.retry.max_attempts == 5);
        REQUIRE(cfg.overrides.empty());
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/winctx_test_nonexistent_config_file.json");
        REQUIRE(cfg.dbus.call_timeout_ms == 2000);
        REQUIRE(cfg.kwin.script_name == "winctx-kwin-focus");
    }
}
