#include <catch2/catch_test_macros.hpp>

#include "env/environment_probe.hpp"
#include "fixtures.hpp"

TEST_CASE("desktop_from_name", "[env]") {
    REQUIRE(desktop_from_name("KDE") == DesktopEnv::Kde);
    REQUIRE(desktop_from_name("plasmawayland") == DesktopEnv::Kde);
    REQUIRE(desktop_from_name("GNOME-Classic") == DesktopEnv::Gnome);
    REQUIRE(desktop_from_name("X-Cinnamon") == DesktopEnv::Cinnamon);
    REQUIRE(desktop_from_name("/usr/share/xsessions/plasma") == DesktopEnv::Kde);
    REQUIRE(desktop_from_name("COSMIC") == DesktopEnv::Cosmic);
    REQUIRE(desktop_from_name("ubuntu") == DesktopEnv::Unknown);
    REQUIRE(desktop_from_name("") == DesktopEnv::Unknown);
}

TEST_CASE("EnvironmentProbe", "[env]") {
    FakeSystemSource source;
    EnvironmentProbe probe(source);

    SECTION("FedoraKdeWayland") {
        source.files["/etc/os-release"] = "ID=fedora\nVERSION_ID=40\n";
        source.vars["XDG_SESSION_TYPE"] = "wayland";
        source.vars["XDG_CURRENT_DESKTOP"] = "KDE";
        source.add_process("systemd");
        source.add_process("kwin_wayland");
        source.add_process("plasmashell");

        auto info = probe.detect();
        REQUIRE(info.distro_id == "fedora");
        REQUIRE(info.distro_version == "40");
        REQUIRE(info.session_type == SessionType::Wayland);
        REQUIRE(info.desktop_env == DesktopEnv::Kde);
        REQUIRE(info.window_manager == "kwin_wayland");
    }

    SECTION("SessionFallsBackToDisplayVariables") {
        source.vars["XDG_SESSION_TYPE"] = "tty";
        source.vars["DISPLAY"] = ":0";
        REQUIRE(probe.detect().session_type == SessionType::X11);

        source.vars["WAYLAND_DISPLAY"] = "wayland-0";
        REQUIRE(probe.detect().session_type == SessionType::Wayland);

        source.vars.clear();
        REQUIRE(probe.detect().session_type == SessionType::Unknown);
    }

    SECTION("CurrentDesktopTokensInOrder") {
        source.vars["XDG_CURRENT_DESKTOP"] = "ubuntu:GNOME";
        REQUIRE(probe.detect().desktop_env == DesktopEnv::Gnome);
    }

    SECTION("DesktopFromMarkerVariables") {
        source.vars["SWAYSOCK"] = "/run/user/1000/sway-ipc.sock";
        REQUIRE(probe.detect().desktop_env == DesktopEnv::Sway);
    }

    SECTION("SessionDesktopBeforeMarkers") {
        source.vars["DESKTOP_SESSION"] = "/usr/share/xsessions/xfce";
        source.vars["KDE_FULL_SESSION"] = "true";
        REQUIRE(probe.detect().desktop_env == DesktopEnv::Xfce);
    }

    SECTION("ProcessMatchPrefersDesktop") {
        // gnome-shell left running from a previous login, user now in sway.
        source.vars["XDG_CURRENT_DESKTOP"] = "sway";
        source.add_process("gnome-shell");
        source.add_process("sway");
        REQUIRE(probe.detect().window_manager == "sway");
    }

    SECTION("CanonicalNameFromSynonym") {
        source.add_process("Hyprland");
        REQUIRE(probe.detect().window_manager == "hyprland");
    }

    SECTION("NixosWrappedBinary") {
        source.files["/etc/os-release"] = "ID=nixos\nVERSION_ID=\"24.05\"\n";
        source.vars["XDG_SESSION_TYPE"] = "wayland";
        source.add_process(".sway-wrapped");

        auto info = probe.detect();
        REQUIRE(info.distro_id == "nixos");
        REQUIRE(info.window_manager == "sway");
    }

    SECTION("WrappedBinaryIgnoredElsewhere") {
        source.files["/etc/os-release"] = "ID=debian\n";
        source.add_process(".sway-wrapped");
        REQUIRE_FALSE(probe.detect().wm_identified());
    }

    SECTION("DesktopDefaultWhenNoProcessMatches") {
        source.vars["XDG_SESSION_TYPE"] = "x11";
        source.vars["XDG_CURRENT_DESKTOP"] = "KDE";
        REQUIRE(probe.detect().window_manager == "kwin_x11");
    }

    SECTION("SentinelWhenNothingMatches") {
        source.vars["XDG_CURRENT_DESKTOP"] = "LXQt";
        source.add_process("bash");

        auto info = probe.detect();
        REQUIRE(info.window_manager == WM_UNIDENTIFIED);
        REQUIRE_FALSE(info.wm_identified());
    }

    SECTION("OverridesBypassDetection") {
        source.vars["XDG_CURRENT_DESKTOP"] = "GNOME";
        source.add_process("gnome-shell");

        auto info = probe.detect({.desktop_env = "KDE", .window_manager = "kwin_wayland"});
        REQUIRE(info.desktop_env == DesktopEnv::Kde);
        REQUIRE(info.window_manager == "kwin_wayland");
        REQUIRE(info.overrides.window_manager == "kwin_wayland");
    }

    SECTION("UnknownDesktopOverrideKeepsName") {
        auto info = probe.detect({.desktop_env = "mango"});
        REQUIRE(info.desktop_env == DesktopEnv::Unknown);
        REQUIRE(info.desktop_name() == "mango");
    }

    SECTION("WindowManagerOverrideIsVerbatim") {
        source.add_process("sway");
        auto info = probe.detect({.window_manager = "Hyprland"});
        REQUIRE(info.window_manager == "Hyprland");
    }

    SECTION("RepeatedDetectionIsStable") {
        source.files["/etc/os-release"] = "ID=arch\n";
        source.vars["XDG_SESSION_TYPE"] = "wayland";
        source.add_process("niri");

        auto a = probe.detect();
        auto b = probe.detect();
        REQUIRE(a.window_manager == b.window_manager);
        REQUIRE(a.desktop_env == b.desktop_env);
        REQUIRE(a.distro_id == b.distro_id);
    }
}
