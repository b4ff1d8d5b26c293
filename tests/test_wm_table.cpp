#include <catch2/catch_test_macros.hpp>

#include "env/wm_table.hpp"

TEST_CASE("canonical_wm_name", "[wm]") {

    SECTION("SynonymsShareOneName") {
        REQUIRE(canonical_wm_name("mutter") == canonical_wm_name("gnome-shell"));
        REQUIRE(canonical_wm_name("mutter") == "gnome-shell");
        REQUIRE(canonical_wm_name("kwin_wayland_wrapper") == "kwin_wayland");
        REQUIRE(canonical_wm_name("Hyprland") == "hyprland");
        REQUIRE(canonical_wm_name("cinnamon") == "muffin");
    }

    SECTION("Idempotent") {
        for (const auto& wm : known_window_managers()) {
            auto once = canonical_wm_name(wm.process);
            REQUIRE(canonical_wm_name(once) == once);
        }
    }

    SECTION("CaseInsensitiveForOverrides") {
        REQUIRE(canonical_wm_name("HYPRLAND") == "hyprland");
        REQUIRE(canonical_wm_name("Mutter") == "gnome-shell");
    }

    SECTION("UnknownPassesThrough") {
        REQUIRE(canonical_wm_name("obscurewm") == "obscurewm");
    }
}

TEST_CASE("wm_for_desktop", "[wm]") {
    REQUIRE(wm_for_desktop(DesktopEnv::Gnome, SessionType::Wayland) == "gnome-shell");
    REQUIRE(wm_for_desktop(DesktopEnv::Kde, SessionType::Wayland) == "kwin_wayland");
    REQUIRE(wm_for_desktop(DesktopEnv::Kde, SessionType::X11) == "kwin_x11");
    REQUIRE_FALSE(wm_for_desktop(DesktopEnv::Kde, SessionType::Unknown).has_value());
    REQUIRE(wm_for_desktop(DesktopEnv::Cosmic, SessionType::Wayland) == "cosmic-comp");
    REQUIRE(wm_for_desktop(DesktopEnv::Hyprland, SessionType::Wayland) == "hyprland");
    REQUIRE_FALSE(wm_for_desktop(DesktopEnv::Unknown, SessionType::Wayland).has_value());
}

TEST_CASE("Process matching", "[wm]") {

    SECTION("ExactMatchIsCaseSensitive") {
        REQUIRE(match_exact({"Hyprland"}).size() == 1);
        REQUIRE(match_exact({"hyprland"}).empty());
    }

    SECTION("ExactMatchHonorsCommTruncation") {
        // kwin_wayland_wrapper is longer than TASK_COMM_LEN allows.
        auto matches = match_exact({"kwin_wayland_wr"});
        REQUIRE(matches.size() == 1);
        REQUIRE(matches.front()->canonical == "kwin_wayland");
    }

    SECTION("RelaxedMatchFindsWrappedNames") {
        REQUIRE(match_exact({".gnome-shell-wr"}).empty());
        auto matches = match_relaxed({".gnome-shell-wr"});
        REQUIRE_FALSE(matches.empty());
        REQUIRE(matches.front()->canonical == "gnome-shell");
    }

    SECTION("RelaxedMatchIgnoresOverlongNames") {
        REQUIRE(match_relaxed({"a-very-long-gnome-shell-name"}).empty());
    }

    SECTION("PickPrefersDesktop") {
        auto matches = match_exact({"sway", "kwin_wayland"});
        REQUIRE(matches.size() == 2);
        REQUIRE(pick_match(matches, DesktopEnv::Sway)->canonical == "sway");
        REQUIRE(pick_match(matches, DesktopEnv::Kde)->canonical == "kwin_wayland");
        // Table order without a desktop hint
        REQUIRE(pick_match(matches, DesktopEnv::Unknown)->canonical == "kwin_wayland");
        REQUIRE(pick_match({}, DesktopEnv::Kde) == nullptr);
    }
}
