#include <catch2/catch_test_macros.hpp>

#include "platform/linux/gnome_extension_backend.hpp"

TEST_CASE("GnomeExtensionBackend::parse_focused_window", "[gnome]") {

    SECTION("FocusedWindow") {
        auto parsed = GnomeExtensionBackend::parse_focused_window(R"({
            "title": "Inbox - Mozilla Thunderbird",
            "wm_class": "thunderbird",
            "wm_class_instance": "Mail",
            "pid": 4242,
            "id": 1234567,
            "focus": true
        })");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->has_value());

        const auto& ctx = **parsed;
        REQUIRE(ctx.app_class == "thunderbird");
        REQUIRE(ctx.app_id == "Mail");
        REQUIRE(ctx.window_title == "Inbox - Mozilla Thunderbird");
        REQUIRE(ctx.source_adapter == "gnome");
    }

    SECTION("MissingInstanceFallsBackToClass") {
        auto parsed = GnomeExtensionBackend::parse_focused_window(
            R"({"title": "Terminal", "wm_class": "org.gnome.Ptyxis"})");
        REQUIRE(parsed.has_value());
        REQUIRE((*parsed)->app_id == "org.gnome.Ptyxis");
    }

    SECTION("NonStringFieldsReadAsEmpty") {
        auto parsed = GnomeExtensionBackend::parse_focused_window(
            R"({"title": null, "wm_class": "kitty", "wm_class_instance": 7})");
        REQUIRE(parsed.has_value());
        REQUIRE((*parsed)->window_title.empty());
        REQUIRE((*parsed)->app_id == "kitty");
    }

    SECTION("NothingFocused") {
        for (const char* text : {"", "null", "{}"}) {
            auto parsed = GnomeExtensionBackend::parse_focused_window(text);
            REQUIRE(parsed.has_value());
            REQUIRE_FALSE(parsed->has_value());
        }
    }

    SECTION("MalformedAnswer") {
        REQUIRE_FALSE(GnomeExtensionBackend::parse_focused_window("[1, 2]").has_value());
        REQUIRE_FALSE(GnomeExtensionBackend::parse_focused_window("{\"title\": ").has_value());
    }
}
