#include <catch2/catch_test_macros.hpp>

#include "context/window_context.hpp"
#include "context/wire_format.hpp"

TEST_CASE("WindowContext", "[context]") {

    SECTION("SameWindowIgnoresTimestampAndSource") {
        WindowContext a{.app_id = "kitty", .app_class = "kitty", .window_title = "~"};
        WindowContext b = a;
        b.observed_at = std::chrono::steady_clock::now();
        b.source_adapter = "wlroots";
        REQUIRE(a.same_window(b));
    }

    SECTION("TitleChangeIsADifferentWindow") {
        WindowContext a{.app_id = "firefox", .app_class = "Firefox", .window_title = "Inbox"};
        WindowContext b = a;
        b.window_title = "Calendar";
        REQUIRE_FALSE(a.same_window(b));
    }
}

TEST_CASE("Wire format", "[context][wire]") {

    SECTION("NoWindowIsAnEmptyDictionary") {
        REQUIRE(wire::to_dict(std::nullopt).empty());
        REQUIRE_FALSE(wire::from_dict({}).has_value());
    }

    SECTION("AllFieldsPresent") {
        WindowContext ctx{
            .app_id = "org.gnome.Nautilus",
            .app_class = "org.gnome.Nautilus",
            .window_title = "Home",
            .observed_at = std::chrono::steady_clock::time_point(std::chrono::microseconds(1234567)),
            .source_adapter = "gnome",
        };
        auto dict = wire::to_dict(ctx);
        REQUIRE(dict.size() == 5);
        REQUIRE(dict[wire::APP_ID] == "org.gnome.Nautilus");
        REQUIRE(dict[wire::WINDOW_TITLE] == "Home");
        REQUIRE(dict[wire::SOURCE_ADAPTER] == "gnome");
        REQUIRE(dict[wire::OBSERVED_AT_US] == "1234567");

        auto back = wire::from_dict(dict);
        REQUIRE(back.has_value());
        REQUIRE(back->same_window(ctx));
        REQUIRE(back->observed_at == ctx.observed_at);
    }

    SECTION("EmptyClassIsStillAWindow") {
        // Untitled windows without a class are valid values, not "no window".
        WindowContext ctx{.app_id = "foot"};
        auto dict = wire::to_dict(ctx);
        REQUIRE(dict[wire::APP_CLASS].empty());

        auto back = wire::from_dict(dict);
        REQUIRE(back.has_value());
        REQUIRE(back->app_id == "foot");
        REQUIRE(back->app_class.empty());
    }

    SECTION("MissingKeysReadAsEmpty") {
        auto back = wire::from_dict({{wire::APP_ID, "kitty"}, {wire::OBSERVED_AT_US, "garbage"}});
        REQUIRE(back.has_value());
        REQUIRE(back->app_id == "kitty");
        REQUIRE(back->window_title.empty());
        REQUIRE(back->observed_at == std::chrono::steady_clock::time_point{});
    }
}
