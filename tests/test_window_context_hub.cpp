#include <catch2/catch_test_macros.hpp>

#include "context/window_context_hub.hpp"
#include "fixtures.hpp"

TEST_CASE("WindowContextHub", "[hub]") {
    WindowContextHub hub;

    SECTION("StartsStaleAndEmpty") {
        REQUIRE_FALSE(hub.alive());
        REQUIRE_FALSE(hub.current().has_value());
        REQUIRE(hub.snapshot().generation == 0);
    }

    SECTION("PublishReplacesWholesale") {
        hub.publish(make_context("kitty", "vim"));
        hub.publish(make_context("firefox"));

        auto ctx = hub.current();
        REQUIRE(ctx.has_value());
        REQUIRE(ctx->app_id == "firefox");
        REQUIRE(ctx->window_title.empty());
        REQUIRE(hub.snapshot().generation == 2);
    }

    SECTION("ClearMeansNoFocusedWindow") {
        hub.publish(make_context("kitty"));
        hub.clear();
        REQUIRE(hub.alive());
        REQUIRE_FALSE(hub.current().has_value());
    }

    SECTION("StaleHidesButKeepsLastValue") {
        hub.publish(make_context("kitty"));
        hub.mark_stale();

        REQUIRE_FALSE(hub.current().has_value());
        REQUIRE(hub.snapshot().context.has_value());
        REQUIRE(hub.snapshot().context->app_id == "kitty");

    }

    SECTION("ReconnectDoesNotResurrectStaleValue") {
        hub.publish(make_context("kitty"));
        hub.mark_stale();
        hub.mark_alive();

        REQUIRE(hub.alive());
        REQUIRE_FALSE(hub.current().has_value());
        REQUIRE_FALSE(hub.snapshot().context.has_value());

        hub.publish(make_context("foot"));
        REQUIRE(hub.current()->app_id == "foot");
    }

    SECTION("RedundantTransitionsDoNotNotify") {
        int calls = 0;
        hub.subscribe([&](const HubSnapshot&) { ++calls; });

        hub.mark_stale();
        REQUIRE(calls == 0);

        hub.clear();
        hub.clear();
        REQUIRE(calls == 1);

        hub.mark_alive();
        REQUIRE(calls == 1);
    }

    SECTION("SubscribersSeeEveryChange") {
        std::vector<HubSnapshot> seen;
        int id = hub.subscribe([&](const HubSnapshot& s) { seen.push_back(s); });

        hub.publish(make_context("kitty"));
        hub.mark_stale();
        REQUIRE(seen.size() == 2);
        REQUIRE(seen[0].alive);
        REQUIRE(seen[0].context->app_id == "kitty");
        REQUIRE_FALSE(seen[1].alive);

        hub.unsubscribe(id);
        hub.publish(make_context("foot"));
        REQUIRE(seen.size() == 2);
    }

    SECTION("SubscriberMayUnsubscribeItself") {
        int calls = 0;
        int id = 0;
        id = hub.subscribe([&](const HubSnapshot&) {
            ++calls;
            hub.unsubscribe(id);
        });

        hub.publish(make_context("kitty"));
        hub.publish(make_context("foot"));
        REQUIRE(calls == 1);
    }
}
