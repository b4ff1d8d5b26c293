#include "context/wire_format.hpp"

#include <charconv>
#include <cstdint>

namespace wire {

StringDict to_dict(const std::optional<WindowContext>& ctx) {
    if (!ctx) return {};

    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        ctx->observed_at.time_since_epoch()).count();

    return {
        {APP_ID, ctx->app_id},
        {APP_CLASS, ctx->app_class},
        {WINDOW_TITLE, ctx->window_title},
        {SOURCE_ADAPTER, ctx->source_adapter},
        {OBSERVED_AT_US, std::to_string(us)},
    };
}

std::optional<WindowContext> from_dict(const StringDict& dict) {
    if (dict.empty()) return std::nullopt;

    auto get = [&](const char* key) -> std::string {
        auto it = dict.find(key);
        return it != dict.end() ? it->second : std::string{};
    };

    WindowContext ctx;
    ctx.app_id = get(APP_ID);
    ctx.app_class = get(APP_CLASS);
    ctx.window_title = get(WINDOW_TITLE);
    ctx.source_adapter = get(SOURCE_ADAPTER);

    auto stamp = get(OBSERVED_AT_US);
    int64_t us = 0;
    auto [ptr, ec] = std::from_chars(stamp.data(), stamp.data() + stamp.size(), us);
    if (ec == std::errc{} && ptr == stamp.data() + stamp.size()) {
        ctx.observed_at = std::chrono::steady_clock::time_point(std::chrono::microseconds(us));
    }
    return ctx;
}

} // namespace wire
