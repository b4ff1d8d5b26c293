#include "platform/linux/x11_context_client.hpp"

#include <print>

X11ContextClient::X11ContextClient() {
    backend_.set_listener([this](std::optional<WindowContext> ctx) {
        if (ctx) {
            hub_.publish(std::move(*ctx));
        } else {
            hub_.clear();
        }
    });
}

std::expected<void, std::string> X11ContextClient::connect() {
    auto res = backend_.connect();
    if (!res) return std::unexpected(res.error().message);
    return {};
}

bool X11ContextClient::process_events() {
    auto res = backend_.dispatch();
    if (!res) {
        std::println(stderr, "[winctx] {}", res.error().message);
        hub_.mark_stale();
        return false;
    }
    backend_.flush();
    return true;
}
