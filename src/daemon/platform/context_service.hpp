#pragma once

#include "adapter/adapter_lifecycle.hpp"
#include "context/window_context.hpp"

#include <expected>
#include <optional>
#include <string>

// Publishes the adapter's current WindowContext to consumers.
class ContextService {
public:
    virtual ~ContextService() = default;

    // Claim the adapter's name. Fails when the name is taken or the bus is down.
    virtual std::expected<void, std::string> start() = 0;
    // Release the name. Safe to call when not started.
    virtual void stop() = 0;

    // nullopt: no window has focus.
    virtual void publish(const std::optional<WindowContext>& ctx) = 0;
    // Backend connection lost: the last published value must not be trusted
    // until the next publish().
    virtual void publish_stale() = 0;
    virtual void set_state(const AdapterState& state) = 0;
};
