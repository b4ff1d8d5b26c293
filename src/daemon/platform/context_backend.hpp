#pragma once

#include "adapter/adapter_kind.hpp"
#include "context/window_context.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>

struct BackendError {
    enum class Kind {
        Unavailable,  // extension, script or protocol missing; retrying will not help
        Transient,    // timeout or dropped connection
    };

    Kind kind = Kind::Unavailable;
    std::string message;

    static BackendError unavailable(std::string msg) { return {Kind::Unavailable, std::move(msg)}; }
    static BackendError transient(std::string msg) { return {Kind::Transient, std::move(msg)}; }

    bool transient_error() const { return kind == Kind::Transient; }
};

// Compositor-specific focus tracking. Reports the focused window through the
// listener: a value on focus change, nullopt when nothing has focus.
class ContextBackend {
public:
    using Listener = std::function<void(std::optional<WindowContext>)>;

    virtual ~ContextBackend() = default;

    virtual AdapterKind kind() const = 0;

    virtual std::expected<void, BackendError> connect() = 0;
    virtual void disconnect() = 0;

    // Readable fd to watch, or -1 when events arrive over the shared bus.
    virtual int event_fd() const { return -1; }
    // Process whatever made event_fd() readable.
    virtual std::expected<void, BackendError> dispatch() { return {}; }
    // Write out buffered requests before the event loop blocks.
    virtual void flush() {}

    // Non-zero for backends without change notification.
    virtual std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds{0}; }
    virtual std::expected<void, BackendError> poll() { return {}; }

    void set_listener(Listener listener) { listener_ = std::move(listener); }

protected:
    void emit(std::optional<WindowContext> ctx) {
        if (listener_) listener_(std::move(ctx));
    }

private:
    Listener listener_;
};
