#include "platform/linux/wayland_toplevel_backend.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

using namespace std::chrono_literals;

const wl_registry_listener WaylandToplevelBackend::registry_listener{
    .global = [](void* data, wl_registry* registry, uint32_t name,
                 const char* interface, uint32_t version) {
        static_cast<WaylandToplevelBackend*>(data)->bind_global(registry, name, interface, version);
    },
    .global_remove = [](void*, wl_registry*, uint32_t) {},
};

WaylandToplevelBackend::WaylandToplevelBackend(std::string source_adapter,
                                               std::chrono::milliseconds roundtrip_timeout)
    : source_adapter_(std::move(source_adapter)), roundtrip_timeout_(roundtrip_timeout) {}

WaylandToplevelBackend::~WaylandToplevelBackend() {
    // Proxies were released by the subclass destructor calling disconnect().
    if (display_) wl_display_disconnect(display_);
}

std::expected<void, BackendError> WaylandToplevelBackend::connect() {
    if (display_) return {};

    display_ = wl_display_connect(nullptr);
    if (!display_) {
        return std::unexpected(BackendError::unavailable(
            std::format("cannot connect to Wayland display: {}", std::strerror(errno))));
    }

    registry_ = wl_display_get_registry(display_);
    wl_registry_add_listener(registry_, &registry_listener, this);

    focus_lost_ = true;
    finished_ = false;

    // First roundtrip announces globals, the second delivers the initial toplevels.
    if (auto res = roundtrip(); !res) {
        disconnect();
        return res;
    }

    if (!manager_bound()) {
        disconnect();
        return std::unexpected(BackendError::unavailable(
            std::format("compositor does not offer {}", manager_interface())));
    }

    if (auto res = roundtrip(); !res) {
        disconnect();
        return res;
    }

    settle();
    return {};
}

std::expected<void, BackendError> WaylandToplevelBackend::roundtrip() {
    static const wl_callback_listener sync_listener{
        .done = [](void* data, wl_callback*, uint32_t) { *static_cast<bool*>(data) = true; },
    };

    bool done = false;
    wl_callback* callback = wl_display_sync(display_);
    wl_callback_add_listener(callback, &sync_listener, &done);

    auto deadline = std::chrono::steady_clock::now() + roundtrip_timeout_;
    std::optional<BackendError> error;

    while (!done && !error) {
        if (wl_display_prepare_read(display_) != 0) {
            if (wl_display_dispatch_pending(display_) < 0) {
                error = BackendError::transient("Wayland connection lost during roundtrip");
            }
            continue;
        }

        if (wl_display_flush(display_) < 0 && errno != EAGAIN) {
            wl_display_cancel_read(display_);
            error = BackendError::transient(
                std::format("Wayland flush failed: {}", std::strerror(errno)));
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= 0ms) {
            wl_display_cancel_read(display_);
            error = BackendError::transient(std::format(
                "compositor did not answer within {} ms", roundtrip_timeout_.count()));
            break;
        }

        pollfd pfd{wl_display_get_fd(display_), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready <= 0) {
            wl_display_cancel_read(display_);
            if (ready < 0 && errno != EINTR) {
                error = BackendError::transient(
                    std::format("poll on Wayland display failed: {}", std::strerror(errno)));
            }
            continue;
        }

        if (wl_display_read_events(display_) < 0 || wl_display_dispatch_pending(display_) < 0) {
            error = BackendError::transient("Wayland connection lost during roundtrip");
        }
    }

    // A late done event for a destroyed callback is dropped by libwayland.
    wl_callback_destroy(callback);
    if (error) return std::unexpected(*error);
    return {};
}

void WaylandToplevelBackend::disconnect() {
    if (!display_) return;

    for (auto& [handle, toplevel] : toplevels_) {
        destroy_handle(handle);
    }
    toplevels_.clear();
    active_ = nullptr;

    destroy_manager();
    if (registry_) {
        wl_registry_destroy(registry_);
        registry_ = nullptr;
    }

    wl_display_flush(display_);
    wl_display_disconnect(display_);
    display_ = nullptr;

    reported_ = false;
    last_reported_.reset();
}

int WaylandToplevelBackend::event_fd() const {
    return display_ ? wl_display_get_fd(display_) : -1;
}

std::expected<void, BackendError> WaylandToplevelBackend::dispatch() {
    if (!display_) return std::unexpected(BackendError::transient("not connected"));

    if (wl_display_dispatch(display_) < 0) {
        return std::unexpected(BackendError::transient(
            std::format("Wayland connection lost: {}", std::strerror(wl_display_get_error(display_)))));
    }
    settle();

    if (finished_) {
        return std::unexpected(BackendError::transient(
            std::format("compositor stopped sending {} events", manager_interface())));
    }
    return {};
}

void WaylandToplevelBackend::flush() {
    if (!display_) return;
    wl_display_dispatch_pending(display_);
    settle();
    wl_display_flush(display_);
}

void WaylandToplevelBackend::toplevel_added(void* handle) {
    toplevels_[handle] = Toplevel{};
}

void WaylandToplevelBackend::toplevel_title(void* handle, const char* title) {
    if (auto it = toplevels_.find(handle); it != toplevels_.end()) it->second.title = title;
}

void WaylandToplevelBackend::toplevel_app_id(void* handle, const char* app_id) {
    if (auto it = toplevels_.find(handle); it != toplevels_.end()) it->second.app_id = app_id;
}

void WaylandToplevelBackend::toplevel_state(void* handle, const wl_array* states, uint32_t activated) {
    auto it = toplevels_.find(handle);
    if (it == toplevels_.end()) return;

    const auto* begin = static_cast<const uint32_t*>(states->data);
    const auto* end = begin + states->size / sizeof(uint32_t);
    it->second.pending_activated = std::find(begin, end, activated) != end;
}

void WaylandToplevelBackend::toplevel_done(void* handle) {
    auto it = toplevels_.find(handle);
    if (it == toplevels_.end()) return;

    auto& toplevel = it->second;
    toplevel.activated = toplevel.pending_activated;

    if (toplevel.activated) {
        active_ = handle;
        report(toplevel);
    } else if (active_ == handle) {
        // Another toplevel usually activates in the same batch.
        active_ = nullptr;
        focus_lost_ = true;
    }
}

void WaylandToplevelBackend::toplevel_closed(void* handle) {
    auto it = toplevels_.find(handle);
    if (it == toplevels_.end()) return;

    if (active_ == handle) {
        active_ = nullptr;
        focus_lost_ = true;
    }
    toplevels_.erase(it);
    destroy_handle(handle);
}

void WaylandToplevelBackend::manager_finished() {
    finished_ = true;
}

void WaylandToplevelBackend::settle() {
    if (!focus_lost_) return;
    focus_lost_ = false;

    if (active_) return;
    if (reported_ && !last_reported_) return;

    reported_ = true;
    last_reported_.reset();
    emit(std::nullopt);
}

void WaylandToplevelBackend::report(const Toplevel& toplevel) {
    WindowContext ctx{
        .app_id = toplevel.app_id,
        .app_class = toplevel.app_id,
        .window_title = toplevel.title,
        .observed_at = std::chrono::steady_clock::now(),
        .source_adapter = source_adapter_,
    };

    if (reported_ && last_reported_ && last_reported_->same_window(ctx)) return;

    reported_ = true;
    last_reported_ = ctx;
    emit(std::move(ctx));
}
