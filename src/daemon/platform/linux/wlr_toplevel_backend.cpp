#include "platform/linux/wlr_toplevel_backend.hpp"

#include "wlr-foreign-toplevel-management-unstable-v1-client-protocol.h"

#include <algorithm>
#include <cstring>

// Version 3 adds the parent event, which is ignored.
static constexpr uint32_t WLR_TOPLEVEL_VERSION = 3;

const zwlr_foreign_toplevel_manager_v1_listener WlrToplevelBackend::manager_listener{
    .toplevel = [](void* data, zwlr_foreign_toplevel_manager_v1*,
                   zwlr_foreign_toplevel_handle_v1* handle) {
        auto* self = static_cast<WlrToplevelBackend*>(data);
        self->toplevel_added(handle);
        zwlr_foreign_toplevel_handle_v1_add_listener(handle, &handle_listener, self);
    },
    .finished = [](void* data, zwlr_foreign_toplevel_manager_v1*) {
        static_cast<WlrToplevelBackend*>(data)->manager_finished();
    },
};

const zwlr_foreign_toplevel_handle_v1_listener WlrToplevelBackend::handle_listener{
    .title = [](void* data, zwlr_foreign_toplevel_handle_v1* handle, const char* title) {
        static_cast<WlrToplevelBackend*>(data)->toplevel_title(handle, title);
    },
    .app_id = [](void* data, zwlr_foreign_toplevel_handle_v1* handle, const char* app_id) {
        static_cast<WlrToplevelBackend*>(data)->toplevel_app_id(handle, app_id);
    },
    .output_enter = [](void*, zwlr_foreign_toplevel_handle_v1*, wl_output*) {},
    .output_leave = [](void*, zwlr_foreign_toplevel_handle_v1*, wl_output*) {},
    .state = [](void* data, zwlr_foreign_toplevel_handle_v1* handle, wl_array* states) {
        static_cast<WlrToplevelBackend*>(data)->toplevel_state(
            handle, states, ZWLR_FOREIGN_TOPLEVEL_HANDLE_V1_STATE_ACTIVATED);
    },
    .done = [](void* data, zwlr_foreign_toplevel_handle_v1* handle) {
        static_cast<WlrToplevelBackend*>(data)->toplevel_done(handle);
    },
    .closed = [](void* data, zwlr_foreign_toplevel_handle_v1* handle) {
        static_cast<WlrToplevelBackend*>(data)->toplevel_closed(handle);
    },
    .parent = [](void*, zwlr_foreign_toplevel_handle_v1*, zwlr_foreign_toplevel_handle_v1*) {},
};

WlrToplevelBackend::WlrToplevelBackend(std::chrono::milliseconds roundtrip_timeout)
    : WaylandToplevelBackend("wlroots", roundtrip_timeout) {}

WlrToplevelBackend::~WlrToplevelBackend() {
    disconnect();
}

void WlrToplevelBackend::bind_global(wl_registry* registry, uint32_t name,
                                     const char* interface, uint32_t version) {
    if (manager_ || std::strcmp(interface, zwlr_foreign_toplevel_manager_v1_interface.name) != 0) {
        return;
    }

    manager_ = static_cast<zwlr_foreign_toplevel_manager_v1*>(wl_registry_bind(
        registry, name, &zwlr_foreign_toplevel_manager_v1_interface,
        std::min(version, WLR_TOPLEVEL_VERSION)));
    zwlr_foreign_toplevel_manager_v1_add_listener(manager_, &manager_listener, this);
}

std::string_view WlrToplevelBackend::manager_interface() const {
    return zwlr_foreign_toplevel_manager_v1_interface.name;
}

void WlrToplevelBackend::destroy_handle(void* handle) {
    zwlr_foreign_toplevel_handle_v1_destroy(static_cast<zwlr_foreign_toplevel_handle_v1*>(handle));
}

void WlrToplevelBackend::destroy_manager() {
    if (!manager_) return;
    zwlr_foreign_toplevel_manager_v1_stop(manager_);
    zwlr_foreign_toplevel_manager_v1_destroy(manager_);
    manager_ = nullptr;
}
