#include "platform/linux/cosmic_toplevel_backend.hpp"

#include "cosmic-toplevel-info-unstable-v1-client-protocol.h"

#include <cstring>

static constexpr uint32_t COSMIC_TOPLEVEL_INFO_VERSION = 1;

const zcosmic_toplevel_info_v1_listener CosmicToplevelBackend::info_listener{
    .toplevel = [](void* data, zcosmic_toplevel_info_v1*, zcosmic_toplevel_handle_v1* handle) {
        auto* self = static_cast<CosmicToplevelBackend*>(data);
        self->toplevel_added(handle);
        zcosmic_toplevel_handle_v1_add_listener(handle, &handle_listener, self);
    },
    .finished = [](void* data, zcosmic_toplevel_info_v1*) {
        static_cast<CosmicToplevelBackend*>(data)->manager_finished();
    },
};

const zcosmic_toplevel_handle_v1_listener CosmicToplevelBackend::handle_listener{
    .closed = [](void* data, zcosmic_toplevel_handle_v1* handle) {
        static_cast<CosmicToplevelBackend*>(data)->toplevel_closed(handle);
    },
    .done = [](void* data, zcosmic_toplevel_handle_v1* handle) {
        static_cast<CosmicToplevelBackend*>(data)->toplevel_done(handle);
    },
    .title = [](void* data, zcosmic_toplevel_handle_v1* handle, const char* title) {
        static_cast<CosmicToplevelBackend*>(data)->toplevel_title(handle, title);
    },
    .app_id = [](void* data, zcosmic_toplevel_handle_v1* handle, const char* app_id) {
        static_cast<CosmicToplevelBackend*>(data)->toplevel_app_id(handle, app_id);
    },
    .output_enter = [](void*, zcosmic_toplevel_handle_v1*, wl_output*) {},
    .output_leave = [](void*, zcosmic_toplevel_handle_v1*, wl_output*) {},
    .workspace_enter = [](void*, zcosmic_toplevel_handle_v1*, zcosmic_workspace_handle_v1*) {},
    .workspace_leave = [](void*, zcosmic_toplevel_handle_v1*, zcosmic_workspace_handle_v1*) {},
    .state = [](void* data, zcosmic_toplevel_handle_v1* handle, wl_array* states) {
        static_cast<CosmicToplevelBackend*>(data)->toplevel_state(
            handle, states, ZCOSMIC_TOPLEVEL_HANDLE_V1_STATE_ACTIVATED);
    },
};

CosmicToplevelBackend::CosmicToplevelBackend(std::chrono::milliseconds roundtrip_timeout)
    : WaylandToplevelBackend("cosmic", roundtrip_timeout) {}

CosmicToplevelBackend::~CosmicToplevelBackend() {
    disconnect();
}

void CosmicToplevelBackend::bind_global(wl_registry* registry, uint32_t name,
                                        const char* interface, uint32_t /*version*/) {
    if (info_ || std::strcmp(interface, zcosmic_toplevel_info_v1_interface.name) != 0) return;

    info_ = static_cast<zcosmic_toplevel_info_v1*>(wl_registry_bind(
        registry, name, &zcosmic_toplevel_info_v1_interface, COSMIC_TOPLEVEL_INFO_VERSION));
    zcosmic_toplevel_info_v1_add_listener(info_, &info_listener, this);
}

std::string_view CosmicToplevelBackend::manager_interface() const {
    return zcosmic_toplevel_info_v1_interface.name;
}

void CosmicToplevelBackend::destroy_handle(void* handle) {
    zcosmic_toplevel_handle_v1_destroy(static_cast<zcosmic_toplevel_handle_v1*>(handle));
}

void CosmicToplevelBackend::destroy_manager() {
    if (!info_) return;
    zcosmic_toplevel_info_v1_stop(info_);
    zcosmic_toplevel_info_v1_destroy(info_);
    info_ = nullptr;
}
