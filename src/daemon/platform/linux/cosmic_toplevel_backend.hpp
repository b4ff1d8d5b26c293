#pragma once

#include "platform/linux/wayland_toplevel_backend.hpp"

struct zcosmic_toplevel_info_v1;
struct zcosmic_toplevel_info_v1_listener;
struct zcosmic_toplevel_handle_v1_listener;

// zcosmic_toplevel_info_v1 from cosmic-protocols, bound at version 1 where
// the info object itself announces toplevel handles.
class CosmicToplevelBackend : public WaylandToplevelBackend {
public:
    explicit CosmicToplevelBackend(std::chrono::milliseconds roundtrip_timeout);
    ~CosmicToplevelBackend() override;

    AdapterKind kind() const override { return AdapterKind::Cosmic; }

protected:
    void bind_global(wl_registry* registry, uint32_t name,
                     const char* interface, uint32_t version) override;
    bool manager_bound() const override { return info_ != nullptr; }
    std::string_view manager_interface() const override;
    void destroy_handle(void* handle) override;
    void destroy_manager() override;

private:
    static const zcosmic_toplevel_info_v1_listener info_listener;
    static const zcosmic_toplevel_handle_v1_listener handle_listener;

    zcosmic_toplevel_info_v1* info_ = nullptr;
};
