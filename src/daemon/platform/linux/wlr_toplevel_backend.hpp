#pragma once

#include "platform/linux/wayland_toplevel_backend.hpp"

struct zwlr_foreign_toplevel_manager_v1;
struct zwlr_foreign_toplevel_manager_v1_listener;
struct zwlr_foreign_toplevel_handle_v1_listener;

// zwlr_foreign_toplevel_manager_v1: Sway, Hyprland, labwc, niri, river,
// wayfire and the other wlroots-style compositors.
class WlrToplevelBackend : public WaylandToplevelBackend {
public:
    explicit WlrToplevelBackend(std::chrono::milliseconds roundtrip_timeout);
    ~WlrToplevelBackend() override;

    AdapterKind kind() const override { return AdapterKind::Wlroots; }

protected:
    void bind_global(wl_registry* registry, uint32_t name,
                     const char* interface, uint32_t version) override;
    bool manager_bound() const override { return manager_ != nullptr; }
    std::string_view manager_interface() const override;
    void destroy_handle(void* handle) override;
    void destroy_manager() override;

private:
    static const zwlr_foreign_toplevel_manager_v1_listener manager_listener;
    static const zwlr_foreign_toplevel_handle_v1_listener handle_listener;

    zwlr_foreign_toplevel_manager_v1* manager_ = nullptr;
};
