#pragma once

#include "platform/context_backend.hpp"

#include <wayland-client.h>

#include <chrono>
#include <map>
#include <string>
#include <string_view>

// Common part of the foreign-toplevel protocols: display connection, registry
// and the activated-toplevel bookkeeping. Subclasses bind their protocol's
// manager and forward its handle events to the toplevel_* hooks.
class WaylandToplevelBackend : public ContextBackend {
public:
    ~WaylandToplevelBackend() override;

    WaylandToplevelBackend(const WaylandToplevelBackend&) = delete;
    WaylandToplevelBackend& operator=(const WaylandToplevelBackend&) = delete;

    std::expected<void, BackendError> connect() override;
    void disconnect() override;

    int event_fd() const override;
    std::expected<void, BackendError> dispatch() override;
    void flush() override;

protected:
    WaylandToplevelBackend(std::string source_adapter, std::chrono::milliseconds roundtrip_timeout);

    virtual void bind_global(wl_registry* registry, uint32_t name,
                             const char* interface, uint32_t version) = 0;
    virtual bool manager_bound() const = 0;
    virtual std::string_view manager_interface() const = 0;
    virtual void destroy_handle(void* handle) = 0;
    virtual void destroy_manager() = 0;

    // Handle events. Title, app id and state are double-buffered until done.
    void toplevel_added(void* handle);
    void toplevel_title(void* handle, const char* title);
    void toplevel_app_id(void* handle, const char* app_id);
    void toplevel_state(void* handle, const wl_array* states, uint32_t activated);
    void toplevel_done(void* handle);
    void toplevel_closed(void* handle);
    void manager_finished();

    // End of an event batch: report "no focus" if it left nothing activated.
    void settle();

private:
    static const wl_registry_listener registry_listener;

    struct Toplevel {
        std::string title;
        std::string app_id;
        bool pending_activated = false;
        bool activated = false;
    };

    void report(const Toplevel& toplevel);
    // wl_display_roundtrip() that gives up after roundtrip_timeout_.
    std::expected<void, BackendError> roundtrip();

    std::string source_adapter_;
    std::chrono::milliseconds roundtrip_timeout_;

    wl_display* display_ = nullptr;
    wl_registry* registry_ = nullptr;

    std::map<void*, Toplevel> toplevels_;
    void* active_ = nullptr;
    bool focus_lost_ = false;
    bool finished_ = false;

    bool reported_ = false;
    std::optional<WindowContext> last_reported_;
};
