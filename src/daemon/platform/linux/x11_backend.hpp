#pragma once

#include "platform/context_backend.hpp"

#include <xcb/xcb.h>
#include <xcb/xcb_ewmh.h>

#include <memory>

// In-process focus tracking for X11 sessions through EWMH. Properties are
// read with request/reply; PropertyNotify on the root window and on the
// active window only triggers a re-query.
class X11Backend : public ContextBackend {
public:
    X11Backend();
    ~X11Backend() override;

    X11Backend(const X11Backend&) = delete;
    X11Backend& operator=(const X11Backend&) = delete;

    AdapterKind kind() const override { return AdapterKind::X11; }

    std::expected<void, BackendError> connect() override;
    void disconnect() override;

    int event_fd() const override;
    std::expected<void, BackendError> dispatch() override;
    void flush() override;

    // nullopt when _NET_ACTIVE_WINDOW is None or unreadable.
    std::optional<WindowContext> query_active();

private:
    using EventSource = xcb_generic_event_t* (*)(xcb_connection_t*);

    // Consumes events from next until it runs dry. True if any calls for a re-query.
    bool drain(EventSource next);
    // Replies read during refresh() can pull events into xcb's queue, where
    // they no longer make the fd readable; keep going until none are left.
    void refresh_until_quiet();
    void refresh();
    void watch(xcb_window_t window);
    std::string window_title(xcb_window_t window);

    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_{nullptr, xcb_disconnect};
    xcb_ewmh_connection_t ewmh_{};
    bool ewmh_ready_ = false;
    int screen_nbr_ = 0;
    xcb_window_t root_ = XCB_NONE;
    xcb_window_t active_ = XCB_NONE;

    bool reported_ = false;
    std::optional<WindowContext> last_;
};
