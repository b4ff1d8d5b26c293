#include "platform/linux/x11_backend.hpp"

#include <xcb/xcb_icccm.h>

#include <cstdlib>
#include <format>

X11Backend::X11Backend() = default;

X11Backend::~X11Backend() {
    disconnect();
}

std::expected<void, BackendError> X11Backend::connect() {
    if (conn_) return {};

    conn_.reset(xcb_connect(nullptr, &screen_nbr_));
    if (xcb_connection_has_error(conn_.get())) {
        conn_.reset();
        return std::unexpected(BackendError::unavailable("cannot open X display"));
    }

    auto setup_iter = xcb_setup_roots_iterator(xcb_get_setup(conn_.get()));
    for (int i = 0; i < screen_nbr_ && setup_iter.rem; ++i) {
        xcb_screen_next(&setup_iter);
    }
    if (!setup_iter.data) {
        conn_.reset();
        return std::unexpected(BackendError::unavailable("X display has no screen"));
    }
    root_ = setup_iter.data->root;

    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr)) {
        conn_.reset();
        return std::unexpected(BackendError::unavailable("failed to initialize EWMH atoms"));
    }
    ewmh_ready_ = true;

    uint32_t mask = XCB_EVENT_MASK_PROPERTY_CHANGE;
    xcb_change_window_attributes(conn_.get(), root_, XCB_CW_EVENT_MASK, &mask);

    refresh_until_quiet();
    xcb_flush(conn_.get());
    return {};
}

void X11Backend::disconnect() {
    if (ewmh_ready_) {
        xcb_ewmh_connection_wipe(&ewmh_);
        ewmh_ready_ = false;
    }
    conn_.reset();
    root_ = XCB_NONE;
    active_ = XCB_NONE;
    reported_ = false;
    last_.reset();
}

int X11Backend::event_fd() const {
    return conn_ ? xcb_get_file_descriptor(conn_.get()) : -1;
}

std::expected<void, BackendError> X11Backend::dispatch() {
    if (!conn_) return std::unexpected(BackendError::transient("not connected"));

    bool changed = drain(xcb_poll_for_event);

    if (xcb_connection_has_error(conn_.get())) {
        return std::unexpected(BackendError::transient("X connection lost"));
    }

    if (changed) refresh_until_quiet();

    if (xcb_connection_has_error(conn_.get())) {
        return std::unexpected(BackendError::transient("X connection lost"));
    }
    return {};
}

bool X11Backend::drain(EventSource next) {
    bool changed = false;
    while (xcb_generic_event_t* ev = next(conn_.get())) {
        // Errors (response_type 0) come from windows destroyed under us.
        if ((ev->response_type & ~0x80) == XCB_PROPERTY_NOTIFY) {
            auto* e = reinterpret_cast<xcb_property_notify_event_t*>(ev);
            if (e->window == root_ && e->atom == ewmh_._NET_ACTIVE_WINDOW) {
                changed = true;
            } else if (e->window == active_ &&
                       (e->atom == ewmh_._NET_WM_NAME || e->atom == XCB_ATOM_WM_NAME ||
                        e->atom == XCB_ATOM_WM_CLASS)) {
                changed = true;
            }
        }
        std::free(ev);
    }
    return changed;
}

void X11Backend::refresh_until_quiet() {
    do {
        refresh();
    } while (drain(xcb_poll_for_queued_event));
}

void X11Backend::flush() {
    if (conn_) xcb_flush(conn_.get());
}

std::optional<WindowContext> X11Backend::query_active() {
    if (!conn_) return std::nullopt;

    xcb_window_t window = XCB_NONE;
    if (!xcb_ewmh_get_active_window_reply(&ewmh_, xcb_ewmh_get_active_window(&ewmh_, screen_nbr_),
                                          &window, nullptr) ||
        window == XCB_NONE) {
        watch(XCB_NONE);
        return std::nullopt;
    }
    watch(window);

    WindowContext ctx;
    xcb_icccm_get_wm_class_reply_t wm_class;
    if (xcb_icccm_get_wm_class_reply(conn_.get(), xcb_icccm_get_wm_class(conn_.get(), window),
                                     &wm_class, nullptr)) {
        ctx.app_id = wm_class.instance_name ? wm_class.instance_name : "";
        ctx.app_class = wm_class.class_name ? wm_class.class_name : "";
        xcb_icccm_get_wm_class_reply_wipe(&wm_class);
    }
    ctx.window_title = window_title(window);
    ctx.observed_at = std::chrono::steady_clock::now();
    ctx.source_adapter = "x11";
    return ctx;
}

void X11Backend::refresh() {
    auto ctx = query_active();

    if (reported_) {
        if (!ctx && !last_) return;
        if (ctx && last_ && ctx->same_window(*last_)) return;
    }

    reported_ = true;
    last_ = ctx;
    emit(std::move(ctx));
}

void X11Backend::watch(xcb_window_t window) {
    if (window == active_) return;

    if (active_ != XCB_NONE && active_ != root_) {
        uint32_t none = XCB_EVENT_MASK_NO_EVENT;
        xcb_change_window_attributes(conn_.get(), active_, XCB_CW_EVENT_MASK, &none);
    }
    if (window != XCB_NONE && window != root_) {
        uint32_t mask = XCB_EVENT_MASK_PROPERTY_CHANGE;
        xcb_change_window_attributes(conn_.get(), window, XCB_CW_EVENT_MASK, &mask);
    }
    active_ = window;
}

std::string X11Backend::window_title(xcb_window_t window) {
    xcb_ewmh_get_utf8_strings_reply_t utf8;
    if (xcb_ewmh_get_wm_name_reply(&ewmh_, xcb_ewmh_get_wm_name(&ewmh_, window), &utf8, nullptr)) {
        std::string title(utf8.strings, utf8.strings_len);
        xcb_ewmh_get_utf8_strings_reply_wipe(&utf8);
        if (!title.empty()) return title;
    }

    xcb_icccm_get_text_property_reply_t prop;
    if (xcb_icccm_get_wm_name_reply(conn_.get(), xcb_icccm_get_wm_name(conn_.get(), window),
                                    &prop, nullptr)) {
        std::string title(prop.name, prop.name_len);
        xcb_icccm_get_text_property_reply_wipe(&prop);
        return title;
    }
    return {};
}
