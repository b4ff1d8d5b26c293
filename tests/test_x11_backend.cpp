#include <catch2/catch_test_macros.hpp>

#include "platform/linux/x11_backend.hpp"

#include <poll.h>

#include <cstdlib>
#include <cstring>
#include <format>
#include <functional>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Plays the window manager: owns a window and sets root's _NET_ACTIVE_WINDOW.
class FakeWindowManager {
public:
    FakeWindowManager() : conn_(xcb_connect(nullptr, nullptr)) {
        if (xcb_connection_has_error(conn_)) return;
        root_ = xcb_setup_roots_iterator(xcb_get_setup(conn_)).data->root;
        net_active_window_ = intern("_NET_ACTIVE_WINDOW");
        net_wm_name_ = intern("_NET_WM_NAME");
        utf8_string_ = intern("UTF8_STRING");
    }

    ~FakeWindowManager() {
        for (auto window : windows_) xcb_destroy_window(conn_, window);
        if (!xcb_connection_has_error(conn_)) set_active(XCB_NONE);
        xcb_disconnect(conn_);
    }

    bool ok() const { return !xcb_connection_has_error(conn_); }

    xcb_window_t create(std::string_view instance, std::string_view cls) {
        xcb_window_t window = xcb_generate_id(conn_);
        xcb_create_window(conn_, XCB_COPY_FROM_PARENT, window, root_, 0, 0, 10, 10, 0,
                          XCB_WINDOW_CLASS_INPUT_OUTPUT, XCB_COPY_FROM_PARENT, 0, nullptr);
        // WM_CLASS is two NUL-terminated strings.
        std::string wm_class = std::format("{}{}{}{}", instance, '\0', cls, '\0');
        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, window, XCB_ATOM_WM_CLASS,
                            XCB_ATOM_STRING, 8, static_cast<uint32_t>(wm_class.size()), wm_class.data());
        windows_.push_back(window);
        return window;
    }

    void set_title(xcb_window_t window, std::string_view title) {
        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, window, net_wm_name_, utf8_string_, 8,
                            static_cast<uint32_t>(title.size()), title.data());
        xcb_flush(conn_);
    }

    void set_active(xcb_window_t window) {
        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, root_, net_active_window_,
                            XCB_ATOM_WINDOW, 32, 1, &window);
        xcb_flush(conn_);
    }

private:
    xcb_atom_t intern(const char* name) {
        auto cookie = xcb_intern_atom(conn_, 0, std::strlen(name), name);
        auto* reply = xcb_intern_atom_reply(conn_, cookie, nullptr);
        xcb_atom_t atom = reply ? reply->atom : XCB_NONE;
        std::free(reply);
        return atom;
    }

    xcb_connection_t* conn_;
    xcb_window_t root_ = XCB_NONE;
    xcb_atom_t net_active_window_ = XCB_NONE;
    xcb_atom_t net_wm_name_ = XCB_NONE;
    xcb_atom_t utf8_string_ = XCB_NONE;
    std::vector<xcb_window_t> windows_;
};

// Dispatches only when the fd is readable, like the adapter's event loop.
bool wait_for(X11Backend& backend, const std::function<bool()>& pred,
              std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred() && std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{backend.event_fd(), POLLIN, 0};
        if (::poll(&pfd, 1, 20) > 0 && !backend.dispatch()) return false;
        backend.flush();
    }
    return pred();
}

} // namespace

TEST_CASE("Integration: X11 backend follows the active window", "[integration][x11]") {
    const char* display = std::getenv("DISPLAY");
    if (!display || !*display) {
        WARN("DISPLAY not set; skipping X11 integration test.");
        return;
    }

    FakeWindowManager wm;
    if (!wm.ok()) {
        WARN("Failed to connect to X server.");
        return;
    }
    wm.set_active(XCB_NONE);

    X11Backend backend;
    std::vector<std::optional<WindowContext>> emitted;
    backend.set_listener([&](std::optional<WindowContext> ctx) { emitted.push_back(std::move(ctx)); });
    REQUIRE(backend.connect().has_value());

    auto window = wm.create("xterm", "XTerm");
    wm.set_title(window, "shell");
    wm.set_active(window);

    REQUIRE(wait_for(backend, [&] {
        return !emitted.empty() && emitted.back() && emitted.back()->window_title == "shell";
    }, 2s));
    REQUIRE(emitted.back()->app_id == "xterm");
    REQUIRE(emitted.back()->app_class == "XTerm");

    SECTION("TitleBurstEndsOnLastTitle") {
        for (int i = 0; i < 50; ++i) {
            wm.set_title(window, std::format("build {}", i));
        }
        REQUIRE(wait_for(backend, [&] {
            return emitted.back() && emitted.back()->window_title == "build 49";
        }, 2s));
    }

    SECTION("ActiveWindowCleared") {
        wm.set_active(XCB_NONE);
        REQUIRE(wait_for(backend, [&] { return !emitted.back().has_value(); }, 2s));
    }
}
