#pragma once

#include "platform/context_backend.hpp"
#include "platform/linux/dbus_connection.hpp"

#include <nlohmann/json.hpp>

// Polls the focused-window-dbus GNOME Shell extension. The extension has no
// change signal, so the adapter republishes only when the answer changes.
class GnomeExtensionBackend : public ContextBackend {
public:
    static constexpr char SERVICE[] = "org.gnome.Shell";
    static constexpr char PATH[] = "/org/gnome/shell/extensions/FocusedWindow";
    static constexpr char INTERFACE[] = "org.gnome.shell.extensions.FocusedWindow";

    GnomeExtensionBackend(DbusConnection& bus, std::chrono::milliseconds call_timeout,
                          std::chrono::milliseconds poll_interval);

    AdapterKind kind() const override { return AdapterKind::GnomeExtension; }

    std::expected<void, BackendError> connect() override;
    void disconnect() override;

    std::chrono::milliseconds poll_interval() const override { return poll_interval_; }
    std::expected<void, BackendError> poll() override;

    // Decode the extension's Get() answer. "{}" and an empty string mean no
    // focused window.
    static std::expected<std::optional<WindowContext>, std::string> parse_focused_window(
        const std::string& json_text);

private:
    std::expected<std::string, BackendError> query();

    DbusConnection& bus_;
    std::chrono::milliseconds call_timeout_;
    std::chrono::milliseconds poll_interval_;

    bool connected_ = false;
    bool have_last_ = false;
    std::optional<WindowContext> last_;
};
