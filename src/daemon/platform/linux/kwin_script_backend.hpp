#pragma once

#include "platform/context_backend.hpp"
#include "platform/linux/dbus_connection.hpp"
#include "platform/system_source.hpp"

class DbusContextService;

// Receives focus reports from a KWin script that calls
// NotifyActiveWindow(caption, resource_class, resource_name) on the adapter's
// own object. KWin offers no equivalent query for external clients, so every
// connect reloads the script to make it report the current window again.
class KwinScriptBackend : public ContextBackend {
public:
    static constexpr char KWIN_SERVICE[] = "org.kde.KWin";
    static constexpr char SCRIPTING_PATH[] = "/Scripting";
    static constexpr char SCRIPTING_INTERFACE[] = "org.kde.kwin.Scripting";

    // Registers NotifyActiveWindow on `service`, which must not be started yet.
    // `script_path` is the script's main.js; empty disables the reload.
    KwinScriptBackend(DbusConnection& bus, DbusContextService& service, std::string script_name,
                      std::string script_path, std::chrono::milliseconds call_timeout);

    AdapterKind kind() const override { return AdapterKind::Kwin; }

    std::expected<void, BackendError> connect() override;
    void disconnect() override;

    // A report with an empty resource class means nothing has focus
    // (the desktop or no client at all).
    static std::optional<WindowContext> normalize(const std::string& caption,
                                                  const std::string& resource_class,
                                                  const std::string& resource_name);

    // kwin/scripts/<name>/contents/code/main.js in the first XDG data
    // directory that has it.
    static std::optional<std::string> locate_script(const SystemSource& source,
                                                    const std::string& script_name);

private:
    DbusMessagePtr on_notify(DBusMessage* msg);
    std::expected<bool, BackendError> ask_bool(DbusMessagePtr msg, const std::string& what);
    std::expected<void, std::string> reload_script();

    DbusConnection& bus_;
    std::string script_name_;
    std::string script_path_;
    std::chrono::milliseconds call_timeout_;
    bool connected_ = false;
};
