#include "platform/linux/kwin_script_backend.hpp"

#include "platform/linux/dbus_context_service.hpp"
#include "platform/platform_paths.hpp"

#include <format>
#include <print>

KwinScriptBackend::KwinScriptBackend(DbusConnection& bus, DbusContextService& service,
                                     std::string script_name, std::string script_path,
                                     std::chrono::milliseconds call_timeout)
    : bus_(bus), script_name_(std::move(script_name)), script_path_(std::move(script_path)),
      call_timeout_(call_timeout) {
    service.add_method("NotifyActiveWindow", {"caption", "resource_class", "resource_name"},
                       [this](DBusMessage* msg) { return on_notify(msg); });
}

std::expected<void, BackendError> KwinScriptBackend::connect() {
    if (auto res = bus_.open_session(); !res) {
        return std::unexpected(BackendError::transient(res.error()));
    }

    const char* kwin = KWIN_SERVICE;
    auto has_owner = DbusConnection::method_call(DBUS_SERVICE_DBUS, DBUS_PATH_DBUS,
                                                 DBUS_INTERFACE_DBUS, "NameHasOwner");
    if (!has_owner ||
        !dbus_message_append_args(has_owner.get(), DBUS_TYPE_STRING, &kwin, DBUS_TYPE_INVALID)) {
        return std::unexpected(BackendError::transient("out of memory"));
    }

    auto running = ask_bool(std::move(has_owner), "NameHasOwner");
    if (!running) return std::unexpected(running.error());
    if (!*running) {
        return std::unexpected(BackendError::unavailable(
            std::format("{} is not on the session bus", KWIN_SERVICE)));
    }

    const char* script = script_name_.c_str();
    auto loaded_msg = DbusConnection::method_call(KWIN_SERVICE, SCRIPTING_PATH,
                                                  SCRIPTING_INTERFACE, "isScriptLoaded");
    if (!loaded_msg ||
        !dbus_message_append_args(loaded_msg.get(), DBUS_TYPE_STRING, &script, DBUS_TYPE_INVALID)) {
        return std::unexpected(BackendError::transient("out of memory"));
    }

    auto loaded = ask_bool(std::move(loaded_msg), "isScriptLoaded");
    if (!loaded) return std::unexpected(loaded.error());
    if (!*loaded) {
        return std::unexpected(BackendError::unavailable(
            std::format("KWin script '{}' is not loaded", script_name_)));
    }

    // The script reports on load; without a reload the current window stays
    // unknown until the next activation.
    if (script_path_.empty()) {
        std::println(stderr, "[winctx] main.js of KWin script '{}' not found, cannot reload it",
                     script_name_);
    } else if (auto res = reload_script(); !res) {
        std::println(stderr, "[winctx] reloading KWin script '{}' failed: {}", script_name_, res.error());
    }

    connected_ = true;
    return {};
}

void KwinScriptBackend::disconnect() {
    connected_ = false;
}

std::optional<WindowContext> KwinScriptBackend::normalize(const std::string& caption,
                                                          const std::string& resource_class,
                                                          const std::string& resource_name) {
    if (resource_class.empty() && resource_name.empty()) return std::nullopt;

    WindowContext ctx;
    ctx.app_class = resource_class.empty() ? resource_name : resource_class;
    ctx.app_id = resource_name.empty() ? resource_class : resource_name;
    ctx.window_title = caption;
    ctx.observed_at = std::chrono::steady_clock::now();
    ctx.source_adapter = "kwin";
    return ctx;
}

std::optional<std::string> KwinScriptBackend::locate_script(const SystemSource& source,
                                                           const std::string& script_name) {
    for (const auto& dir : platform::data_dirs(source)) {
        auto path = std::format("{}/kwin/scripts/{}/contents/code/main.js", dir, script_name);
        if (source.file_exists(path)) return path;
    }
    return std::nullopt;
}

DbusMessagePtr KwinScriptBackend::on_notify(DBusMessage* msg) {
    DBusError err;
    dbus_error_init(&err);

    const char* caption = nullptr;
    const char* resource_class = nullptr;
    const char* resource_name = nullptr;
    if (!dbus_message_get_args(msg, &err,
                               DBUS_TYPE_STRING, &caption,
                               DBUS_TYPE_STRING, &resource_class,
                               DBUS_TYPE_STRING, &resource_name,
                               DBUS_TYPE_INVALID)) {
        DbusMessagePtr reply(dbus_message_new_error(msg, err.name, err.message));
        dbus_error_free(&err);
        return reply;
    }

    // Reports that arrive before the backend is up are acknowledged and dropped.
    if (connected_) emit(normalize(caption, resource_class, resource_name));

    return DbusMessagePtr(dbus_message_new_method_return(msg));
}

std::expected<bool, BackendError> KwinScriptBackend::ask_bool(DbusMessagePtr msg,
                                                              const std::string& what) {
    auto reply = bus_.call(msg.get(), call_timeout_);
    if (!reply) {
        const auto& err = reply.error();
        auto text = std::format("{} failed: {} ({})", what, err.message, err.name);
        if (err.service_missing()) return std::unexpected(BackendError::unavailable(std::move(text)));
        return std::unexpected(BackendError::transient(std::move(text)));
    }

    DBusError err;
    dbus_error_init(&err);
    dbus_bool_t value = FALSE;
    if (!dbus_message_get_args(reply->get(), &err, DBUS_TYPE_BOOLEAN, &value, DBUS_TYPE_INVALID)) {
        std::string detail = err.message ? err.message : "bad reply signature";
        dbus_error_free(&err);
        return std::unexpected(BackendError::unavailable(std::format("{}: {}", what, detail)));
    }
    return value != FALSE;
}

std::expected<void, std::string> KwinScriptBackend::reload_script() {
    const char* name = script_name_.c_str();
    const char* path = script_path_.c_str();

    auto unload = DbusConnection::method_call(KWIN_SERVICE, SCRIPTING_PATH, SCRIPTING_INTERFACE,
                                              "unloadScript");
    if (!unload || !dbus_message_append_args(unload.get(), DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID)) {
        return std::unexpected("out of memory");
    }
    if (auto res = ask_bool(std::move(unload), "unloadScript"); !res) {
        return std::unexpected(res.error().message);
    }

    auto load = DbusConnection::method_call(KWIN_SERVICE, SCRIPTING_PATH, SCRIPTING_INTERFACE,
                                            "loadScript");
    if (!load || !dbus_message_append_args(load.get(), DBUS_TYPE_STRING, &path,
                                           DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID)) {
        return std::unexpected("out of memory");
    }
    auto loaded = bus_.call(load.get(), call_timeout_);
    if (!loaded) return std::unexpected(std::format("loadScript failed: {}", loaded.error().message));

    DBusError err;
    dbus_error_init(&err);
    dbus_int32_t id = -1;
    if (!dbus_message_get_args(loaded->get(), &err, DBUS_TYPE_INT32, &id, DBUS_TYPE_INVALID)) {
        std::string detail = err.message ? err.message : "bad reply signature";
        dbus_error_free(&err);
        return std::unexpected(std::format("loadScript: {}", detail));
    }
    if (id < 0) return std::unexpected(std::format("KWin refused to load {}", script_path_));

    auto start = DbusConnection::method_call(KWIN_SERVICE, SCRIPTING_PATH, SCRIPTING_INTERFACE, "start");
    if (!start) return std::unexpected("out of memory");
    if (auto res = bus_.call(start.get(), call_timeout_); !res) {
        return std::unexpected(std::format("start failed: {}", res.error().message));
    }
    return {};
}
