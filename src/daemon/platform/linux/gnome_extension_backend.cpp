#include "platform/linux/gnome_extension_backend.hpp"

#include <algorithm>
#include <format>

using json = nlohmann::json;

namespace {

std::string string_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return {};
    return j[key].get<std::string>();
}

bool same(const std::optional<WindowContext>& a, const std::optional<WindowContext>& b) {
    if (!a || !b) return !a && !b;
    return a->same_window(*b);
}

} // namespace

GnomeExtensionBackend::GnomeExtensionBackend(DbusConnection& bus,
                                             std::chrono::milliseconds call_timeout,
                                             std::chrono::milliseconds poll_interval)
    : bus_(bus), call_timeout_(call_timeout),
      poll_interval_(std::max(poll_interval, std::chrono::milliseconds{50})) {}

std::expected<void, BackendError> GnomeExtensionBackend::connect() {
    if (auto res = bus_.open_session(); !res) {
        return std::unexpected(BackendError::transient(res.error()));
    }

    // First query doubles as the presence check for the extension.
    auto answer = query();
    if (!answer) return std::unexpected(answer.error());

    auto parsed = parse_focused_window(*answer);
    if (!parsed) {
        return std::unexpected(BackendError::unavailable(
            std::format("unexpected answer from {}: {}", INTERFACE, parsed.error())));
    }

    connected_ = true;
    have_last_ = true;
    last_ = *parsed;
    emit(last_);
    return {};
}

void GnomeExtensionBackend::disconnect() {
    connected_ = false;
    have_last_ = false;
    last_.reset();
}

std::expected<void, BackendError> GnomeExtensionBackend::poll() {
    if (!connected_) return std::unexpected(BackendError::transient("not connected"));

    auto answer = query();
    if (!answer) return std::unexpected(answer.error());

    auto parsed = parse_focused_window(*answer);
    if (!parsed) {
        // One malformed answer is not fatal; keep the last value.
        return std::unexpected(BackendError::transient(parsed.error()));
    }

    if (have_last_ && same(last_, *parsed)) return {};

    have_last_ = true;
    last_ = *parsed;
    emit(last_);
    return {};
}

std::expected<std::string, BackendError> GnomeExtensionBackend::query() {
    auto msg = DbusConnection::method_call(SERVICE, PATH, INTERFACE, "Get");
    if (!msg) return std::unexpected(BackendError::transient("out of memory"));

    auto reply = bus_.call(msg.get(), call_timeout_);
    if (!reply) {
        const auto& err = reply.error();
        auto text = std::format("{}.Get failed: {} ({})", INTERFACE, err.message, err.name);
        if (err.service_missing()) return std::unexpected(BackendError::unavailable(std::move(text)));
        return std::unexpected(BackendError::transient(std::move(text)));
    }

    DBusError err;
    dbus_error_init(&err);
    const char* text = nullptr;
    if (!dbus_message_get_args(reply->get(), &err, DBUS_TYPE_STRING, &text, DBUS_TYPE_INVALID)) {
        std::string what = err.message ? err.message : "bad reply signature";
        dbus_error_free(&err);
        return std::unexpected(BackendError::unavailable(
            std::format("{}.Get returned an unexpected reply: {}", INTERFACE, what)));
    }
    return std::string(text);
}

std::expected<std::optional<WindowContext>, std::string> GnomeExtensionBackend::parse_focused_window(
    const std::string& json_text) {
    if (json_text.empty()) return std::optional<WindowContext>{};

    try {
        auto j = json::parse(json_text);
        if (j.is_null()) return std::optional<WindowContext>{};
        if (!j.is_object()) return std::unexpected("expected a JSON object");
        if (j.empty()) return std::optional<WindowContext>{};

        WindowContext ctx;
        ctx.app_class = string_field(j, "wm_class");
        ctx.app_id = string_field(j, "wm_class_instance");
        if (ctx.app_id.empty()) ctx.app_id = ctx.app_class;
        ctx.window_title = string_field(j, "title");
        ctx.observed_at = std::chrono::steady_clock::now();
        ctx.source_adapter = "gnome";
        return ctx;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("parse error: {}", e.what()));
    }
}
