#include "platform/linux/dbus_context_client.hpp"

#include <format>
#include <print>

DbusContextClient::DbusContextClient(AdapterKind kind, std::chrono::milliseconds call_timeout)
    : identity_(bus_identity(kind)), call_timeout_(call_timeout) {}

std::expected<void, std::string> DbusContextClient::connect() {
    bus_.on_signal([this](DBusMessage* msg) { on_signal(msg); });

    if (auto res = bus_.open_session(); !res) return res;

    auto res = bus_.add_match(std::format(
        "type='signal',path='{}',interface='{}',member='{}'",
        identity_.path, identity_.interface, wire::SIGNAL_ACTIVE_WINDOW_CHANGED));
    if (!res) return res;

    res = bus_.add_match(std::format(
        "type='signal',path='{}',interface='{}',member='{}'",
        identity_.path, identity_.interface, wire::SIGNAL_STATE_CHANGED));
    if (!res) return res;

    res = bus_.add_match(std::format(
        "type='signal',sender='{}',interface='{}',member='NameOwnerChanged',arg0='{}'",
        DBUS_SERVICE_DBUS, DBUS_INTERFACE_DBUS, identity_.name));
    if (!res) return res;

    seed();
    // Signals read while blocked in seed() sit in libdbus's queue and will not
    // wake the event loop.
    if (!bus_.dispatch()) return std::unexpected(std::string("session bus connection lost"));
    return {};
}

bool DbusContextClient::process_events() {
    if (!bus_.dispatch()) return false;

    // Blocking calls are kept out of the signal filter.
    while (reseed_) {
        reseed_ = false;
        seed();
        if (!bus_.dispatch()) return false;
    }
    return true;
}

void DbusContextClient::on_signal(DBusMessage* msg) {
    if (dbus_message_is_signal(msg, identity_.interface.c_str(), wire::SIGNAL_ACTIVE_WINDOW_CHANGED)) {
        if (auto dict = DbusConnection::read_dict(msg)) {
            apply(*dict);
        } else {
            std::println(stderr, "[winctx] malformed {} signal", wire::SIGNAL_ACTIVE_WINDOW_CHANGED);
        }
        return;
    }

    if (dbus_message_is_signal(msg, identity_.interface.c_str(), wire::SIGNAL_STATE_CHANGED)) {
        DBusError err;
        dbus_error_init(&err);
        const char* state = nullptr;
        if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &state, DBUS_TYPE_INVALID)) {
            dbus_error_free(&err);
            return;
        }
        // "active" is followed by ActiveWindowChanged, which revives the hub.
        if (!is_live_state(state)) hub_.mark_stale();
        return;
    }

    if (dbus_message_is_signal(msg, DBUS_INTERFACE_DBUS, "NameOwnerChanged")) {
        DBusError err;
        dbus_error_init(&err);
        const char* name = nullptr;
        const char* old_owner = nullptr;
        const char* new_owner = nullptr;
        if (!dbus_message_get_args(msg, &err,
                                   DBUS_TYPE_STRING, &name,
                                   DBUS_TYPE_STRING, &old_owner,
                                   DBUS_TYPE_STRING, &new_owner,
                                   DBUS_TYPE_INVALID)) {
            dbus_error_free(&err);
            return;
        }
        if (identity_.name != name) return;

        if (*new_owner == '\0') {
            hub_.mark_stale();
        } else {
            reseed_ = true;
        }
    }
}

void DbusContextClient::seed() {
    auto msg = DbusConnection::method_call(identity_.name, identity_.path,
                                           identity_.interface, "GetActiveWindow");
    if (!msg) return;

    auto reply = bus_.call(msg.get(), call_timeout_);
    if (!reply) {
        // Adapter not running (yet), or running without its backend. The name
        // owner or the next StateChanged tells us when that changes.
        if (reply.error().name != wire::ERROR_STALE) {
            std::println(stderr, "[winctx] GetActiveWindow failed: {}", reply.error().message);
        }
        hub_.mark_stale();
        return;
    }

    if (auto dict = DbusConnection::read_dict(reply->get())) {
        apply(*dict);
    } else {
        std::println(stderr, "[winctx] malformed GetActiveWindow reply");
        hub_.mark_stale();
    }
}

bool DbusContextClient::is_live_state(std::string_view state) {
    return state == "active";
}

void DbusContextClient::apply(const StringDict& dict) {
    if (auto ctx = wire::from_dict(dict)) {
        hub_.publish(std::move(*ctx));
    } else {
        hub_.clear();
    }
}
