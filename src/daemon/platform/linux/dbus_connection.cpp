#include "platform/linux/dbus_connection.hpp"

#include <algorithm>
#include <format>
#include <limits>

namespace {

std::string take_error(DBusError& err, std::string_view what) {
    std::string msg = dbus_error_is_set(&err)
        ? std::format("{}: {}", what, err.message)
        : std::string(what);
    dbus_error_free(&err);
    return msg;
}

} // namespace

bool DbusCallError::timed_out() const {
    return name == DBUS_ERROR_TIMEOUT || name == DBUS_ERROR_NO_REPLY ||
           name == DBUS_ERROR_TIMED_OUT;
}

bool DbusCallError::service_missing() const {
    return name == DBUS_ERROR_SERVICE_UNKNOWN || name == DBUS_ERROR_NAME_HAS_NO_OWNER ||
           name == DBUS_ERROR_UNKNOWN_OBJECT || name == DBUS_ERROR_UNKNOWN_INTERFACE ||
           name == DBUS_ERROR_UNKNOWN_METHOD;
}

DbusConnection::~DbusConnection() {
    close();
}

std::expected<void, std::string> DbusConnection::open_session() {
    if (conn_) return {};

    DBusError err;
    dbus_error_init(&err);

    conn_ = dbus_bus_get_private(DBUS_BUS_SESSION, &err);
    if (!conn_) {
        return std::unexpected(take_error(err, "cannot connect to session bus"));
    }

    // libdbus calls _exit() on disconnect unless told otherwise.
    dbus_connection_set_exit_on_disconnect(conn_, FALSE);

    if (!signal_handlers_.empty()) {
        filter_added_ = dbus_connection_add_filter(conn_, &DbusConnection::filter_trampoline,
                                                   this, nullptr);
    }
    return {};
}

void DbusConnection::close() {
    if (!conn_) return;

    for (auto& [path, handler] : objects_) {
        dbus_connection_unregister_object_path(conn_, path.c_str());
    }
    objects_.clear();
    if (filter_added_) {
        dbus_connection_remove_filter(conn_, &DbusConnection::filter_trampoline, this);
        filter_added_ = false;
    }

    dbus_connection_close(conn_);
    dbus_connection_unref(conn_);
    conn_ = nullptr;
}

bool DbusConnection::connected() const {
    return conn_ && dbus_connection_get_is_connected(conn_);
}

int DbusConnection::fd() const {
    int fd = -1;
    if (!conn_ || !dbus_connection_get_unix_fd(conn_, &fd)) return -1;
    return fd;
}

bool DbusConnection::dispatch() {
    if (!conn_) return false;

    if (!dbus_connection_read_write(conn_, 0)) return false;
    while (dbus_connection_dispatch(conn_) == DBUS_DISPATCH_DATA_REMAINS) {
    }
    return dbus_connection_get_is_connected(conn_);
}

void DbusConnection::flush() {
    if (conn_) dbus_connection_flush(conn_);
}

std::expected<void, std::string> DbusConnection::request_name(const std::string& name) {
    if (!conn_) return std::unexpected("not connected");

    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn_, name.c_str(), DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (ret < 0) {
        return std::unexpected(take_error(err, std::format("cannot request {}", name)));
    }
    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER && ret != DBUS_REQUEST_NAME_REPLY_ALREADY_OWNER) {
        return std::unexpected(std::format("{} is already owned by another process", name));
    }
    return {};
}

void DbusConnection::release_name(const std::string& name) {
    if (!connected()) return;

    DBusError err;
    dbus_error_init(&err);
    dbus_bus_release_name(conn_, name.c_str(), &err);
    dbus_error_free(&err);
}

std::expected<void, std::string> DbusConnection::register_object(const std::string& path,
                                                                 MethodHandler handler) {
    if (!conn_) return std::unexpected("not connected");

    static const DBusObjectPathVTable vtable{
        .unregister_function = nullptr,
        .message_function = &DbusConnection::object_trampoline,
    };

    auto owned = std::make_unique<MethodHandler>(std::move(handler));

    DBusError err;
    dbus_error_init(&err);
    if (!dbus_connection_try_register_object_path(conn_, path.c_str(), &vtable, owned.get(), &err)) {
        return std::unexpected(take_error(err, std::format("cannot register {}", path)));
    }

    objects_[path] = std::move(owned);
    return {};
}

void DbusConnection::unregister_object(const std::string& path) {
    auto it = objects_.find(path);
    if (it == objects_.end()) return;
    if (conn_) dbus_connection_unregister_object_path(conn_, path.c_str());
    objects_.erase(it);
}

std::expected<void, std::string> DbusConnection::add_match(const std::string& rule) {
    if (!conn_) return std::unexpected("not connected");

    DBusError err;
    dbus_error_init(&err);
    dbus_bus_add_match(conn_, rule.c_str(), &err);
    if (dbus_error_is_set(&err)) {
        return std::unexpected(take_error(err, "cannot add match rule"));
    }
    return {};
}

void DbusConnection::on_signal(SignalHandler handler) {
    signal_handlers_.push_back(std::move(handler));
    if (conn_ && !filter_added_) {
        filter_added_ = dbus_connection_add_filter(conn_, &DbusConnection::filter_trampoline,
                                                   this, nullptr);
    }
}

std::expected<DbusMessagePtr, DbusCallError> DbusConnection::call(DBusMessage* msg,
                                                                  std::chrono::milliseconds timeout) {
    if (!conn_) return std::unexpected(DbusCallError{DBUS_ERROR_DISCONNECTED, "not connected"});

    DBusError err;
    dbus_error_init(&err);

    auto timeout_ms = std::clamp<std::chrono::milliseconds::rep>(
        timeout.count(), 0, std::numeric_limits<int>::max());
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(
        conn_, msg, static_cast<int>(timeout_ms), &err);
    if (!reply) {
        DbusCallError error{
            .name = err.name ? err.name : DBUS_ERROR_FAILED,
            .message = err.message ? err.message : "no reply",
        };
        dbus_error_free(&err);
        return std::unexpected(std::move(error));
    }
    return DbusMessagePtr(reply);
}

bool DbusConnection::send(DBusMessage* msg) {
    return conn_ && dbus_connection_send(conn_, msg, nullptr);
}

DbusMessagePtr DbusConnection::method_call(const std::string& destination, const std::string& path,
                                           const std::string& interface, const std::string& method) {
    return DbusMessagePtr(dbus_message_new_method_call(
        destination.c_str(), path.c_str(), interface.c_str(), method.c_str()));
}

bool DbusConnection::append_dict(DBusMessageIter* iter, const StringDict& dict) {
    DBusMessageIter array;
    if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{ss}", &array)) return false;

    for (const auto& [key, value] : dict) {
        DBusMessageIter entry;
        const char* k = key.c_str();
        const char* v = value.c_str();
        if (!dbus_message_iter_open_container(&array, DBUS_TYPE_DICT_ENTRY, nullptr, &entry) ||
            !dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &k) ||
            !dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &v) ||
            !dbus_message_iter_close_container(&array, &entry)) {
            dbus_message_iter_abandon_container(iter, &array);
            return false;
        }
    }

    return dbus_message_iter_close_container(iter, &array);
}

bool DbusConnection::append_dict(DBusMessage* msg, const StringDict& dict) {
    DBusMessageIter iter;
    dbus_message_iter_init_append(msg, &iter);
    return append_dict(&iter, dict);
}

std::optional<StringDict> DbusConnection::read_dict(DBusMessageIter* iter) {
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
        dbus_message_iter_get_element_type(iter) != DBUS_TYPE_DICT_ENTRY) {
        return std::nullopt;
    }

    StringDict dict;
    DBusMessageIter array;
    dbus_message_iter_recurse(iter, &array);

    while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&array, &entry);

        const char* key = nullptr;
        const char* value = nullptr;
        if (dbus_message_iter_get_arg_type(&entry) != DBUS_TYPE_STRING) return std::nullopt;
        dbus_message_iter_get_basic(&entry, &key);
        if (!dbus_message_iter_next(&entry) ||
            dbus_message_iter_get_arg_type(&entry) != DBUS_TYPE_STRING) {
            return std::nullopt;
        }
        dbus_message_iter_get_basic(&entry, &value);

        dict[key] = value;
        dbus_message_iter_next(&array);
    }

    return dict;
}

std::optional<StringDict> DbusConnection::read_dict(DBusMessage* msg) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return std::nullopt;
    return read_dict(&iter);
}

DBusHandlerResult DbusConnection::object_trampoline(DBusConnection* conn, DBusMessage* msg, void* data) {
    auto& handler = *static_cast<MethodHandler*>(data);
    auto reply = handler(msg);
    if (!reply) return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;

    if (!dbus_message_get_no_reply(msg) && !dbus_connection_send(conn, reply.get(), nullptr)) {
        return DBUS_HANDLER_RESULT_NEED_MEMORY;
    }
    return DBUS_HANDLER_RESULT_HANDLED;
}

DBusHandlerResult DbusConnection::filter_trampoline(DBusConnection*, DBusMessage* msg, void* data) {
    if (dbus_message_get_type(msg) != DBUS_MESSAGE_TYPE_SIGNAL) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    auto* self = static_cast<DbusConnection*>(data);
    for (auto& handler : self->signal_handlers_) {
        handler(msg);
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}
