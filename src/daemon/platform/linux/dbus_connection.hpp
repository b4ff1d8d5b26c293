#pragma once

#include "context/wire_format.hpp"

#include <dbus/dbus.h>

#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct DbusMessageDeleter {
    void operator()(DBusMessage* msg) const { dbus_message_unref(msg); }
};
using DbusMessagePtr = std::unique_ptr<DBusMessage, DbusMessageDeleter>;

struct DbusCallError {
    std::string name;     // e.g. org.freedesktop.DBus.Error.ServiceUnknown
    std::string message;

    bool timed_out() const;
    // Nobody answers at that name/path/method. Retrying will not change that.
    bool service_missing() const;
};

// Private session-bus connection driven from an epoll loop.
class DbusConnection {
public:
    // Returns the reply to send, or nullptr to let other handlers see the call.
    using MethodHandler = std::function<DbusMessagePtr(DBusMessage*)>;
    using SignalHandler = std::function<void(DBusMessage*)>;

    DbusConnection() = default;
    ~DbusConnection();

    DbusConnection(const DbusConnection&) = delete;
    DbusConnection& operator=(const DbusConnection&) = delete;

    std::expected<void, std::string> open_session();
    void close();

    bool connected() const;
    int fd() const;

    // Read, write and dispatch without blocking, until nothing is queued.
    // Returns false once the bus connection is gone.
    bool dispatch();
    void flush();

    std::expected<void, std::string> request_name(const std::string& name);
    void release_name(const std::string& name);

    std::expected<void, std::string> register_object(const std::string& path, MethodHandler handler);
    void unregister_object(const std::string& path);

    std::expected<void, std::string> add_match(const std::string& rule);
    void on_signal(SignalHandler handler);

    std::expected<DbusMessagePtr, DbusCallError> call(DBusMessage* msg, std::chrono::milliseconds timeout);
    bool send(DBusMessage* msg);

    DBusConnection* raw() const { return conn_; }

    static DbusMessagePtr method_call(const std::string& destination, const std::string& path,
                                      const std::string& interface, const std::string& method);

    // a{ss} helpers.
    static bool append_dict(DBusMessageIter* iter, const StringDict& dict);
    static bool append_dict(DBusMessage* msg, const StringDict& dict);
    static std::optional<StringDict> read_dict(DBusMessageIter* iter);
    static std::optional<StringDict> read_dict(DBusMessage* msg);

private:
    static DBusHandlerResult object_trampoline(DBusConnection* conn, DBusMessage* msg, void* data);
    static DBusHandlerResult filter_trampoline(DBusConnection* conn, DBusMessage* msg, void* data);

    DBusConnection* conn_ = nullptr;
    std::map<std::string, std::unique_ptr<MethodHandler>> objects_;
    std::vector<SignalHandler> signal_handlers_;
    bool filter_added_ = false;
};
