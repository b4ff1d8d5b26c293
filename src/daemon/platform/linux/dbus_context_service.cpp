#include "platform/linux/dbus_context_service.hpp"

#include "context/wire_format.hpp"

#include <format>
#include <print>

DbusContextService::DbusContextService(DbusConnection& bus, AdapterKind kind,
                                       const WindowContextHub& hub)
    : bus_(bus), identity_(bus_identity(kind)), hub_(hub) {}

DbusContextService::~DbusContextService() {
    stop();
}

void DbusContextService::add_method(std::string name, std::vector<std::string> string_args,
                                    DbusConnection::MethodHandler handler) {
    methods_.push_back({std::move(name), std::move(string_args), std::move(handler)});
}

std::expected<void, std::string> DbusContextService::start() {
    if (started_) return {};

    if (auto res = bus_.open_session(); !res) return res;

    auto res = bus_.register_object(identity_.path, [this](DBusMessage* msg) { return handle(msg); });
    if (!res) return res;

    res = bus_.request_name(identity_.name);
    if (!res) {
        bus_.unregister_object(identity_.path);
        return res;
    }

    started_ = true;
    announced_ = state_name();
    return {};
}

void DbusContextService::stop() {
    if (!started_) return;
    started_ = false;

    bus_.release_name(identity_.name);
    bus_.unregister_object(identity_.path);
    bus_.flush();
}

void DbusContextService::publish(const std::optional<WindowContext>& ctx) {
    if (!started_) return;
    announce_state();

    DbusMessagePtr signal(dbus_message_new_signal(identity_.path.c_str(), identity_.interface.c_str(),
                                                  wire::SIGNAL_ACTIVE_WINDOW_CHANGED));
    if (!signal || !DbusConnection::append_dict(signal.get(), wire::to_dict(ctx)) ||
        !bus_.send(signal.get())) {
        std::println(stderr, "[winctx] failed to emit {}", wire::SIGNAL_ACTIVE_WINDOW_CHANGED);
    }
}

void DbusContextService::publish_stale() {
    announce_state();
}

void DbusContextService::set_state(const AdapterState& state) {
    state_ = state.kind;
    announce_state();
}

std::string DbusContextService::state_name() const {
    if (state_ == AdapterStateKind::Active && !hub_.alive()) return wire::STATE_STALE;
    return std::string(to_string(state_));
}

void DbusContextService::announce_state() {
    if (!started_) return;

    auto name = state_name();
    if (name == announced_) return;
    announced_ = name;

    DbusMessagePtr signal(dbus_message_new_signal(identity_.path.c_str(), identity_.interface.c_str(),
                                                  wire::SIGNAL_STATE_CHANGED));
    const char* value = announced_.c_str();
    if (!signal ||
        !dbus_message_append_args(signal.get(), DBUS_TYPE_STRING, &value, DBUS_TYPE_INVALID) ||
        !bus_.send(signal.get())) {
        std::println(stderr, "[winctx] failed to emit {}", wire::SIGNAL_STATE_CHANGED);
    }
}

std::string DbusContextService::introspection_xml() const {
    std::string extra;
    for (const auto& m : methods_) {
        extra += std::format("    <method name='{}'>\n", m.name);
        for (const auto& arg : m.args) {
            extra += std::format("      <arg name='{}' type='s' direction='in'/>\n", arg);
        }
        extra += "    </method>\n";
    }

    return std::format(
        DBUS_INTROSPECT_1_0_XML_DOCTYPE_DECL_NODE
        "<node>\n"
        "  <interface name='org.freedesktop.DBus.Introspectable'>\n"
        "    <method name='Introspect'>\n"
        "      <arg name='data' type='s' direction='out'/>\n"
        "    </method>\n"
        "  </interface>\n"
        "  <interface name='{}'>\n"
        "    <method name='GetActiveWindow'>\n"
        "      <arg name='window' type='a{{ss}}' direction='out'/>\n"
        "    </method>\n"
        "    <method name='GetState'>\n"
        "      <arg name='state' type='s' direction='out'/>\n"
        "    </method>\n"
        "{}"
        "    <signal name='{}'>\n"
        "      <arg name='window' type='a{{ss}}'/>\n"
        "    </signal>\n"
        "    <signal name='{}'>\n"
        "      <arg name='state' type='s'/>\n"
        "    </signal>\n"
        "  </interface>\n"
        "</node>\n",
        identity_.interface, extra, wire::SIGNAL_ACTIVE_WINDOW_CHANGED, wire::SIGNAL_STATE_CHANGED);
}

DbusMessagePtr DbusContextService::handle(DBusMessage* msg) {
    const char* iface = identity_.interface.c_str();

    if (dbus_message_is_method_call(msg, DBUS_INTERFACE_INTROSPECTABLE, "Introspect")) {
        DbusMessagePtr reply(dbus_message_new_method_return(msg));
        auto xml = introspection_xml();
        const char* data = xml.c_str();
        if (reply) dbus_message_append_args(reply.get(), DBUS_TYPE_STRING, &data, DBUS_TYPE_INVALID);
        return reply;
    }

    if (dbus_message_is_method_call(msg, iface, "GetActiveWindow")) {
        if (!hub_.alive()) {
            auto text = std::format("{} backend connection is down", identity_.name);
            return DbusMessagePtr(dbus_message_new_error(msg, wire::ERROR_STALE, text.c_str()));
        }
        DbusMessagePtr reply(dbus_message_new_method_return(msg));
        if (reply && !DbusConnection::append_dict(reply.get(), wire::to_dict(hub_.current()))) {
            return DbusMessagePtr(dbus_message_new_error(msg, DBUS_ERROR_NO_MEMORY, "out of memory"));
        }
        return reply;
    }

    if (dbus_message_is_method_call(msg, iface, "GetState")) {
        DbusMessagePtr reply(dbus_message_new_method_return(msg));
        auto name = state_name();
        const char* state = name.c_str();
        if (reply) dbus_message_append_args(reply.get(), DBUS_TYPE_STRING, &state, DBUS_TYPE_INVALID);
        return reply;
    }

    for (auto& m : methods_) {
        if (dbus_message_is_method_call(msg, iface, m.name.c_str())) {
            return m.handler(msg);
        }
    }

    return nullptr;
}
