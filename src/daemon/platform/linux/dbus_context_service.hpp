#pragma once

#include "adapter/adapter_kind.hpp"
#include "context/window_context_hub.hpp"
#include "platform/context_service.hpp"
#include "platform/linux/dbus_connection.hpp"

#include <string>
#include <vector>

// Session-bus face of a gated adapter: owns org.winctx.<Family>, answers
// GetActiveWindow/GetState and emits ActiveWindowChanged/StateChanged.
// GetActiveWindow fails with org.winctx.Error.Stale while the hub is stale.
class DbusContextService : public ContextService {
public:
    DbusContextService(DbusConnection& bus, AdapterKind kind, const WindowContextHub& hub);
    ~DbusContextService() override;

    DbusContextService(const DbusContextService&) = delete;
    DbusContextService& operator=(const DbusContextService&) = delete;

    // Extra method on the adapter interface taking string arguments.
    // Must be called before start().
    void add_method(std::string name, std::vector<std::string> string_args,
                    DbusConnection::MethodHandler handler);

    std::expected<void, std::string> start() override;
    void stop() override;

    void publish(const std::optional<WindowContext>& ctx) override;
    void publish_stale() override;
    void set_state(const AdapterState& state) override;

    // Lifecycle state name, or "stale" while active without a backend.
    std::string state_name() const;

    const BusIdentity& identity() const { return identity_; }
    std::string introspection_xml() const;

private:
    DbusMessagePtr handle(DBusMessage* msg);
    // Emits StateChanged when state_name() moved since the last emission.
    void announce_state();

    DbusConnection& bus_;
    BusIdentity identity_;
    const WindowContextHub& hub_;
    AdapterStateKind state_ = AdapterStateKind::Starting;
    std::string announced_;
    bool started_ = false;

    struct ExtraMethod {
        std::string name;
        std::vector<std::string> args;
        DbusConnection::MethodHandler handler;
    };
    std::vector<ExtraMethod> methods_;
};
