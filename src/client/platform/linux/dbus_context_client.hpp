#pragma once

#include "adapter/adapter_kind.hpp"
#include "platform/context_client.hpp"
#include "platform/linux/dbus_connection.hpp"

#include <chrono>
#include <string_view>

// Follows one gated adapter on the session bus. The hub turns stale while the
// adapter's name has no owner or the adapter reports a non-active state, and
// is re-seeded with GetActiveWindow when an owner appears.
class DbusContextClient : public ContextClient {
public:
    DbusContextClient(AdapterKind kind, std::chrono::milliseconds call_timeout);

    std::expected<void, std::string> connect() override;
    int event_fd() const override { return bus_.fd(); }
    bool process_events() override;

    // Whether a StateChanged value means GetActiveWindow can be trusted.
    static bool is_live_state(std::string_view state);

private:
    void on_signal(DBusMessage* msg);
    void seed();
    void apply(const StringDict& dict);

    BusIdentity identity_;
    std::chrono::milliseconds call_timeout_;
    DbusConnection bus_;
    bool reseed_ = false;
};
