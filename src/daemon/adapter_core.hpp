#pragma once

#include "adapter/adapter_lifecycle.hpp"
#include "adapter/retry_policy.hpp"
#include "config.hpp"
#include "context/window_context_hub.hpp"
#include "platform/context_backend.hpp"
#include "platform/context_service.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

// Portable logic of one adapter process: startup gate, backend connection
// with retry, and relaying backend events through the hub to the service.
// Timers and file descriptors belong to the platform event loop.
class AdapterCore {
public:
    using ArmRetry = std::function<void(std::chrono::milliseconds)>;

    AdapterCore(AdapterKind kind, const Config& config, bool required, bool verbose,
                ContextBackend& backend, ContextService& service, WindowContextHub& hub,
                ArmRetry arm_retry);
    ~AdapterCore();

    AdapterCore(const AdapterCore&) = delete;
    AdapterCore& operator=(const AdapterCore&) = delete;

    // Gate on `env`; when this adapter is the right one, claim the bus name
    // and connect the backend.
    const AdapterState& start(const EnvironmentInfo& env);

    void on_backend_readable();
    void on_poll_tick();
    void on_retry_timer();
    void on_bus_lost();

    // Orderly stop: a non-terminal adapter becomes SelfTerminated. Releases
    // the bus name and the backend. Safe to call more than once.
    void shutdown();

    bool finished() const { return lifecycle_.state().terminal(); }
    const AdapterState& state() const { return lifecycle_.state(); }
    int exit_code() const { return lifecycle_.exit_code(); }

    bool backend_connected() const { return backend_connected_; }
    // Bumped on every successful backend connection; the backend fd may change.
    uint64_t backend_generation() const { return backend_generation_; }

private:
    void connect_backend();
    void handle_backend_error(const BackendError& error);
    void on_backend_context(std::optional<WindowContext> ctx);
    void on_hub_change(const HubSnapshot& snapshot);
    void fail(std::string error);
    void release();

    void log(const std::string& msg);

    AdapterKind kind_;
    const Config& config_;
    bool verbose_;

    ContextBackend& backend_;
    ContextService& service_;
    WindowContextHub& hub_;
    ArmRetry arm_retry_;

    AdapterLifecycle lifecycle_;
    RetryPolicy retry_;

    int hub_subscription_ = 0;
    bool backend_connected_ = false;
    uint64_t backend_generation_ = 0;
    bool released_ = false;
};
