#pragma once

#include "adapter_core.hpp"
#include "config.hpp"
#include "context/window_context_hub.hpp"
#include "platform/linux/dbus_connection.hpp"
#include "platform/linux/dbus_context_service.hpp"

#include <atomic>
#include <memory>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, AdapterKind kind, bool required, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    // Runs the startup gate, then the loop until the adapter reaches a
    // terminal state or a signal arrives. Returns the process exit code.
    int run(const EnvironmentInfo& env);
    void request_stop();

private:
    void sync_fds();
    void arm_retry(std::chrono::milliseconds delay);
    void arm_poll(std::chrono::milliseconds interval);
    bool add_fd(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    DbusConnection bus_;
    WindowContextHub hub_;
    DbusContextService service_;
    std::unique_ptr<ContextBackend> backend_;

    // Portable adapter logic
    std::unique_ptr<AdapterCore> core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int poll_timer_fd_ = -1;
    int retry_timer_fd_ = -1;

    int bus_fd_ = -1;
    int backend_fd_ = -1;
    uint64_t backend_generation_ = 0;

    std::atomic<bool> running_{false};
};
