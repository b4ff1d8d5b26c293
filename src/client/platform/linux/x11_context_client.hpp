#pragma once

#include "platform/context_client.hpp"
#include "platform/linux/x11_backend.hpp"

// Runs the X11 backend inside the consumer process.
class X11ContextClient : public ContextClient {
public:
    X11ContextClient();

    std::expected<void, std::string> connect() override;
    int event_fd() const override { return backend_.event_fd(); }
    bool process_events() override;

private:
    X11Backend backend_;
};
