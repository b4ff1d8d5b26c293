#pragma once

#include "context/window_context_hub.hpp"

#include <expected>
#include <string>

// Consumer side of the window-context channel. Feeds a local hub from
// whichever adapter serves the session.
class ContextClient {
public:
    virtual ~ContextClient() = default;

    virtual std::expected<void, std::string> connect() = 0;
    virtual int event_fd() const = 0;
    // Handle whatever made event_fd() readable. False once the channel is gone for good.
    virtual bool process_events() = 0;

    WindowContextHub& hub() { return hub_; }

protected:
    WindowContextHub hub_;
};
