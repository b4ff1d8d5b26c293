#pragma once

#include "context/window_context.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

struct HubSnapshot {
    std::optional<WindowContext> context;  // last value, kept even when stale
    bool alive = false;                    // adapter connection is up
    uint64_t generation = 0;               // bumped on every change
};

// Holds the single current WindowContext of a session. Each publish()
// replaces the previous value wholesale; no history is retained.
// Single-threaded: callers run on one event loop.
class WindowContextHub {
public:
    using Subscriber = std::function<void(const HubSnapshot&)>;

    WindowContextHub() = default;

    WindowContextHub(const WindowContextHub&) = delete;
    WindowContextHub& operator=(const WindowContextHub&) = delete;

    // Replace the current value. Implies the adapter connection is alive.
    void publish(WindowContext ctx);

    // No window has focus. Distinct from a stale connection.
    void clear();

    // Adapter gone or its backend connection lost. The last value is kept
    // for diagnostics but current() stops returning it.
    void mark_stale();
    // Connection back up. The value kept while stale is dropped: nothing is
    // known until the backend reports again.
    void mark_alive();

    // Current value, or nullopt when there is no focused window or the
    // adapter connection is stale.
    std::optional<WindowContext> current() const;

    const HubSnapshot& snapshot() const { return snapshot_; }
    bool alive() const { return snapshot_.alive; }

    int subscribe(Subscriber subscriber);
    void unsubscribe(int id);

private:
    void notify();

    HubSnapshot snapshot_;

    struct Entry {
        int id;
        Subscriber fn;
    };
    std::vector<Entry> subscribers_;
    int next_id_ = 1;
};
