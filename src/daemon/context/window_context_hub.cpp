#include "context/window_context_hub.hpp"

#include <algorithm>

void WindowContextHub::publish(WindowContext ctx) {
    snapshot_.context = std::move(ctx);
    snapshot_.alive = true;
    notify();
}

void WindowContextHub::clear() {
    if (!snapshot_.context && snapshot_.alive) return;
    snapshot_.context.reset();
    snapshot_.alive = true;
    notify();
}

void WindowContextHub::mark_stale() {
    if (!snapshot_.alive) return;
    snapshot_.alive = false;
    notify();
}

void WindowContextHub::mark_alive() {
    if (snapshot_.alive) return;
    snapshot_.context.reset();
    snapshot_.alive = true;
    notify();
}

std::optional<WindowContext> WindowContextHub::current() const {
    if (!snapshot_.alive) return std::nullopt;
    return snapshot_.context;
}

int WindowContextHub::subscribe(Subscriber subscriber) {
    int id = next_id_++;
    subscribers_.push_back({id, std::move(subscriber)});
    return id;
}

void WindowContextHub::unsubscribe(int id) {
    std::erase_if(subscribers_, [id](const Entry& e) { return e.id == id; });
}

void WindowContextHub::notify() {
    ++snapshot_.generation;
    // Copy so a subscriber may unsubscribe itself while being notified.
    auto subscribers = subscribers_;
    for (auto& entry : subscribers) {
        entry.fn(snapshot_);
    }
}
