#pragma once

#include <chrono>
#include <optional>

// Exponential backoff for transient backend errors, doubling from the
// initial delay up to a cap. Exhausted after max_attempts retries.
class RetryPolicy {
public:
    RetryPolicy(int max_attempts, std::chrono::milliseconds initial_delay,
                std::chrono::milliseconds max_delay);

    // Delay before the next attempt, or nullopt when retries are exhausted.
    std::optional<std::chrono::milliseconds> next_delay();

    // Call after a successful attempt.
    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }
    bool exhausted() const { return attempts_ >= max_attempts_; }

private:
    int max_attempts_;
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds max_delay_;
    int attempts_ = 0;
};
