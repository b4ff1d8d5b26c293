#include "adapter/retry_policy.hpp"

#include <algorithm>

RetryPolicy::RetryPolicy(int max_attempts, std::chrono::milliseconds initial_delay,
                         std::chrono::milliseconds max_delay)
    : max_attempts_(std::max(max_attempts, 0)),
      initial_delay_(std::max(initial_delay, std::chrono::milliseconds{1})),
      max_delay_(std::max(max_delay, initial_delay_)) {}

std::optional<std::chrono::milliseconds> RetryPolicy::next_delay() {
    if (exhausted()) return std::nullopt;

    auto delay = initial_delay_;
    for (int i = 0; i < attempts_ && delay < max_delay_; ++i) {
        delay *= 2;
    }
    ++attempts_;
    return std::min(delay, max_delay_);
}
