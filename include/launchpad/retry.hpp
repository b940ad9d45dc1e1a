#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace launchpad {

/// Exponential backoff for ChainClient calls
struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{100};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{2000};
    std::chrono::milliseconds call_timeout{5000};

    /// Delay before attempt `attempt + 1` (attempt is zero-based)
    std::chrono::milliseconds backoff_for(uint32_t attempt) const {
        double delay = static_cast<double>(initial_backoff.count());
        for (uint32_t i = 0; i < attempt; ++i) delay *= multiplier;
        auto capped = std::min<double>(delay, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<int64_t>(capped));
    }
};

/// Runs `fn`, retrying only NetworkError. The last NetworkError propagates
/// once max_attempts are used up; every other exception propagates at once.
/// `attempts`, when given, receives the number of calls made.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, Fn&& fn,
                uint32_t* attempts = nullptr) -> decltype(fn()) {
    const uint32_t max_attempts = std::max<uint32_t>(policy.max_attempts, 1);
    for (uint32_t attempt = 0;; ++attempt) {
        if (attempts) *attempts = attempt + 1;
        try {
            return fn();
        } catch (const NetworkError& e) {
            if (attempt + 1 >= max_attempts) throw;
            auto delay = policy.backoff_for(attempt);
            spdlog::warn("{}: retry {}/{} in {}ms ({})", what, attempt + 1, max_attempts,
                         delay.count(), e.what());
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace launchpad
