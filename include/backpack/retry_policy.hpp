#pragma once

#include <chrono>
#include <random>

namespace backpack {

// Backoff schedule shared by REST retries and stream reconnects.
// delay(n) = min(initial_delay * multiplier^n, max_delay), then spread by
// +/- jitter (a fraction of the delay) when jitter > 0.
struct RetryPolicy {
    int max_attempts = 3;                        // < 0 means unbounded
    std::chrono::milliseconds initial_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};
    double jitter = 0.0;

    [[nodiscard]] bool allows_retry(int attempt) const noexcept {
        return max_attempts < 0 || attempt + 1 < max_attempts;
    }

    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const;
    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt, std::mt19937_64& rng) const;
};

} // namespace backpack
