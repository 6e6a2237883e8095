#include "backpack/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace backpack {

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    const double base = static_cast<double>(initial_delay.count());
    const double cap = static_cast<double>(max_delay.count());
    const double scaled = base * std::pow(std::max(multiplier, 1.0), std::max(attempt, 0));
    return std::chrono::milliseconds(static_cast<long long>(std::min(scaled, cap)));
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt, std::mt19937_64& rng) const {
    const auto nominal = delay_for(attempt);
    if (jitter <= 0.0 || nominal.count() == 0) {
        return nominal;
    }
    const double spread = std::clamp(jitter, 0.0, 1.0);
    std::uniform_real_distribution<double> dist(1.0 - spread, 1.0 + spread);
    const double value = static_cast<double>(nominal.count()) * dist(rng);
    return std::chrono::milliseconds(static_cast<long long>(std::max(value, 0.0)));
}

} // namespace backpack
