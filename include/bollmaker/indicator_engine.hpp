#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace bollmaker {

struct BandSnapshot {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
    bool ready = false;
};

// Bollinger band over the most recent `period` closes.
// middle = mean, upper/lower = middle +/- k * population std.
class RollingBand {
public:
    RollingBand(int period, double std_multiplier);

    void update(double price);
    void rebuild(const std::vector<double>& closes);

    [[nodiscard]] const BandSnapshot& snapshot() const noexcept { return snapshot_; }
    [[nodiscard]] bool is_ready() const noexcept { return snapshot_.ready; }
    [[nodiscard]] std::size_t size() const noexcept { return window_.size(); }
    [[nodiscard]] int period() const noexcept { return period_; }

private:
    void recompute();

    int period_;
    double std_multiplier_;
    std::deque<double> window_;
    BandSnapshot snapshot_;
};

struct IndicatorSnapshot {
    BandSnapshot long_band;
    BandSnapshot short_band;
    double last_price = 0.0;
};

// Long and short horizon bands behind one lock. Readers copy a consistent
// snapshot and compute outside it.
class IndicatorEngine {
public:
    IndicatorEngine(int long_period, double long_std, int short_period, double short_std);

    // Live-tick fast path; approximates the bands between refreshes.
    void update(double price);

    // Replaces both windows wholesale from historical closes (oldest first).
    void refresh(const std::vector<double>& long_closes,
                 const std::vector<double>& short_closes,
                 double last_price);

    [[nodiscard]] IndicatorSnapshot snapshot() const;
    [[nodiscard]] BandSnapshot long_band() const;
    [[nodiscard]] BandSnapshot short_band() const;
    [[nodiscard]] double last_price() const;
    [[nodiscard]] bool is_ready() const;

private:
    mutable std::mutex mutex_;
    RollingBand long_;
    RollingBand short_;
    double last_price_ = 0.0;
};

} // namespace bollmaker
