#include "bollmaker/indicator_engine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace bollmaker {

RollingBand::RollingBand(int period, double std_multiplier)
    : period_(period), std_multiplier_(std_multiplier) {
    if (period_ <= 0) {
        throw std::invalid_argument("Band period must be positive");
    }
}

void RollingBand::update(double price) {
    window_.push_back(price);
    while (window_.size() > static_cast<std::size_t>(period_)) {
        window_.pop_front();
    }
    recompute();
}

void RollingBand::rebuild(const std::vector<double>& closes) {
    window_.clear();
    const std::size_t keep = std::min(closes.size(), static_cast<std::size_t>(period_));
    window_.assign(closes.end() - static_cast<std::ptrdiff_t>(keep), closes.end());
    recompute();
}

void RollingBand::recompute() {
    if (window_.empty()) {
        snapshot_ = BandSnapshot{};
        return;
    }

    double sum = 0.0;
    for (double value : window_) {
        sum += value;
    }
    const double n = static_cast<double>(window_.size());
    const double mean = sum / n;

    double variance = 0.0;
    for (double value : window_) {
        variance += (value - mean) * (value - mean);
    }
    const double std_dev = std::sqrt(variance / n);

    snapshot_.middle = mean;
    snapshot_.upper = mean + std_multiplier_ * std_dev;
    snapshot_.lower = mean - std_multiplier_ * std_dev;
    snapshot_.ready = window_.size() >= static_cast<std::size_t>(period_);
}

IndicatorEngine::IndicatorEngine(int long_period, double long_std, int short_period, double short_std)
    : long_(long_period, long_std), short_(short_period, short_std) {}

void IndicatorEngine::update(double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    long_.update(price);
    short_.update(price);
    last_price_ = price;
}

void IndicatorEngine::refresh(const std::vector<double>& long_closes,
                              const std::vector<double>& short_closes,
                              double last_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    long_.rebuild(long_closes);
    short_.rebuild(short_closes);
    if (last_price > 0.0) {
        last_price_ = last_price;
    }
}

IndicatorSnapshot IndicatorEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return IndicatorSnapshot{long_.snapshot(), short_.snapshot(), last_price_};
}

BandSnapshot IndicatorEngine::long_band() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return long_.snapshot();
}

BandSnapshot IndicatorEngine::short_band() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return short_.snapshot();
}

double IndicatorEngine::last_price() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_price_;
}

bool IndicatorEngine::is_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return long_.is_ready() && short_.is_ready();
}

} // namespace bollmaker
