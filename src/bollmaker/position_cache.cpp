#include "bollmaker/position_cache.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace bollmaker {

PositionCache::PositionCache(std::string symbol,
                             std::unique_ptr<PositionLedger> ledger,
                             PositionCacheConfig config)
    : symbol_(std::move(symbol)),
      ledger_(std::move(ledger)),
      config_(config) {
    if (!ledger_) {
        throw std::invalid_argument("PositionCache requires a ledger");
    }
}

void PositionCache::enqueue_fill(const FillEvent& fill) {
    jobs_.push(fill);
}

void PositionCache::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (refresh_pending_) {
            return;
        }
        refresh_pending_ = true;
    }
    jobs_.push(RefreshJob{});
}

std::size_t PositionCache::drain() {
    std::size_t processed = 0;
    while (auto job = jobs_.try_pop()) {
        run_job(*job);
        ++processed;
    }
    return processed;
}

void PositionCache::run_job(const Job& job) {
    if (const auto* fill = std::get_if<FillEvent>(&job)) {
        try {
            const auto position = ledger_->apply_fill(*fill);
            std::cout << "[Cache] " << to_string(fill->side) << " fill " << fill->quantity
                      << " @ " << fill->price << " -> size=" << position.size
                      << " cost=" << position.cost << std::endl;
            publish(position);
        } catch (const std::exception& ex) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++failed_writes_;
            std::cerr << "[Cache] Ledger write failed for fill " << fill->order_id
                      << ", cached position not advanced: " << ex.what() << std::endl;
        }
        return;
    }

    try {
        publish(ledger_->get_position(symbol_));
    } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_pending_ = false;
        std::cerr << "[Cache] Position refresh failed: " << ex.what() << std::endl;
    }
}

void PositionCache::publish(const Position& position) {
    CachedPosition value;
    value.size = position.size;
    value.cost = position.cost;
    value.avg_price = position.size > 0.0 ? position.cost / position.size : 0.0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_ = value;
        cached_at_ = std::chrono::steady_clock::now();
        ++version_;
        refresh_pending_ = false;
    }
    updated_.notify_all();
}

CachedPosition PositionCache::get_cached_position() {
    unsigned long long seen_version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cached_ && std::chrono::steady_clock::now() - cached_at_ < config_.refresh_interval) {
            return *cached_;
        }
        seen_version = version_;
    }

    request_refresh();

    std::unique_lock<std::mutex> lock(mutex_);
    const bool refreshed = updated_.wait_for(lock, config_.wait_timeout, [&] {
        return version_ != seen_version;
    });
    if (!refreshed) {
        std::cerr << "[Cache] Position refresh timed out after "
                  << config_.wait_timeout.count() << " ms; using last known value" << std::endl;
    }
    return cached_.value_or(CachedPosition{});
}

std::optional<CachedPosition> PositionCache::peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_;
}

std::size_t PositionCache::failed_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_writes_;
}

} // namespace bollmaker
