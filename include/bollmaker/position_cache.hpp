#pragma once

#include "bollmaker/event_channel.hpp"
#include "bollmaker/market_events.hpp"
#include "bollmaker/position_ledger.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace bollmaker {

struct CachedPosition {
    double size = 0.0;
    double avg_price = 0.0;
    double cost = 0.0;
};

struct PositionCacheConfig {
    std::chrono::milliseconds refresh_interval{1000};
    std::chrono::milliseconds wait_timeout{1000};
};

// Sole owner of the PositionLedger. Fills and refresh requests are queued and
// applied in arrival order by whichever thread calls drain(); every other
// thread only reads the cached value.
class PositionCache {
public:
    PositionCache(std::string symbol,
                  std::unique_ptr<PositionLedger> ledger,
                  PositionCacheConfig config = {});

    PositionCache(const PositionCache&) = delete;
    PositionCache& operator=(const PositionCache&) = delete;

    void enqueue_fill(const FillEvent& fill);
    void request_refresh();

    // Applies every queued job and returns how many ran. Never blocks on an
    // empty queue. Must only be called from the owning thread.
    std::size_t drain();

    // Returns the cached value while younger than refresh_interval. Otherwise
    // asks the owner for a refresh and waits up to wait_timeout, then falls
    // back to the last known value (or zero).
    CachedPosition get_cached_position();

    [[nodiscard]] std::optional<CachedPosition> peek() const;
    [[nodiscard]] std::size_t pending_jobs() const { return jobs_.size(); }
    [[nodiscard]] std::size_t failed_writes() const;
    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

    // Owner-thread access for reporting.
    [[nodiscard]] const PositionLedger& ledger() const noexcept { return *ledger_; }

private:
    struct RefreshJob {};
    using Job = std::variant<FillEvent, RefreshJob>;

    void publish(const Position& position);
    void run_job(const Job& job);

    std::string symbol_;
    std::unique_ptr<PositionLedger> ledger_;
    PositionCacheConfig config_;
    EventChannel<Job> jobs_;

    mutable std::mutex mutex_;
    std::condition_variable updated_;
    std::optional<CachedPosition> cached_;
    std::chrono::steady_clock::time_point cached_at_{};
    unsigned long long version_ = 0;
    bool refresh_pending_ = false;
    std::size_t failed_writes_ = 0;
};

} // namespace bollmaker
