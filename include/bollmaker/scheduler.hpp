#pragma once

#include "bollmaker/config.hpp"
#include "bollmaker/event_channel.hpp"
#include "bollmaker/exchange_gateway.hpp"
#include "bollmaker/indicator_engine.hpp"
#include "bollmaker/market_data_feed.hpp"
#include "bollmaker/market_events.hpp"
#include "bollmaker/order_book.hpp"
#include "bollmaker/ordering_engine.hpp"
#include "bollmaker/position_cache.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace bollmaker {

// Sorts bars by start time and returns the closes of the newest `period`.
std::vector<double> closes_from_klines(std::vector<Kline> bars, int period);

// Owns the worker threads: event dispatcher, heartbeat supervisor and
// indicator refresh. The main control loop runs on the caller's thread.
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    Scheduler(const BotConfig& config,
              ExchangeGateway& gateway,
              MarketDataFeed& feed,
              EventChannel<FeedEvent>& events,
              IndicatorEngine& indicators,
              PositionCache& cache,
              OrderingEngine& ordering,
              OrderBook& book);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Connects the stream, subscribes, waits for the indicators and starts
    // the workers. Throws std::runtime_error when startup cannot complete.
    void start();

    // Main control loop until stop_flag is set or shutdown() is called.
    void run(const std::atomic<bool>& stop_flag);

    // Drains ledger jobs and runs the connection check when due.
    std::size_t run_main_iteration(Clock::time_point now);

    // Stops the workers, cancels open orders if start() completed, closes the
    // stream. Idempotent.
    void shutdown();

    bool refresh_indicators();
    bool check_connection_health(Clock::time_point now);
    void dispatch(const FeedEvent& event);

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] std::chrono::milliseconds connection_check_interval() const noexcept { return check_interval_; }

private:
    void connect_stream();
    void subscribe_channels();
    void wait_for_indicators();
    void log_account_valuation();

    void dispatcher_loop();
    void supervisor_loop();
    void indicator_loop();

    // Returns false once the scheduler is stopping.
    bool sleep_for(std::chrono::milliseconds duration);

    BotConfig config_;
    ExchangeGateway& gateway_;
    MarketDataFeed& feed_;
    EventChannel<FeedEvent>& events_;
    IndicatorEngine& indicators_;
    PositionCache& cache_;
    OrderingEngine& ordering_;
    OrderBook& book_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> started_{false};
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::condition_variable ready_;
    bool init_complete_ = false;

    std::thread dispatcher_thread_;
    std::thread supervisor_thread_;
    std::thread indicator_thread_;

    std::chrono::milliseconds check_interval_;
    std::optional<Clock::time_point> next_check_;
};

} // namespace bollmaker
