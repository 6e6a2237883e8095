#include "bollmaker/scheduler.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace bollmaker {

std::vector<double> closes_from_klines(std::vector<Kline> bars, int period) {
    std::sort(bars.begin(), bars.end(), [](const Kline& a, const Kline& b) {
        return a.start_time < b.start_time;
    });

    std::vector<double> closes;
    const std::size_t keep = std::min(bars.size(), static_cast<std::size_t>(std::max(period, 0)));
    closes.reserve(keep);
    for (auto it = bars.end() - static_cast<std::ptrdiff_t>(keep); it != bars.end(); ++it) {
        closes.push_back(it->close);
    }
    return closes;
}

Scheduler::Scheduler(const BotConfig& config,
                     ExchangeGateway& gateway,
                     MarketDataFeed& feed,
                     EventChannel<FeedEvent>& events,
                     IndicatorEngine& indicators,
                     PositionCache& cache,
                     OrderingEngine& ordering,
                     OrderBook& book)
    : config_(config),
      gateway_(gateway),
      feed_(feed),
      events_(events),
      indicators_(indicators),
      cache_(cache),
      ordering_(ordering),
      book_(book),
      check_interval_(config.connection_check_ms) {}

Scheduler::~Scheduler() {
    shutdown();
}

void Scheduler::start() {
    std::cout << "[Scheduler] Starting " << config_.symbol << std::endl;

    connect_stream();

    running_ = true;
    dispatcher_thread_ = std::thread([this]() { dispatcher_loop(); });
    supervisor_thread_ = std::thread([this]() { supervisor_loop(); });

    subscribe_channels();

    indicator_thread_ = std::thread([this]() { indicator_loop(); });
    wait_for_indicators();

    log_account_valuation();
    started_ = true;
    std::cout << "[Scheduler] Started" << std::endl;
}

void Scheduler::connect_stream() {
    const auto wait = std::chrono::milliseconds(config_.ws_connect_wait_ms);
    for (int attempt = 1; attempt <= config_.ws_connect_attempts; ++attempt) {
        if (attempt > 1) {
            feed_.stop();
        }
        feed_.start();
        if (feed_.wait_until_live(wait)) {
            return;
        }
        std::cerr << "[Scheduler] Stream not live after attempt " << attempt << "/"
                  << config_.ws_connect_attempts << std::endl;
    }

    feed_.stop();
    throw std::runtime_error("Unable to establish the market data stream after " +
                             std::to_string(config_.ws_connect_attempts) + " attempts");
}

void Scheduler::subscribe_channels() {
    feed_.subscribe("depth." + config_.symbol);
    feed_.subscribe("bookTicker." + config_.symbol);
    feed_.subscribe("account.orderUpdate." + config_.symbol);
}

void Scheduler::wait_for_indicators() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    const bool ready = ready_.wait_for(lock, std::chrono::milliseconds(config_.init_timeout_ms), [this] {
        return init_complete_ || !running_;
    });
    lock.unlock();

    if (!ready || !init_complete_) {
        shutdown();
        throw std::runtime_error("Indicators not ready within " +
                                 std::to_string(config_.init_timeout_ms) + " ms");
    }
}

void Scheduler::log_account_valuation() {
    try {
        const double price = gateway_.ticker_price(config_.symbol);
        const auto balances = gateway_.account_balances(config_.symbol);
        const double total = balances.quote_total + balances.base_total * price;
        std::cout << "[Scheduler] Ticker " << price << " | base " << balances.base_total
                  << " | quote " << balances.quote_total << " | total value " << total << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Scheduler] Account valuation unavailable: " << ex.what() << std::endl;
    }
}

void Scheduler::run(const std::atomic<bool>& stop_flag) {
    const auto pause = std::chrono::milliseconds(config_.main_loop_sleep_ms);
    while (running_ && !stop_flag) {
        try {
            run_main_iteration(Clock::now());
        } catch (const std::exception& ex) {
            std::cerr << "[Scheduler] Main loop error: " << ex.what() << std::endl;
        }
        if (!sleep_for(pause)) {
            break;
        }
    }
}

std::size_t Scheduler::run_main_iteration(Clock::time_point now) {
    const auto processed = cache_.drain();

    if (!next_check_) {
        next_check_ = now + check_interval_;
    } else if (now >= *next_check_) {
        if (check_connection_health(now)) {
            check_interval_ = std::chrono::milliseconds(config_.connection_check_ms);
        } else {
            check_interval_ = std::min(check_interval_ * 2,
                                       std::chrono::milliseconds(config_.connection_check_max_ms));
            std::cerr << "[Scheduler] Connection unhealthy; next check in "
                      << check_interval_.count() << " ms" << std::endl;
        }
        next_check_ = now + check_interval_;
    }
    return processed;
}

bool Scheduler::check_connection_health(Clock::time_point now) {
    if (feed_.is_live()) {
        return true;
    }
    feed_.supervise(now);
    return feed_.is_live();
}

void Scheduler::dispatch(const FeedEvent& event) {
    std::visit([this](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, BookTickerEvent>) {
            book_.apply_ticker(value);
            if (value.best_bid > 0.0 && value.best_ask > 0.0) {
                ordering_.maybe_adjust((value.best_bid + value.best_ask) / 2.0, Clock::now());
            }
        } else if constexpr (std::is_same_v<T, DepthEvent>) {
            book_.apply_depth(value);
        } else if constexpr (std::is_same_v<T, FillEvent>) {
            ordering_.on_fill(value);
        } else if constexpr (std::is_same_v<T, StateEvent>) {
            if (value.state == ConnectionState::Disconnected && running_) {
                std::cerr << "[Scheduler] Stream dropped; waiting for reconnect" << std::endl;
            }
        }
    }, event);
}

void Scheduler::dispatcher_loop() {
    while (running_) {
        auto event = events_.pop_for(std::chrono::milliseconds(100));
        if (!event) {
            continue;
        }
        try {
            dispatch(*event);
        } catch (const std::exception& ex) {
            std::cerr << "[Scheduler] Dispatch error: " << ex.what() << std::endl;
        }
    }
}

void Scheduler::supervisor_loop() {
    const auto interval = std::chrono::milliseconds(config_.heartbeat_check_ms);
    while (sleep_for(interval)) {
        try {
            feed_.supervise(Clock::now());
        } catch (const std::exception& ex) {
            std::cerr << "[Scheduler] Heartbeat check error: " << ex.what() << std::endl;
        }
    }
}

void Scheduler::indicator_loop() {
    const auto interval = std::chrono::milliseconds(config_.kline_refresh_ms);
    do {
        try {
            refresh_indicators();
        } catch (const std::exception& ex) {
            std::cerr << "[Indicators] Kline refresh failed: " << ex.what() << std::endl;
        }
    } while (sleep_for(interval));
}

bool Scheduler::refresh_indicators() {
    auto long_bars = gateway_.klines(config_.symbol, config_.long_band.interval, config_.long_band.period * 2);
    auto short_bars = gateway_.klines(config_.symbol, config_.short_band.interval, config_.short_band.period * 2);

    const auto long_closes = closes_from_klines(std::move(long_bars), config_.long_band.period);
    const auto short_closes = closes_from_klines(std::move(short_bars), config_.short_band.period);
    const double last_price = short_closes.empty() ? 0.0 : short_closes.back();

    indicators_.refresh(long_closes, short_closes, last_price);

    const auto snapshot = indicators_.snapshot();
    std::cout << "[Indicators] long " << snapshot.long_band.lower << "/" << snapshot.long_band.middle
              << "/" << snapshot.long_band.upper << " short " << snapshot.short_band.lower << "/"
              << snapshot.short_band.middle << "/" << snapshot.short_band.upper
              << " last " << snapshot.last_price << std::endl;

    const bool ready = snapshot.long_band.ready && snapshot.short_band.ready;
    if (ready) {
        bool first = false;
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            first = !init_complete_;
            init_complete_ = true;
        }
        if (first) {
            std::cout << "[Indicators] Both windows ready" << std::endl;
            ready_.notify_all();
        }
    } else {
        std::cerr << "[Indicators] Windows not full yet (long " << long_closes.size() << "/"
                  << config_.long_band.period << ", short " << short_closes.size() << "/"
                  << config_.short_band.period << ")" << std::endl;
    }
    return ready;
}

bool Scheduler::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, duration, [this] { return !running_; });
    return running_;
}

void Scheduler::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }

    running_ = false;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wake_.notify_all();
    ready_.notify_all();

    for (auto* worker : {&dispatcher_thread_, &supervisor_thread_, &indicator_thread_}) {
        if (worker->joinable()) {
            worker->join();
        }
    }

    if (started_) {
        try {
            gateway_.cancel_all_orders(config_.symbol);
            std::cout << "[Scheduler] Cancelled open orders" << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "[Scheduler] Cancel-all on shutdown failed: " << ex.what() << std::endl;
        }
    }

    feed_.stop();
    events_.close();
    cache_.drain();
    std::cout << "[Scheduler] Stopped" << std::endl;
}

} // namespace bollmaker
