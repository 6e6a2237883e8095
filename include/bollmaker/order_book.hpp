#pragma once

#include "bollmaker/market_events.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace bollmaker {

// Local view of the venue book, fed by depth deltas and book-ticker updates.
class OrderBook {
public:
    explicit OrderBook(std::string symbol);

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;
    OrderBook(OrderBook&&) = delete;
    OrderBook& operator=(OrderBook&&) = delete;

    void apply_depth(const DepthEvent& event);

    // Top of book from the ticker stream replaces the derived best bid/ask
    // until the next depth delta moves them.
    void apply_ticker(const BookTickerEvent& event);

    [[nodiscard]] double best_bid() const;
    [[nodiscard]] double best_ask() const;

    // 0 while either side is empty.
    [[nodiscard]] double mid_price() const;

    [[nodiscard]] double quantity_at_price(double price, Side side) const;
    [[nodiscard]] std::vector<PriceLevel> bids(int levels = 10) const;
    [[nodiscard]] std::vector<PriceLevel> asks(int levels = 10) const;

    [[nodiscard]] long long last_update_id() const;
    [[nodiscard]] std::chrono::system_clock::time_point last_update_time() const;
    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

    void clear();

private:
    using BidMap = std::map<double, double, std::greater<double>>;
    using AskMap = std::map<double, double>;

    void refresh_top_locked();

    std::string symbol_;
    BidMap bids_;
    AskMap asks_;
    double top_bid_ = 0.0;
    double top_ask_ = 0.0;
    long long last_update_id_ = 0;
    std::chrono::system_clock::time_point last_update_time_;

    mutable std::shared_mutex mutex_;
};

} // namespace bollmaker
