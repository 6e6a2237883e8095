#include "bollmaker/order_book.hpp"

#include <mutex>
#include <utility>

namespace bollmaker {

constexpr double kEpsilon = 1e-9;

namespace {

template <typename Map>
void apply_levels(Map& book, const std::vector<PriceLevel>& updates) {
    for (const auto& [price, quantity] : updates) {
        if (price <= kEpsilon) {
            continue;
        }
        if (quantity <= kEpsilon) {
            book.erase(price);
        } else {
            book[price] = quantity;
        }
    }
}

template <typename Map>
std::vector<PriceLevel> top_levels(const Map& book, int levels) {
    std::vector<PriceLevel> result;
    int count = 0;
    for (const auto& [price, qty] : book) {
        if (count >= levels) break;
        result.emplace_back(price, qty);
        count++;
    }
    return result;
}

} // namespace

OrderBook::OrderBook(std::string symbol)
    : symbol_(std::move(symbol)),
      last_update_time_(std::chrono::system_clock::now()) {
}

void OrderBook::apply_depth(const DepthEvent& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    apply_levels(bids_, event.bids);
    apply_levels(asks_, event.asks);
    refresh_top_locked();

    last_update_id_ = event.last_update_id;
    last_update_time_ = std::chrono::system_clock::now();
}

void OrderBook::apply_ticker(const BookTickerEvent& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (event.best_bid > kEpsilon) {
        top_bid_ = event.best_bid;
    }
    if (event.best_ask > kEpsilon) {
        top_ask_ = event.best_ask;
    }
    last_update_time_ = std::chrono::system_clock::now();
}

void OrderBook::refresh_top_locked() {
    top_bid_ = bids_.empty() ? 0.0 : bids_.begin()->first;
    top_ask_ = asks_.empty() ? 0.0 : asks_.begin()->first;
}

double OrderBook::best_bid() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return top_bid_;
}

double OrderBook::best_ask() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return top_ask_;
}

double OrderBook::mid_price() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (top_bid_ <= kEpsilon || top_ask_ <= kEpsilon) {
        return 0.0;
    }
    return (top_bid_ + top_ask_) * 0.5;
}

double OrderBook::quantity_at_price(double price, Side side) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (side == Side::Buy) {
        const auto it = bids_.find(price);
        return (it != bids_.end()) ? it->second : 0.0;
    }
    const auto it = asks_.find(price);
    return (it != asks_.end()) ? it->second : 0.0;
}

std::vector<PriceLevel> OrderBook::bids(int levels) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return top_levels(bids_, levels);
}

std::vector<PriceLevel> OrderBook::asks(int levels) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return top_levels(asks_, levels);
}

long long OrderBook::last_update_id() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_update_id_;
}

std::chrono::system_clock::time_point OrderBook::last_update_time() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_update_time_;
}

void OrderBook::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bids_.clear();
    asks_.clear();
    top_bid_ = 0.0;
    top_ask_ = 0.0;
    last_update_id_ = 0;
}

} // namespace bollmaker
