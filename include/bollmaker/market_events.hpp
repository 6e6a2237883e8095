#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bollmaker {

enum class Side {
    Buy,
    Sell
};

const char* to_string(Side side) noexcept;

// Venue wire names: Buy <-> "Bid", Sell <-> "Ask".
const char* venue_side(Side side) noexcept;

enum class ConnectionState {
    Disconnected,
    Connecting,
    Authenticating,
    Subscribed,
    Live
};

const char* to_string(ConnectionState state) noexcept;

using PriceLevel = std::pair<double, double>; // price, quantity

struct BookTickerEvent {
    std::string symbol;
    double best_bid = 0.0;
    double best_ask = 0.0;
};

// quantity == 0 removes the level.
struct DepthEvent {
    std::string symbol;
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    long long first_update_id = 0;
    long long last_update_id = 0;
};

struct FillEvent {
    std::string symbol;
    std::string order_id;
    Side side = Side::Buy;
    double quantity = 0.0;
    double price = 0.0;
    std::chrono::system_clock::time_point timestamp;
};

struct StateEvent {
    ConnectionState state = ConnectionState::Disconnected;
};

using FeedEvent = std::variant<BookTickerEvent, DepthEvent, FillEvent, StateEvent>;

} // namespace bollmaker
