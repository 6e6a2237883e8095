#pragma once

#include "backpack/rest_client.hpp"
#include "bollmaker/market_events.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bollmaker {

enum class OrderType {
    Limit,
    Market
};

enum class TimeInForce {
    GTC,
    IOC,
    FOK
};

struct OrderRequest {
    std::string symbol;
    Side side = Side::Buy;
    OrderType type = OrderType::Limit;
    double quantity = 0.0;
    std::optional<double> price;
    TimeInForce time_in_force = TimeInForce::GTC;
    bool post_only = false;
    bool reduce_only = false;
    std::optional<std::uint32_t> client_id;
};

struct OpenOrder {
    std::string id;
    Side side = Side::Buy;
    double price = 0.0;
    double quantity = 0.0;
};

struct Kline {
    long long start_time = 0;   // epoch seconds
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

struct AccountBalances {
    double base_total = 0.0;
    double quote_total = 0.0;
};

// The engine's only view of the REST venue. Every call blocks and throws on
// failure.
class ExchangeGateway {
public:
    virtual ~ExchangeGateway() = default;

    // Returns the venue order id.
    virtual std::string place_order(const OrderRequest& order) = 0;
    virtual void cancel_all_orders(const std::string& symbol) = 0;
    virtual std::vector<OpenOrder> open_orders(const std::string& symbol) = 0;
    virtual std::vector<Kline> klines(const std::string& symbol, const std::string& interval, int limit) = 0;
    virtual double ticker_price(const std::string& symbol) = 0;
    virtual AccountBalances account_balances(const std::string& symbol) = 0;
};

// "SOL_USDC_PERP" -> {"SOL", "USDC"}.
std::pair<std::string, std::string> split_symbol(const std::string& symbol);

backpack::OrderRequest to_venue_order(const OrderRequest& order, int price_precision, int quantity_precision);

class BackpackGateway : public ExchangeGateway {
public:
    BackpackGateway(backpack::RestClient& client, int price_precision, int quantity_precision);

    std::string place_order(const OrderRequest& order) override;
    void cancel_all_orders(const std::string& symbol) override;
    std::vector<OpenOrder> open_orders(const std::string& symbol) override;
    std::vector<Kline> klines(const std::string& symbol, const std::string& interval, int limit) override;
    double ticker_price(const std::string& symbol) override;

    // available + locked per asset, adjusted by borrow/lend net quantity.
    AccountBalances account_balances(const std::string& symbol) override;

private:
    backpack::RestClient& client_;
    int price_precision_;
    int quantity_precision_;
};

} // namespace bollmaker
