#include "backpack/rest_client.hpp"

#include <map>
#include <stdexcept>

namespace backpack {
namespace {

constexpr const char* kApiPrefix = "/api/v1";
constexpr const char* kWapiPrefix = "/wapi/v1";

std::string bool_text(bool value) {
    return value ? "true" : "false";
}

} // namespace

QueryParams order_signing_params(const OrderRequest& order) {
    QueryParams params = {
        {"orderType", order.order_type},
        {"quantity", order.quantity},
        {"side", order.side},
        {"symbol", order.symbol},
        {"timeInForce", order.time_in_force}
    };
    if (order.price) {
        params.emplace_back("price", *order.price);
    }
    if (order.post_only) {
        params.emplace_back("postOnly", bool_text(*order.post_only));
    }
    if (order.reduce_only) {
        params.emplace_back("reduceOnly", bool_text(*order.reduce_only));
    }
    if (order.client_id) {
        params.emplace_back("clientId", std::to_string(*order.client_id));
    }
    if (order.quote_quantity) {
        params.emplace_back("quoteQuantity", *order.quote_quantity);
    }
    if (order.auto_borrow) {
        params.emplace_back("autoBorrow", bool_text(*order.auto_borrow));
    }
    if (order.auto_borrow_repay) {
        params.emplace_back("autoBorrowRepay", bool_text(*order.auto_borrow_repay));
    }
    if (order.auto_lend) {
        params.emplace_back("autoLend", bool_text(*order.auto_lend));
    }
    if (order.auto_lend_redeem) {
        params.emplace_back("autoLendRedeem", bool_text(*order.auto_lend_redeem));
    }
    return params;
}

nlohmann::json order_body(const OrderRequest& order) {
    nlohmann::json body;
    body["symbol"] = order.symbol;
    body["side"] = order.side;
    body["orderType"] = order.order_type;
    body["quantity"] = order.quantity;
    body["timeInForce"] = order.time_in_force;
    if (order.price) {
        body["price"] = *order.price;
    }
    if (order.post_only) {
        body["postOnly"] = *order.post_only;
    }
    if (order.reduce_only) {
        body["reduceOnly"] = *order.reduce_only;
    }
    if (order.client_id) {
        body["clientId"] = *order.client_id;
    }
    if (order.quote_quantity) {
        body["quoteQuantity"] = *order.quote_quantity;
    }
    if (order.auto_borrow) {
        body["autoBorrow"] = *order.auto_borrow;
    }
    if (order.auto_borrow_repay) {
        body["autoBorrowRepay"] = *order.auto_borrow_repay;
    }
    if (order.auto_lend) {
        body["autoLend"] = *order.auto_lend;
    }
    if (order.auto_lend_redeem) {
        body["autoLendRedeem"] = *order.auto_lend_redeem;
    }
    return body;
}

long kline_interval_seconds(const std::string& interval) {
    static const std::map<std::string, long> kIntervals = {
        {"1m", 60}, {"3m", 180}, {"5m", 300}, {"15m", 900}, {"30m", 1800},
        {"1h", 3600}, {"2h", 7200}, {"4h", 14400}, {"6h", 21600}, {"8h", 28800},
        {"12h", 43200}, {"1d", 86400}, {"3d", 259200}, {"1w", 604800},
        {"1month", 2592000}
    };
    const auto it = kIntervals.find(interval);
    if (it == kIntervals.end()) {
        throw std::invalid_argument("Unsupported kline interval: " + interval);
    }
    return it->second;
}

RestClient::RestClient(Credentials credentials, ClientOptions options)
    : ClientBase(std::move(credentials), std::move(options)) {}

nlohmann::json RestClient::ticker(const std::string& symbol) const {
    return public_request("GET", std::string(kApiPrefix) + "/ticker", {{"symbol", symbol}});
}

nlohmann::json RestClient::depth(const std::string& symbol, int limit) const {
    return public_request("GET", std::string(kApiPrefix) + "/depth",
                          {{"symbol", symbol}, {"limit", std::to_string(limit)}});
}

nlohmann::json RestClient::klines(const std::string& symbol,
                                  const std::string& interval,
                                  int limit) const {
    const long interval_secs = kline_interval_seconds(interval);
    long long now_secs = current_timestamp_ms() / 1000;
    now_secs -= now_secs % 60;
    const long long start_time = now_secs - static_cast<long long>(interval_secs) * (limit + 1);

    return public_request("GET", std::string(kApiPrefix) + "/klines", {
        {"symbol", symbol},
        {"interval", interval},
        {"limit", std::to_string(limit)},
        {"startTime", std::to_string(start_time)}
    });
}

nlohmann::json RestClient::place_order(const OrderRequest& order) const {
    return signed_request("POST", std::string(kApiPrefix) + "/order", "orderExecute",
                          order_signing_params(order), order_body(order));
}

nlohmann::json RestClient::cancel_order(const std::string& symbol, const std::string& order_id) const {
    nlohmann::json body = {{"orderId", order_id}, {"symbol", symbol}};
    return signed_request("DELETE", std::string(kApiPrefix) + "/order", "orderCancel",
                          {{"orderId", order_id}, {"symbol", symbol}}, body);
}

nlohmann::json RestClient::cancel_all_orders(const std::string& symbol) const {
    nlohmann::json body = {{"symbol", symbol}};
    return signed_request("DELETE", std::string(kApiPrefix) + "/orders", "orderCancelAll",
                          {{"symbol", symbol}}, body);
}

nlohmann::json RestClient::balances() const {
    return signed_request("GET", std::string(kApiPrefix) + "/capital", "balanceQuery");
}

nlohmann::json RestClient::open_orders(std::optional<std::string> symbol) const {
    QueryParams params;
    if (symbol) {
        params.emplace_back("symbol", *symbol);
    }
    return signed_request("GET", std::string(kApiPrefix) + "/orders", "orderQueryAll", params);
}

nlohmann::json RestClient::fill_history(std::optional<std::string> symbol, int limit) const {
    QueryParams params = {{"limit", std::to_string(limit)}};
    if (symbol) {
        params.emplace_back("symbol", *symbol);
    }
    return signed_request("GET", std::string(kWapiPrefix) + "/history/fills", "fillHistoryQueryAll", params);
}

nlohmann::json RestClient::borrow_lend_positions() const {
    return signed_request("GET", std::string(kApiPrefix) + "/borrowLend/positions", "borrowLendPositionQuery");
}

} // namespace backpack
