#pragma once

#include "backpack/client_base.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace backpack {

// Side values are the venue's own: "Bid" / "Ask".
struct OrderRequest {
    std::string symbol;
    std::string side;
    std::string order_type = "Limit";            // "Limit" | "Market"
    std::string quantity;
    std::optional<std::string> price;
    std::string time_in_force = "GTC";           // "GTC" | "IOC" | "FOK"
    std::optional<bool> post_only;
    std::optional<bool> reduce_only;
    std::optional<std::uint32_t> client_id;
    std::optional<std::string> quote_quantity;
    std::optional<bool> auto_borrow;
    std::optional<bool> auto_borrow_repay;
    std::optional<bool> auto_lend;
    std::optional<bool> auto_lend_redeem;
};

// Parameters covered by the orderExecute signature, in wire form.
QueryParams order_signing_params(const OrderRequest& order);

nlohmann::json order_body(const OrderRequest& order);

// Seconds per kline interval ("1m" ... "1month"); throws std::invalid_argument.
long kline_interval_seconds(const std::string& interval);

class RestClient : public ClientBase {
public:
    explicit RestClient(Credentials credentials, ClientOptions options = {});

    nlohmann::json ticker(const std::string& symbol) const;
    nlohmann::json depth(const std::string& symbol, int limit = 20) const;

    // Requests the last `limit` bars, starting interval*(limit+1) seconds ago
    // rounded down to the minute.
    nlohmann::json klines(const std::string& symbol,
                          const std::string& interval,
                          int limit) const;

    nlohmann::json place_order(const OrderRequest& order) const;
    nlohmann::json cancel_order(const std::string& symbol, const std::string& order_id) const;
    nlohmann::json cancel_all_orders(const std::string& symbol) const;

    nlohmann::json balances() const;
    nlohmann::json open_orders(std::optional<std::string> symbol = std::nullopt) const;
    nlohmann::json fill_history(std::optional<std::string> symbol = std::nullopt, int limit = 100) const;
    nlohmann::json borrow_lend_positions() const;
};

} // namespace backpack
