#include "bollmaker/exchange_gateway.hpp"

#include "backpack/util.hpp"

#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace bollmaker {

namespace {

// The venue sends numbers as strings.
double json_number(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        return text.empty() ? 0.0 : std::stod(text);
    }
    return 0.0;
}

double field_number(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return 0.0;
    }
    return json_number(*it);
}

// Kline start may be epoch seconds or "YYYY-MM-DD HH:MM:SS".
long long parse_start_time(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        std::tm tm{};
        if (std::sscanf(text.c_str(), "%d-%d-%d %d:%d:%d",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec) == 6) {
            tm.tm_year -= 1900;
            tm.tm_mon -= 1;
            return static_cast<long long>(timegm(&tm));
        }
        return std::stoll(text);
    }
    return 0;
}

const char* type_name(OrderType type) {
    return type == OrderType::Limit ? "Limit" : "Market";
}

const char* tif_name(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::GTC:
            return "GTC";
        case TimeInForce::IOC:
            return "IOC";
        case TimeInForce::FOK:
            return "FOK";
    }
    return "GTC";
}

} // namespace

std::pair<std::string, std::string> split_symbol(const std::string& symbol) {
    const auto first = symbol.find('_');
    if (first == std::string::npos) {
        throw std::invalid_argument("Symbol must look like BASE_QUOTE: " + symbol);
    }
    const auto second = symbol.find('_', first + 1);
    const auto quote = symbol.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
    return {symbol.substr(0, first), quote};
}

backpack::OrderRequest to_venue_order(const OrderRequest& order, int price_precision, int quantity_precision) {
    backpack::OrderRequest venue;
    venue.symbol = order.symbol;
    venue.side = venue_side(order.side);
    venue.order_type = type_name(order.type);
    venue.quantity = backpack::format_decimal(order.quantity, quantity_precision);
    if (order.price && order.type == OrderType::Limit) {
        venue.price = backpack::format_decimal(*order.price, price_precision);
    }
    venue.time_in_force = tif_name(order.time_in_force);
    if (order.post_only) {
        venue.post_only = true;
    }
    if (order.reduce_only) {
        venue.reduce_only = true;
    }
    venue.client_id = order.client_id;
    return venue;
}

BackpackGateway::BackpackGateway(backpack::RestClient& client, int price_precision, int quantity_precision)
    : client_(client),
      price_precision_(price_precision),
      quantity_precision_(quantity_precision) {}

std::string BackpackGateway::place_order(const OrderRequest& order) {
    const auto response = client_.place_order(to_venue_order(order, price_precision_, quantity_precision_));
    const auto it = response.find("id");
    if (it == response.end()) {
        throw std::runtime_error("Order response missing id: " + response.dump());
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

void BackpackGateway::cancel_all_orders(const std::string& symbol) {
    client_.cancel_all_orders(symbol);
}

std::vector<OpenOrder> BackpackGateway::open_orders(const std::string& symbol) {
    const auto response = client_.open_orders(symbol);
    std::vector<OpenOrder> orders;
    if (!response.is_array()) {
        return orders;
    }
    for (const auto& item : response) {
        OpenOrder order;
        order.id = item.value("id", "");
        order.side = item.value("side", "Bid") == "Ask" ? Side::Sell : Side::Buy;
        order.price = field_number(item, "price");
        order.quantity = field_number(item, "quantity");
        orders.push_back(std::move(order));
    }
    return orders;
}

std::vector<Kline> BackpackGateway::klines(const std::string& symbol, const std::string& interval, int limit) {
    const auto response = client_.klines(symbol, interval, limit);
    std::vector<Kline> bars;
    if (!response.is_array()) {
        throw std::runtime_error("Unexpected klines response: " + response.dump());
    }
    for (const auto& item : response) {
        Kline bar;
        if (item.contains("start")) {
            bar.start_time = parse_start_time(item.at("start"));
        }
        bar.open = field_number(item, "open");
        bar.high = field_number(item, "high");
        bar.low = field_number(item, "low");
        bar.close = field_number(item, "close");
        bar.volume = field_number(item, "volume");
        bars.push_back(bar);
    }
    return bars;
}

double BackpackGateway::ticker_price(const std::string& symbol) {
    const auto response = client_.ticker(symbol);
    const double price = field_number(response, "lastPrice");
    if (price <= 0.0) {
        throw std::runtime_error("Ticker response missing lastPrice: " + response.dump());
    }
    return price;
}

AccountBalances BackpackGateway::account_balances(const std::string& symbol) {
    const auto [base, quote] = split_symbol(symbol);

    AccountBalances balances;
    const auto capital = client_.balances();
    if (capital.is_object()) {
        for (const auto& item : capital.items()) {
            const double total = field_number(item.value(), "available") + field_number(item.value(), "locked");
            if (item.key() == base) {
                balances.base_total += total;
            } else if (item.key() == quote) {
                balances.quote_total += total;
            }
        }
    }

    try {
        const auto positions = client_.borrow_lend_positions();
        if (positions.is_array()) {
            for (const auto& item : positions) {
                const std::string asset = item.value("symbol", "");
                const double net = field_number(item, "netQuantity");
                if (asset == base) {
                    balances.base_total += net;
                } else if (asset == quote) {
                    balances.quote_total += net;
                }
            }
        }
    } catch (const backpack::HttpError& ex) {
        std::cerr << "[REST] Borrow/lend positions unavailable: " << ex.what() << std::endl;
    }

    return balances;
}

} // namespace bollmaker
