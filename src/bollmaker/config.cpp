#include "bollmaker/config.hpp"

#include "backpack/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace bollmaker {
namespace {

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

class FieldReader {
public:
    explicit FieldReader(const nlohmann::json& doc) : doc_(doc) {}

    template <typename T>
    void read(const std::string& key, T& field) {
        known_.insert(key);
        const auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return;
        }
        try {
            field = it->get<T>();
        } catch (const nlohmann::json::exception& ex) {
            throw std::invalid_argument("Config key '" + key + "' has the wrong type: " + ex.what());
        }
    }

    void read_band(const std::string& key, BandConfig& band) {
        known_.insert(key);
        const auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return;
        }
        if (!it->is_object()) {
            throw std::invalid_argument("Config key '" + key + "' must be an object");
        }
        FieldReader nested(*it);
        nested.read("interval", band.interval);
        nested.read("period", band.period);
        nested.read("std_dev", band.std_dev);
        nested.warn_unknown(key + ".");
    }

    void warn_unknown(const std::string& prefix = "") const {
        for (const auto& item : doc_.items()) {
            if (known_.count(item.key()) == 0) {
                std::cerr << "[Config] Ignoring unknown key '" << prefix << item.key() << "'" << std::endl;
            }
        }
    }

private:
    const nlohmann::json& doc_;
    std::set<std::string> known_;
};

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // namespace

BotConfig config_from_json(const nlohmann::json& doc, BotConfig base) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Config document must be a JSON object");
    }

    FieldReader reader(doc);
    reader.read("symbol", base.symbol);
    reader.read("total_investment", base.total_investment);
    reader.read("price_precision", base.price_precision);
    reader.read("quantity_precision", base.quantity_precision);
    reader.read("spread", base.spread);
    reader.read("base_order_size", base.base_order_size);
    reader.read("grid_levels", base.grid_levels);
    reader.read("grid_step", base.grid_step);
    reader.read("side_budget_ratio", base.side_budget_ratio);
    reader.read_band("long_band", base.long_band);
    reader.read_band("short_band", base.short_band);
    reader.read("min_position_scale", base.min_position_scale);
    reader.read("max_position_scale", base.max_position_scale);
    reader.read("min_profit_spread", base.min_profit_spread);
    reader.read("trade_in_band", base.trade_in_band);
    reader.read("buy_below_sma", base.buy_below_sma);
    reader.read("dynamic_spread", base.dynamic_spread);
    reader.read("spread_min", base.spread_min);
    reader.read("spread_max", base.spread_max);
    reader.read("trend_skew", base.trend_skew);
    reader.read("uptrend_skew", base.uptrend_skew);
    reader.read("downtrend_skew", base.downtrend_skew);
    reader.read("stop_loss_activation", base.stop_loss_activation);
    reader.read("stop_loss_ratio", base.stop_loss_ratio);
    reader.read("take_profit_ratio", base.take_profit_ratio);
    reader.read("order_interval_ms", base.order_interval_ms);
    reader.read("position_refresh_ms", base.position_refresh_ms);
    reader.read("position_wait_ms", base.position_wait_ms);
    reader.read("kline_refresh_ms", base.kline_refresh_ms);
    reader.read("heartbeat_timeout_ms", base.heartbeat_timeout_ms);
    reader.read("heartbeat_check_ms", base.heartbeat_check_ms);
    reader.read("connection_check_ms", base.connection_check_ms);
    reader.read("connection_check_max_ms", base.connection_check_max_ms);
    reader.read("init_timeout_ms", base.init_timeout_ms);
    reader.read("main_loop_sleep_ms", base.main_loop_sleep_ms);
    reader.read("ws_connect_attempts", base.ws_connect_attempts);
    reader.read("ws_connect_wait_ms", base.ws_connect_wait_ms);
    reader.read("trade_retention_days", base.trade_retention_days);
    reader.read("data_dir", base.data_dir);
    reader.read("rest_url", base.rest_url);
    reader.read("ws_url", base.ws_url);
    reader.read("window_ms", base.window_ms);
    reader.warn_unknown();

    base.symbol = backpack::to_upper_copy(base.symbol);
    return base;
}

BotConfig load_config(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open config file: " + path);
    }

    nlohmann::json doc;
    try {
        input >> doc;
    } catch (const nlohmann::json::exception& ex) {
        throw std::invalid_argument("Malformed config file " + path + ": " + ex.what());
    }

    auto config = config_from_json(doc);
    std::cout << "[Config] Loaded " << path << " for " << config.symbol << std::endl;
    return config;
}

void validate(const BotConfig& config) {
    require(!config.symbol.empty(), "symbol must not be empty");
    require(config.long_band.period > 0 && config.short_band.period > 0, "band periods must be positive");
    require(config.long_band.std_dev >= 0.0 && config.short_band.std_dev >= 0.0,
            "band std multipliers must be non-negative");
    require(!config.long_band.interval.empty() && !config.short_band.interval.empty(),
            "band intervals must be set");
    require(config.grid_levels > 0, "grid_levels must be positive");
    require(config.grid_step > 0.0, "grid_step must be positive");
    require(config.price_precision >= 0 && config.price_precision <= 12, "price_precision out of range");
    require(config.quantity_precision >= 0 && config.quantity_precision <= 12, "quantity_precision out of range");
    require(config.min_position_scale > 0.0 && config.min_position_scale <= config.max_position_scale,
            "position scale bounds must satisfy 0 < min <= max");
    require(config.spread_min > 0.0 && config.spread_min <= config.spread_max,
            "spread bounds must satisfy 0 < min <= max");
    require(config.side_budget_ratio > 0.0 && config.side_budget_ratio <= 1.0,
            "side_budget_ratio must be in (0, 1]");
    require(config.total_investment > 0.0, "total_investment must be positive");
    require(config.base_order_size > 0.0, "base_order_size must be positive");
    require(config.order_interval_ms >= 0, "order_interval_ms must be non-negative");
    require(config.trade_retention_days > 0, "trade_retention_days must be positive");
    require(config.ws_connect_attempts > 0, "ws_connect_attempts must be positive");
}

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

backpack::Credentials credentials_from_env() {
    const char* api_key = std::getenv("BACKPACK_API_KEY");
    const char* api_secret = std::getenv("BACKPACK_SECRET_KEY");
    return backpack::Credentials{api_key ? api_key : "", api_secret ? api_secret : ""};
}

} // namespace bollmaker
