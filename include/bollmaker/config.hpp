#pragma once

#include "backpack/client_base.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace bollmaker {

struct BandConfig {
    std::string interval;
    int period = 21;
    double std_dev = 2.0;
};

struct BotConfig {
    std::string symbol = "SOL_USDC_PERP";
    double total_investment = 200.0;
    int price_precision = 2;
    int quantity_precision = 2;

    // Ladder
    double spread = 0.00018;
    double base_order_size = 0.1;
    int grid_levels = 6;
    double grid_step = 0.0002;
    double side_budget_ratio = 0.5;

    // Bollinger bands
    BandConfig long_band{"1h", 21, 2.0};
    BandConfig short_band{"5m", 21, 2.0};

    double min_position_scale = 1.0;
    double max_position_scale = 10.0;
    double min_profit_spread = 0.0005;

    // Entry gating
    bool trade_in_band = true;
    bool buy_below_sma = false;

    // Dynamic spread and trend skew
    bool dynamic_spread = true;
    double spread_min = 0.00022;
    double spread_max = 0.001;
    bool trend_skew = true;
    double uptrend_skew = 0.8;
    double downtrend_skew = 1.2;

    // Risk
    double stop_loss_activation = 0.02;
    double stop_loss_ratio = 0.03;
    double take_profit_ratio = 0.008;

    // Cadence
    int order_interval_ms = 120000;
    int position_refresh_ms = 1000;
    int position_wait_ms = 1000;
    int kline_refresh_ms = 60000;
    int heartbeat_timeout_ms = 30000;
    int heartbeat_check_ms = 5000;
    int connection_check_ms = 30000;
    int connection_check_max_ms = 300000;
    int init_timeout_ms = 30000;
    int main_loop_sleep_ms = 100;
    int ws_connect_attempts = 3;
    int ws_connect_wait_ms = 30000;

    // Storage
    int trade_retention_days = 15;
    std::string data_dir = "data";

    // Venue
    std::string rest_url = "https://api.backpack.exchange";
    std::string ws_url = "wss://ws.backpack.exchange";
    long window_ms = 5000;
};

// Overlays keys found in a JSON file onto the defaults. Bands are nested
// objects: {"long_band": {"interval": "1h", "period": 21, "std_dev": 2.0}}.
BotConfig load_config(const std::string& path);

BotConfig config_from_json(const nlohmann::json& doc, BotConfig base = {});

// Throws std::invalid_argument on the first out-of-range option.
void validate(const BotConfig& config);

// KEY=VALUE lines are exported into the environment; missing file is not an error.
void load_env_file(const std::string& path);

backpack::Credentials credentials_from_env();

} // namespace bollmaker
