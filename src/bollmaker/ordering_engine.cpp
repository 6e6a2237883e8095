#include "bollmaker/ordering_engine.hpp"

#include "backpack/util.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace bollmaker {

namespace {

constexpr double kLowVolatility = 0.0025;
constexpr double kHighVolatility = 0.05;
constexpr double kMinBandRange = 1e-4;

bool in_band(double price, const BandSnapshot& band) {
    return band.lower <= price && price <= band.upper;
}

} // namespace

OrderingEngine::OrderingEngine(const BotConfig& config,
                               ExchangeGateway& gateway,
                               IndicatorEngine& indicators,
                               PositionCache& cache)
    : config_(config),
      gateway_(gateway),
      indicators_(indicators),
      cache_(cache) {}

bool OrderingEngine::maybe_adjust(double price, Clock::time_point now) {
    if (last_order_time_ &&
        now - *last_order_time_ < std::chrono::milliseconds(config_.order_interval_ms)) {
        return false;
    }
    if (!indicators_.is_ready()) {
        if (!deferring_) {
            std::cout << "[Orders] Indicators not ready; deferring order placement" << std::endl;
            deferring_ = true;
        }
        return false;
    }
    if (deferring_) {
        std::cout << "[Orders] Indicators ready; resuming order placement" << std::endl;
        deferring_ = false;
    }
    if (price <= 0.0) {
        return false;
    }

    last_order_time_ = now;
    adjust_orders(price);
    return true;
}

std::size_t OrderingEngine::adjust_orders(double price) {
    const auto position = cache_.get_cached_position();
    if (!check_risk_control(price, position)) {
        return 0;
    }

    const auto bands = indicators_.snapshot();

    try {
        gateway_.cancel_all_orders(config_.symbol);
    } catch (const std::exception& ex) {
        std::cerr << "[Orders] Cancel-all failed, skipping this cycle: " << ex.what() << std::endl;
        return 0;
    }

    const auto plan = build_ladder(price, bands, position, [this](const LadderOrder& level) {
        return place_level(level);
    });

    std::cout << "[Orders] price=" << price
              << " scale=" << std::fixed << std::setprecision(4) << plan.position_scale
              << " ask_spread=" << std::setprecision(6) << plan.spreads.ask
              << " bid_spread=" << plan.spreads.bid
              << std::defaultfloat
              << " buys=" << plan.buys.size() << " (" << plan.buy_used << "/" << plan.buy_budget << ")"
              << " sells=" << plan.sells.size() << " (" << plan.sell_used << "/" << plan.sell_budget << ")"
              << std::endl;

    return plan.buys.size() + plan.sells.size();
}

bool OrderingEngine::check_risk_control(double price, const CachedPosition& position) {
    const double cost = position.avg_price;
    if (cost <= 0.0) {
        return true;
    }

    const double roi = (price - cost) / cost;

    if (std::abs(roi) >= config_.stop_loss_activation) {
        if (roi < 0.0 && std::abs(roi) >= config_.stop_loss_ratio) {
            std::cerr << "[Risk] Stop loss: roi=" << roi * 100.0 << "% price=" << price
                      << " cost=" << cost << std::endl;
            close_position(position);
            return false;
        }
    }

    if (roi >= config_.take_profit_ratio) {
        std::cout << "[Risk] Take profit: roi=" << roi * 100.0 << "% price=" << price
                  << " cost=" << cost << std::endl;
        close_position(position);
        return false;
    }

    return true;
}

bool OrderingEngine::close_position(const CachedPosition& position) {
    if (position.size <= 0.0) {
        return false;
    }

    OrderRequest order;
    order.symbol = config_.symbol;
    order.side = Side::Sell;
    order.type = OrderType::Market;
    order.quantity = position.size;
    order.time_in_force = TimeInForce::IOC;

    try {
        const auto id = gateway_.place_order(order);
        std::cout << "[Risk] Closed position of " << position.size << " (order " << id << ")" << std::endl;
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "[Risk] Failed to close position: " << ex.what() << std::endl;
        return false;
    }
}

SpreadPair OrderingEngine::calculate_dynamic_spread(double price, const BandSnapshot& short_band) const {
    if (!config_.dynamic_spread || price <= 0.0) {
        return {config_.spread, config_.spread};
    }

    const double volatility = std::abs(short_band.upper - short_band.lower) / price;

    double base_spread = 0.0;
    if (volatility <= kLowVolatility) {
        base_spread = config_.spread_min;
    } else if (volatility >= kHighVolatility) {
        base_spread = config_.spread_max;
    } else {
        const double normalized = (volatility - kLowVolatility) / (kHighVolatility - kLowVolatility);
        base_spread = config_.spread_min + (config_.spread_max - config_.spread_min) * normalized;
    }

    SpreadPair spreads{base_spread, base_spread};
    if (config_.trend_skew) {
        const double skew = price > short_band.middle ? config_.uptrend_skew : config_.downtrend_skew;
        spreads.ask = base_spread * skew;
        spreads.bid = base_spread * (2.0 - skew);
    }

    spreads.ask = std::clamp(spreads.ask, config_.spread_min, config_.spread_max);
    spreads.bid = std::clamp(spreads.bid, config_.spread_min, config_.spread_max);
    return spreads;
}

double OrderingEngine::calculate_position_scale(double price,
                                                const BandSnapshot& long_band,
                                                const BandSnapshot& short_band) const {
    const double long_range = long_band.upper - long_band.lower;
    const double short_range = short_band.upper - short_band.lower;
    if (long_range <= kMinBandRange || short_range <= kMinBandRange) {
        return config_.min_position_scale;
    }

    const double long_position = 1.0 - std::clamp((price - long_band.lower) / long_range, 0.0, 1.0);
    const double short_position = 1.0 - std::clamp((price - short_band.lower) / short_range, 0.0, 1.0);
    const double average = (long_position + short_position) / 2.0;

    return config_.min_position_scale +
           (config_.max_position_scale - config_.min_position_scale) * average;
}

LadderPlan OrderingEngine::build_ladder(double price,
                                        const IndicatorSnapshot& bands,
                                        const CachedPosition& position,
                                        const LevelPlacer& placer) const {
    LadderPlan plan;
    plan.position_scale = calculate_position_scale(price, bands.long_band, bands.short_band);
    plan.spreads = calculate_dynamic_spread(price, bands.short_band);

    if (config_.trade_in_band) {
        plan.buy_allowed = in_band(price, bands.short_band);
        plan.sell_allowed = plan.buy_allowed;
    }
    if (config_.buy_below_sma) {
        plan.buy_allowed = plan.buy_allowed && price < bands.short_band.middle;
    }

    const double side_budget = config_.total_investment * config_.side_budget_ratio;
    plan.buy_budget = side_budget;
    plan.sell_budget = side_budget / price;

    if (position.avg_price > 0.0) {
        plan.min_sell_price = backpack::round_to_precision(
            position.avg_price * (1.0 + config_.min_profit_spread), config_.price_precision);
    }

    std::vector<double> buy_prices;
    std::vector<double> sell_prices;
    for (int i = 1; i <= config_.grid_levels; ++i) {
        const double bp = backpack::round_to_precision(price * (1.0 - config_.grid_step * i), config_.price_precision);
        const double ap = backpack::round_to_precision(price * (1.0 + config_.grid_step * i), config_.price_precision);
        if (bp > 0.0) {
            buy_prices.push_back(bp);
        }
        if (ap > 0.0) {
            sell_prices.push_back(ap);
        }
    }

    const double quantity = backpack::round_to_precision(config_.base_order_size, config_.quantity_precision);

    if (plan.buy_allowed) {
        for (double bp : buy_prices) {
            const double notional = bp * config_.base_order_size;
            if (plan.buy_used + notional > plan.buy_budget) {
                break;
            }
            if (quantity <= 0.0) {
                continue;
            }
            const LadderOrder level{Side::Buy, bp, quantity};
            if (placer && !placer(level)) {
                continue;
            }
            plan.buys.push_back(level);
            plan.buy_used += notional;
        }
    }

    if (plan.sell_allowed) {
        for (double ap : sell_prices) {
            if (plan.min_sell_price && ap <= *plan.min_sell_price) {
                continue;
            }
            if (plan.sell_used + quantity > plan.sell_budget) {
                break;
            }
            if (quantity <= 0.0) {
                continue;
            }
            const LadderOrder level{Side::Sell, ap, quantity};
            if (placer && !placer(level)) {
                continue;
            }
            plan.sells.push_back(level);
            plan.sell_used += quantity;
        }
    }

    return plan;
}

bool OrderingEngine::place_level(const LadderOrder& level) {
    OrderRequest order;
    order.symbol = config_.symbol;
    order.side = level.side;
    order.type = OrderType::Limit;
    order.quantity = level.quantity;
    order.price = level.price;
    order.time_in_force = TimeInForce::GTC;
    order.post_only = true;

    try {
        const auto id = gateway_.place_order(order);
        std::cout << "[Orders] " << to_string(level.side) << " " << level.quantity
                  << " @ " << level.price << " -> " << id << std::endl;
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "[Orders] " << to_string(level.side) << " @ " << level.price
                  << " rejected: " << ex.what() << std::endl;
        return false;
    }
}

void OrderingEngine::on_fill(const FillEvent& fill) {
    if (!fill.symbol.empty() && fill.symbol != config_.symbol) {
        return;
    }
    FillEvent routed = fill;
    routed.symbol = config_.symbol;
    cache_.enqueue_fill(routed);
}

} // namespace bollmaker
