#pragma once

#include "bollmaker/config.hpp"
#include "bollmaker/exchange_gateway.hpp"
#include "bollmaker/indicator_engine.hpp"
#include "bollmaker/position_cache.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace bollmaker {

struct SpreadPair {
    double ask = 0.0;
    double bid = 0.0;
};

struct LadderOrder {
    Side side = Side::Buy;
    double price = 0.0;
    double quantity = 0.0;
};

struct LadderPlan {
    std::vector<LadderOrder> buys;
    std::vector<LadderOrder> sells;
    bool buy_allowed = true;
    bool sell_allowed = true;
    double buy_budget = 0.0;      // quote notional
    double sell_budget = 0.0;     // base quantity
    double buy_used = 0.0;
    double sell_used = 0.0;
    std::optional<double> min_sell_price;
    double position_scale = 0.0;
    SpreadPair spreads;
};

// Returns true when the level was accepted; only accepted levels consume
// side budget.
using LevelPlacer = std::function<bool(const LadderOrder&)>;

// Turns band snapshots and the cached position into a bounded order ladder.
// Not thread-safe; driven by the event dispatcher.
class OrderingEngine {
public:
    using Clock = std::chrono::steady_clock;

    OrderingEngine(const BotConfig& config,
                   ExchangeGateway& gateway,
                   IndicatorEngine& indicators,
                   PositionCache& cache);

    // At most one adjustment per order interval. Defers without consuming the
    // interval while the indicators are not ready, logging once per stretch.
    bool maybe_adjust(double price, Clock::time_point now);

    // One full cycle: risk, bands, cancel, ladder. Returns orders placed.
    std::size_t adjust_orders(double price);

    // False means "do not trade this cycle"; a close was attempted.
    bool check_risk_control(double price, const CachedPosition& position);

    // IOC market sell of the whole position.
    bool close_position(const CachedPosition& position);

    [[nodiscard]] SpreadPair calculate_dynamic_spread(double price, const BandSnapshot& short_band) const;

    [[nodiscard]] double calculate_position_scale(double price,
                                                  const BandSnapshot& long_band,
                                                  const BandSnapshot& short_band) const;

    // Walks levels outward from price on each side and stops a side at the
    // first level that would breach its budget. Without a placer every level
    // is assumed accepted.
    [[nodiscard]] LadderPlan build_ladder(double price,
                                          const IndicatorSnapshot& bands,
                                          const CachedPosition& position,
                                          const LevelPlacer& placer = nullptr) const;

    void on_fill(const FillEvent& fill);

    [[nodiscard]] std::optional<Clock::time_point> last_order_time() const noexcept { return last_order_time_; }

private:
    bool place_level(const LadderOrder& level);

    BotConfig config_;
    ExchangeGateway& gateway_;
    IndicatorEngine& indicators_;
    PositionCache& cache_;
    std::optional<Clock::time_point> last_order_time_;
    bool deferring_ = false;
};

} // namespace bollmaker
