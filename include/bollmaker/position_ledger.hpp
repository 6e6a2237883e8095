#pragma once

#include "bollmaker/market_events.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace bollmaker {

struct Position {
    std::string symbol;
    double size = 0.0;
    double cost = 0.0;
    std::chrono::system_clock::time_point updated_at{};
};

struct TradeRecord {
    long long id = 0;
    std::string symbol;
    Side side = Side::Buy;
    double price = 0.0;
    double quantity = 0.0;
    std::chrono::system_clock::time_point executed_at{};
};

struct PositionLedgerConfig {
    std::filesystem::path data_dir = "data";
    std::chrono::hours retention{24 * 15};
};

// Durable net position and cost basis per symbol plus an append-only trade
// log. positions.json is rewritten atomically; trades.jsonl is appended.
// Not internally synchronized: exactly one owner may call into it.
class PositionLedger {
public:
    explicit PositionLedger(PositionLedgerConfig config);

    [[nodiscard]] Position get_position(const std::string& symbol) const;

    // Persists first; memory only changes once the write succeeded.
    // Negative inputs are clamped to zero.
    void update_position(const std::string& symbol, double size, double cost);

    TradeRecord add_trade(const std::string& symbol,
                          Side side,
                          double price,
                          double quantity,
                          std::chrono::system_clock::time_point executed_at);

    // Buy adds quantity and notional. Sell removes quantity and reduces cost
    // by (sold / size) * cost. Returns the new position. If the trade cannot
    // be appended the position is rolled back and the error rethrown.
    Position apply_fill(const FillEvent& fill);

    // Drops trades executed before now - retention. Returns the number removed.
    std::size_t prune_trades(std::chrono::system_clock::time_point now);

    // Newest first.
    [[nodiscard]] std::vector<TradeRecord> recent_trades(const std::string& symbol,
                                                         std::size_t limit = 50) const;

    [[nodiscard]] std::size_t trade_count() const noexcept { return trades_.size(); }
    [[nodiscard]] const PositionLedgerConfig& config() const noexcept { return config_; }

private:
    void ensure_directory() const;
    void load_positions();
    void load_trades();
    void write_positions(const std::map<std::string, Position>& positions) const;
    void rewrite_trades(const std::deque<TradeRecord>& trades) const;
    void append_trade_line(const TradeRecord& trade) const;

    [[nodiscard]] std::filesystem::path positions_path() const;
    [[nodiscard]] std::filesystem::path trades_path() const;

    PositionLedgerConfig config_;
    std::map<std::string, Position> positions_;
    std::deque<TradeRecord> trades_;
    long long next_trade_id_ = 1;
    std::chrono::system_clock::time_point last_prune_{};
};

} // namespace bollmaker
