#include "bollmaker/position_ledger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace bollmaker {

namespace {

constexpr auto kPruneInterval = std::chrono::minutes(1);

long long to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(long long ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds(ms)};
}

template <typename T>
T json_value_or(const nlohmann::json& j, const char* key, T fallback) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

nlohmann::json trade_to_json(const TradeRecord& trade) {
    nlohmann::json json;
    json["id"] = trade.id;
    json["symbol"] = trade.symbol;
    json["side"] = to_string(trade.side);
    json["price"] = trade.price;
    json["quantity"] = trade.quantity;
    json["executed_at"] = to_epoch_ms(trade.executed_at);
    return json;
}

} // namespace

PositionLedger::PositionLedger(PositionLedgerConfig config)
    : config_(std::move(config)) {
    if (config_.data_dir.empty()) {
        throw std::invalid_argument("PositionLedger data directory not set");
    }
    if (config_.retention.count() <= 0) {
        throw std::invalid_argument("PositionLedger retention must be positive");
    }

    ensure_directory();
    load_positions();
    load_trades();
    prune_trades(std::chrono::system_clock::now());
}

Position PositionLedger::get_position(const std::string& symbol) const {
    const auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        Position empty;
        empty.symbol = symbol;
        return empty;
    }
    return it->second;
}

void PositionLedger::update_position(const std::string& symbol, double size, double cost) {
    Position updated;
    updated.symbol = symbol;
    updated.size = std::max(0.0, size);
    updated.cost = std::max(0.0, cost);
    updated.updated_at = std::chrono::system_clock::now();

    auto next = positions_;
    next[symbol] = updated;
    write_positions(next);
    positions_ = std::move(next);
}

TradeRecord PositionLedger::add_trade(const std::string& symbol,
                                      Side side,
                                      double price,
                                      double quantity,
                                      std::chrono::system_clock::time_point executed_at) {
    TradeRecord trade;
    trade.id = next_trade_id_;
    trade.symbol = symbol;
    trade.side = side;
    trade.price = price;
    trade.quantity = quantity;
    trade.executed_at = executed_at;

    append_trade_line(trade);
    trades_.push_back(trade);
    ++next_trade_id_;

    // The trade is already durable; a failed prune is retried next time.
    const auto now = std::chrono::system_clock::now();
    if (now - last_prune_ >= kPruneInterval) {
        try {
            prune_trades(now);
        } catch (const std::exception& ex) {
            std::cerr << "[Ledger] Trade pruning failed: " << ex.what() << std::endl;
        }
    }
    return trade;
}

Position PositionLedger::apply_fill(const FillEvent& fill) {
    const auto current = get_position(fill.symbol);
    double size = current.size;
    double cost = current.cost;

    if (fill.side == Side::Buy) {
        size += fill.quantity;
        cost += fill.quantity * fill.price;
    } else {
        if (size > 0.0) {
            cost -= (fill.quantity / size) * cost;
        } else {
            cost = 0.0;
        }
        size -= fill.quantity;
    }

    size = std::max(0.0, size);
    cost = size > 0.0 ? std::max(0.0, cost) : 0.0;

    const auto previous = positions_;
    update_position(fill.symbol, size, cost);
    try {
        add_trade(fill.symbol, fill.side, fill.price, fill.quantity, fill.timestamp);
    } catch (const std::exception&) {
        // Without its trade record the fill does not count.
        positions_ = previous;
        try {
            write_positions(previous);
        } catch (const std::exception& ex) {
            std::cerr << "[Ledger] Could not restore " << positions_path().string()
                      << " after a failed trade append: " << ex.what() << std::endl;
        }
        throw;
    }
    return get_position(fill.symbol);
}

std::size_t PositionLedger::prune_trades(std::chrono::system_clock::time_point now) {
    last_prune_ = now;
    const auto cutoff = now - config_.retention;

    std::deque<TradeRecord> kept;
    for (const auto& trade : trades_) {
        if (trade.executed_at >= cutoff) {
            kept.push_back(trade);
        }
    }

    const std::size_t removed = trades_.size() - kept.size();
    if (removed == 0) {
        return 0;
    }

    rewrite_trades(kept);
    trades_ = std::move(kept);
    std::cout << "[Ledger] Pruned " << removed << " trades older than "
              << config_.retention.count() / 24 << " days" << std::endl;
    return removed;
}

std::vector<TradeRecord> PositionLedger::recent_trades(const std::string& symbol, std::size_t limit) const {
    std::vector<TradeRecord> result;
    for (auto it = trades_.rbegin(); it != trades_.rend() && result.size() < limit; ++it) {
        if (it->symbol == symbol) {
            result.push_back(*it);
        }
    }
    return result;
}

void PositionLedger::ensure_directory() const {
    if (!std::filesystem::exists(config_.data_dir)) {
        std::filesystem::create_directories(config_.data_dir);
    }
    if (!std::filesystem::is_directory(config_.data_dir)) {
        throw std::runtime_error("Ledger path is not a directory: " + config_.data_dir.string());
    }
}

std::filesystem::path PositionLedger::positions_path() const {
    return config_.data_dir / "positions.json";
}

std::filesystem::path PositionLedger::trades_path() const {
    return config_.data_dir / "trades.jsonl";
}

void PositionLedger::load_positions() {
    std::ifstream input(positions_path());
    if (!input.good()) {
        return;
    }

    nlohmann::json doc;
    try {
        input >> doc;
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Corrupt position file " + positions_path().string() + ": " + ex.what());
    }
    if (!doc.is_object()) {
        return;
    }

    for (const auto& item : doc.items()) {
        Position position;
        position.symbol = item.key();
        position.size = std::max(0.0, json_value_or<double>(item.value(), "size", 0.0));
        position.cost = std::max(0.0, json_value_or<double>(item.value(), "cost", 0.0));
        position.updated_at = from_epoch_ms(json_value_or<long long>(item.value(), "updated_at", 0));
        positions_[position.symbol] = position;
    }
}

void PositionLedger::load_trades() {
    std::ifstream input(trades_path());
    if (!input.good()) {
        return;
    }

    std::string line;
    std::size_t skipped = 0;
    while (std::getline(input, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            const auto json = nlohmann::json::parse(line);
            TradeRecord trade;
            trade.id = json_value_or<long long>(json, "id", 0);
            trade.symbol = json_value_or<std::string>(json, "symbol", "");
            trade.side = json_value_or<std::string>(json, "side", "buy") == "sell" ? Side::Sell : Side::Buy;
            trade.price = json_value_or<double>(json, "price", 0.0);
            trade.quantity = json_value_or<double>(json, "quantity", 0.0);
            trade.executed_at = from_epoch_ms(json_value_or<long long>(json, "executed_at", 0));
            next_trade_id_ = std::max(next_trade_id_, trade.id + 1);
            trades_.push_back(std::move(trade));
        } catch (const nlohmann::json::exception&) {
            ++skipped;
        }
    }

    if (skipped > 0) {
        std::cerr << "[Ledger] Skipped " << skipped << " unreadable trade lines" << std::endl;
    }
}

void PositionLedger::write_positions(const std::map<std::string, Position>& positions) const {
    ensure_directory();

    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [symbol, position] : positions) {
        doc[symbol] = {
            {"size", position.size},
            {"cost", position.cost},
            {"updated_at", to_epoch_ms(position.updated_at)}
        };
    }

    const auto target = positions_path();
    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.good()) {
            throw std::runtime_error("Failed to open " + temp.string() + " for writing");
        }
        output << doc.dump(2) << '\n';
        output.flush();
        if (!output.good()) {
            throw std::runtime_error("Failed to write " + temp.string());
        }
    }
    std::filesystem::rename(temp, target);
}

void PositionLedger::rewrite_trades(const std::deque<TradeRecord>& trades) const {
    ensure_directory();

    const auto target = trades_path();
    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.good()) {
            throw std::runtime_error("Failed to open " + temp.string() + " for writing");
        }
        for (const auto& trade : trades) {
            output << trade_to_json(trade).dump() << '\n';
        }
        if (!output.good()) {
            throw std::runtime_error("Failed to write " + temp.string());
        }
    }
    std::filesystem::rename(temp, target);
}

void PositionLedger::append_trade_line(const TradeRecord& trade) const {
    ensure_directory();

    std::ofstream output(trades_path(), std::ios::app);
    if (!output.good()) {
        throw std::runtime_error("Failed to append to trade log at " + trades_path().string());
    }
    output << trade_to_json(trade).dump() << '\n';
}

} // namespace bollmaker
