#include "bollmaker/position_ledger.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <filesystem>
#include <fstream>
#include <random>

using Catch::Matchers::WithinAbs;

namespace {

bollmaker::FillEvent make_fill(bollmaker::Side side, double quantity, double price,
                               std::chrono::system_clock::time_point when = std::chrono::system_clock::now()) {
    bollmaker::FillEvent fill;
    fill.symbol = "SOL_USDC";
    fill.order_id = "o";
    fill.side = side;
    fill.quantity = quantity;
    fill.price = price;
    fill.timestamp = when;
    return fill;
}

bollmaker::PositionLedgerConfig config_for(const test_support::TempDir& dir) {
    bollmaker::PositionLedgerConfig config;
    config.data_dir = dir.path() / "ledger";
    return config;
}

} // namespace

TEST_CASE("buy adds quantity and notional") {
    test_support::TempDir dir;
    bollmaker::PositionLedger ledger(config_for(dir));

    ledger.apply_fill(make_fill(bollmaker::Side::Buy, 2.0, 100.0));
    const auto position = ledger.apply_fill(make_fill(bollmaker::Side::Buy, 1.0, 130.0));

    CHECK(position.size == 3.0);
    CHECK(position.cost == 330.0);
    CHECK(ledger.trade_count() == 2);
}

TEST_CASE("sell reduces cost in proportion to the fraction sold") {
    test_support::TempDir dir;
    bollmaker::PositionLedger ledger(config_for(dir));

    ledger.apply_fill(make_fill(bollmaker::Side::Buy, 4.0, 100.0));
    const auto position = ledger.apply_fill(make_fill(bollmaker::Side::Sell, 1.0, 120.0));

    CHECK_THAT(position.size, WithinAbs(3.0, 1e-12));
    CHECK_THAT(position.cost, WithinAbs(300.0, 1e-9));
}

TEST_CASE("overselling clamps the position to zero") {
    test_support::TempDir dir;
    bollmaker::PositionLedger ledger(config_for(dir));

    ledger.apply_fill(make_fill(bollmaker::Side::Buy, 1.0, 100.0));
    const auto position = ledger.apply_fill(make_fill(bollmaker::Side::Sell, 5.0, 90.0));
    CHECK(position.size == 0.0);
    CHECK(position.cost == 0.0);

    const auto after_empty_sell = ledger.apply_fill(make_fill(bollmaker::Side::Sell, 1.0, 90.0));
    CHECK(after_empty_sell.size == 0.0);
    CHECK(after_empty_sell.cost == 0.0);
}

TEST_CASE("random fill sequences never produce a negative position") {
    test_support::TempDir dir;
    bollmaker::PositionLedger ledger(config_for(dir));

    std::mt19937 rng(20240611);
    std::uniform_real_distribution<double> quantity(0.01, 3.0);
    std::uniform_real_distribution<double> price(50.0, 150.0);
    std::bernoulli_distribution is_buy(0.45);

    for (int i = 0; i < 300; ++i) {
        const auto side = is_buy(rng) ? bollmaker::Side::Buy : bollmaker::Side::Sell;
        const auto position = ledger.apply_fill(make_fill(side, quantity(rng), price(rng)));
        REQUIRE(position.size >= 0.0);
        REQUIRE(position.cost >= 0.0);
    }
}

TEST_CASE("update_position clamps negative inputs") {
    test_support::TempDir dir;
    bollmaker::PositionLedger ledger(config_for(dir));

    ledger.update_position("SOL_USDC", -1.0, -50.0);
    const auto position = ledger.get_position("SOL_USDC");
    CHECK(position.size == 0.0);
    CHECK(position.cost == 0.0);
}

TEST_CASE("positions and trades survive a reopen") {
    test_support::TempDir dir;
    {
        bollmaker::PositionLedger ledger(config_for(dir));
        ledger.apply_fill(make_fill(bollmaker::Side::Buy, 2.0, 50.0));
        ledger.apply_fill(make_fill(bollmaker::Side::Sell, 1.0, 60.0));
    }

    bollmaker::PositionLedger reopened(config_for(dir));
    const auto position = reopened.get_position("SOL_USDC");
    CHECK_THAT(position.size, WithinAbs(1.0, 1e-12));
    CHECK_THAT(position.cost, WithinAbs(50.0, 1e-9));

    const auto trades = reopened.recent_trades("SOL_USDC");
    REQUIRE(trades.size() == 2);
    CHECK(trades.front().side == bollmaker::Side::Sell);
    CHECK(trades.back().side == bollmaker::Side::Buy);
    CHECK(trades.front().id > trades.back().id);

    const auto next = reopened.add_trade("SOL_USDC", bollmaker::Side::Buy, 55.0, 1.0,
                                         std::chrono::system_clock::now());
    CHECK(next.id == 3);
}

TEST_CASE("trades older than the retention window are pruned") {
    test_support::TempDir dir;
    auto config = config_for(dir);
    config.retention = std::chrono::hours(24);
    bollmaker::PositionLedger ledger(config);

    const auto now = std::chrono::system_clock::now();
    ledger.add_trade("SOL_USDC", bollmaker::Side::Buy, 100.0, 1.0, now - std::chrono::hours(48));
    ledger.add_trade("SOL_USDC", bollmaker::Side::Buy, 101.0, 1.0, now - std::chrono::hours(1));
    ledger.add_trade("SOL_USDC", bollmaker::Side::Sell, 102.0, 1.0, now);

    CHECK(ledger.prune_trades(now) == 1);
    CHECK(ledger.trade_count() == 2);
    CHECK(ledger.prune_trades(now) == 0);

    bollmaker::PositionLedger reopened(config);
    CHECK(reopened.trade_count() == 2);
}

TEST_CASE("write failure leaves the stored position untouched") {
    test_support::TempDir dir;
    auto config = config_for(dir);
    bollmaker::PositionLedger ledger(config);
    ledger.apply_fill(make_fill(bollmaker::Side::Buy, 1.0, 100.0));

    // Replace the data directory with a regular file.
    std::filesystem::remove_all(config.data_dir);
    {
        std::ofstream blocker(config.data_dir);
        blocker << "not a directory";
    }

    CHECK_THROWS(ledger.apply_fill(make_fill(bollmaker::Side::Buy, 1.0, 200.0)));
    const auto position = ledger.get_position("SOL_USDC");
    CHECK(position.size == 1.0);
    CHECK(position.cost == 100.0);
}

TEST_CASE("failed trade append rolls the position back") {
    test_support::TempDir dir;
    auto config = config_for(dir);
    {
        bollmaker::PositionLedger ledger(config);
        ledger.apply_fill(make_fill(bollmaker::Side::Buy, 1.0, 100.0));

        // A directory in place of the trade log makes appends fail.
        std::filesystem::remove(config.data_dir / "trades.jsonl");
        std::filesystem::create_directory(config.data_dir / "trades.jsonl");

        CHECK_THROWS(ledger.apply_fill(make_fill(bollmaker::Side::Buy, 1.0, 200.0)));
        const auto position = ledger.get_position("SOL_USDC");
        CHECK(position.size == 1.0);
        CHECK(position.cost == 100.0);
        CHECK(ledger.trade_count() == 1);

        std::filesystem::remove_all(config.data_dir / "trades.jsonl");
    }

    bollmaker::PositionLedger reopened(config);
    const auto stored = reopened.get_position("SOL_USDC");
    CHECK(stored.size == 1.0);
    CHECK(stored.cost == 100.0);
}

TEST_CASE("ledger refuses a data path that is a file") {
    test_support::TempDir dir;
    const auto file_path = dir.path() / "occupied";
    {
        std::ofstream blocker(file_path);
        blocker << "x";
    }

    bollmaker::PositionLedgerConfig config;
    config.data_dir = file_path;
    CHECK_THROWS(bollmaker::PositionLedger(config));
}
