#include "bollmaker/order_book.hpp"

#include <catch2/catch_test_macros.hpp>

namespace {

bollmaker::DepthEvent depth(std::vector<bollmaker::PriceLevel> bids,
                            std::vector<bollmaker::PriceLevel> asks,
                            long long update_id) {
    bollmaker::DepthEvent event;
    event.symbol = "SOL_USDC";
    event.bids = std::move(bids);
    event.asks = std::move(asks);
    event.first_update_id = update_id;
    event.last_update_id = update_id;
    return event;
}

} // namespace

TEST_CASE("depth deltas upsert levels and zero quantity removes them") {
    bollmaker::OrderBook book("SOL_USDC");

    book.apply_depth(depth({{99.0, 1.0}, {98.0, 2.0}}, {{101.0, 1.5}, {102.0, 3.0}}, 1));
    CHECK(book.best_bid() == 99.0);
    CHECK(book.best_ask() == 101.0);
    CHECK(book.mid_price() == 100.0);

    book.apply_depth(depth({{99.0, 0.0}, {98.0, 5.0}}, {{101.0, 0.0}}, 2));
    CHECK(book.best_bid() == 98.0);
    CHECK(book.best_ask() == 102.0);
    CHECK(book.quantity_at_price(98.0, bollmaker::Side::Buy) == 5.0);
    CHECK(book.quantity_at_price(99.0, bollmaker::Side::Buy) == 0.0);
    CHECK(book.last_update_id() == 2);

    const auto bids = book.bids();
    REQUIRE(bids.size() == 1);
    CHECK(bids.front().first == 98.0);
}

TEST_CASE("mid price is zero while a side is empty") {
    bollmaker::OrderBook book("SOL_USDC");
    CHECK(book.mid_price() == 0.0);

    book.apply_depth(depth({{99.0, 1.0}}, {}, 1));
    CHECK(book.mid_price() == 0.0);
}

TEST_CASE("book ticker overrides the top of book") {
    bollmaker::OrderBook book("SOL_USDC");
    book.apply_depth(depth({{99.0, 1.0}}, {{101.0, 1.0}}, 1));

    bollmaker::BookTickerEvent ticker{"SOL_USDC", 99.5, 100.5};
    book.apply_ticker(ticker);
    CHECK(book.mid_price() == 100.0);
    CHECK(book.best_bid() == 99.5);

    book.clear();
    CHECK(book.mid_price() == 0.0);
    CHECK(book.bids().empty());
}
