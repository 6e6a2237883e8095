#include "backpack/rest_client.hpp"
#include "bollmaker/config.hpp"
#include "bollmaker/exchange_gateway.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <iostream>
#include <string>

// Live venue round trips. Hidden by default; run with `bollmaker_tests "[integration]"`.

namespace {

constexpr const char* kSymbol = "SOL_USDC";

backpack::Credentials load_credentials() {
    const std::filesystem::path source_root = std::filesystem::path(__FILE__).parent_path().parent_path();
    bollmaker::load_env_file(".env");
    bollmaker::load_env_file((source_root / ".env").string());
    return bollmaker::credentials_from_env();
}

} // namespace

TEST_CASE("RestClient ticker and depth return live market data", "[.integration][backpack]") {
    backpack::RestClient client{backpack::Credentials{}};

    try {
        const auto ticker = client.ticker(kSymbol);
        REQUIRE(ticker.is_object());
        CHECK(ticker.contains("lastPrice"));

        const auto depth = client.depth(kSymbol, 5);
        REQUIRE(depth.is_object());
        CHECK(depth.contains("bids"));
        CHECK(depth.contains("asks"));
    } catch (const backpack::HttpError& ex) {
        FAIL_CHECK("HTTP error while fetching market data (status " << ex.status_code() << "): " << ex.what());
    }
}

TEST_CASE("BackpackGateway klines cover the requested window", "[.integration][backpack]") {
    backpack::RestClient client{backpack::Credentials{}};
    bollmaker::BackpackGateway gateway{client, 2, 2};

    try {
        const auto bars = gateway.klines(kSymbol, "5m", 42);
        std::cout << "[Backpack] " << bars.size() << " bars for " << kSymbol << std::endl;
        REQUIRE_FALSE(bars.empty());
        for (const auto& bar : bars) {
            CHECK(bar.close > 0.0);
            CHECK(bar.start_time > 0);
        }
        CHECK(gateway.ticker_price(kSymbol) > 0.0);
    } catch (const backpack::HttpError& ex) {
        FAIL_CHECK("HTTP error while fetching klines: " << ex.what());
    }
}

TEST_CASE("RestClient balances with signed request", "[.integration][backpack]") {
    const auto credentials = load_credentials();
    if (credentials.empty()) {
        WARN("BACKPACK_API_KEY / BACKPACK_SECRET_KEY not set; skipping signed balance query");
        return;
    }

    backpack::RestClient client{credentials};
    try {
        const auto balances = client.balances();
        CHECK(balances.is_object());

        const auto orders = client.open_orders(std::string(kSymbol));
        CHECK(orders.is_array());

        const auto fills = client.fill_history(std::string(kSymbol), 10);
        CHECK(fills.is_array());
    } catch (const backpack::HttpError& ex) {
        FAIL_CHECK("HTTP error while fetching balances (status " << ex.status_code() << "): " << ex.what());
    }
}
