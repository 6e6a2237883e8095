#include "bollmaker/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path temp_file(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / (name + "_" + std::to_string(stamp));
}

} // namespace

TEST_CASE("default config validates") {
    bollmaker::BotConfig config;
    CHECK_NOTHROW(bollmaker::validate(config));
    CHECK(config.grid_levels == 6);
    CHECK(config.order_interval_ms == 120000);
    CHECK(config.short_band.interval == "5m");
}

TEST_CASE("config_from_json overlays known keys and nested bands") {
    const auto doc = nlohmann::json::parse(R"({
        "symbol": "sol_usdc",
        "grid_levels": 4,
        "trade_in_band": false,
        "short_band": {"interval": "15m", "period": 10},
        "unknown_option": 1
    })");

    const auto config = bollmaker::config_from_json(doc);
    CHECK(config.symbol == "SOL_USDC");
    CHECK(config.grid_levels == 4);
    CHECK_FALSE(config.trade_in_band);
    CHECK(config.short_band.interval == "15m");
    CHECK(config.short_band.period == 10);
    CHECK(config.short_band.std_dev == 2.0);
    CHECK(config.long_band.interval == "1h");
}

TEST_CASE("order sizing comes from base_order_size alone") {
    // A legacy order_amount key, even a malformed one, has no effect.
    const auto doc = nlohmann::json::parse(R"({
        "base_order_size": 0.5,
        "order_amount": "lots"
    })");

    bollmaker::BotConfig config;
    REQUIRE_NOTHROW(config = bollmaker::config_from_json(doc));
    CHECK(config.base_order_size == 0.5);
    CHECK_NOTHROW(bollmaker::validate(config));
}

TEST_CASE("config_from_json rejects wrongly typed values") {
    const auto doc = nlohmann::json::parse(R"({"grid_levels": "six"})");
    CHECK_THROWS_AS(bollmaker::config_from_json(doc), std::invalid_argument);
}

TEST_CASE("validate rejects out-of-range options") {
    bollmaker::BotConfig config;

    SECTION("non-positive period") {
        config.short_band.period = 0;
        CHECK_THROWS_AS(bollmaker::validate(config), std::invalid_argument);
    }
    SECTION("inverted scale bounds") {
        config.min_position_scale = 5.0;
        config.max_position_scale = 2.0;
        CHECK_THROWS_AS(bollmaker::validate(config), std::invalid_argument);
    }
    SECTION("inverted spread bounds") {
        config.spread_min = 0.01;
        config.spread_max = 0.001;
        CHECK_THROWS_AS(bollmaker::validate(config), std::invalid_argument);
    }
    SECTION("budget ratio above one") {
        config.side_budget_ratio = 1.5;
        CHECK_THROWS_AS(bollmaker::validate(config), std::invalid_argument);
    }
}

TEST_CASE("load_config reads a file and fails on a missing one") {
    const auto path = temp_file("bollmaker_config.json");
    {
        std::ofstream out(path);
        out << R"({"total_investment": 500, "stop_loss_ratio": 0.05})";
    }

    const auto config = bollmaker::load_config(path.string());
    CHECK(config.total_investment == 500.0);
    CHECK(config.stop_loss_ratio == 0.05);
    std::filesystem::remove(path);

    CHECK_THROWS_AS(bollmaker::load_config(path.string()), std::runtime_error);
}

TEST_CASE("env file supplies API credentials") {
    const auto path = temp_file("bollmaker_env");
    {
        std::ofstream out(path);
        out << "# credentials\n";
        out << "BACKPACK_API_KEY = \"test-key\"\n";
        out << "BACKPACK_SECRET_KEY=test-secret\n";
    }

    bollmaker::load_env_file(path.string());
    const auto credentials = bollmaker::credentials_from_env();
    CHECK(credentials.api_key == "test-key");
    CHECK(credentials.api_secret == "test-secret");
    CHECK_FALSE(credentials.empty());

    std::filesystem::remove(path);
    unsetenv("BACKPACK_API_KEY");
    unsetenv("BACKPACK_SECRET_KEY");
}
