#include "backpack/rest_client.hpp"
#include "backpack/util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

TEST_CASE("url_encode handles safe and unsafe characters") {
    using backpack::url_encode;
    CHECK(url_encode("simple") == "simple");
    CHECK(url_encode("hello world") == "hello%20world");
    CHECK(url_encode("1+1=2") == "1%2B1%3D2");
    CHECK(url_encode("symbols-_.~") == "symbols-_.~");
}

TEST_CASE("filter_empty removes empty values") {
    using backpack::filter_empty;
    backpack::QueryParams params = {
        {"key1", "value"},
        {"key2", ""},
        {"key3", "0"},
        {"key4", "false"}
    };

    const auto filtered = filter_empty(params);
    REQUIRE(filtered.size() == 3);
    CHECK(filtered[0].first == "key1");
    CHECK(filtered[1].first == "key3");
    CHECK(filtered[2].first == "key4");
}

TEST_CASE("build_query_string preserves order and encodes values") {
    using backpack::build_query_string;
    backpack::QueryParams params = {
        {"symbol", "SOL_USDC"},
        {"limit", "100"},
        {"note", "space value"}
    };

    CHECK(build_query_string(params) == "symbol=SOL_USDC&limit=100&note=space%20value");
}

TEST_CASE("signing payload sorts parameters between instruction and window") {
    backpack::QueryParams params = {
        {"symbol", "SOL_USDC"},
        {"side", "Bid"},
        {"orderType", "Limit"},
        {"clientId", ""}
    };

    const auto payload = backpack::build_signing_payload("orderExecute", params, 1700000000000, 5000);
    CHECK(payload ==
          "instruction=orderExecute&orderType=Limit&side=Bid&symbol=SOL_USDC"
          "&timestamp=1700000000000&window=5000");

    CHECK(backpack::build_signing_payload("subscribe", {}, 42, 5000) ==
          "instruction=subscribe&timestamp=42&window=5000");
}

TEST_CASE("hmac_sha256_hex matches a known digest") {
    CHECK(backpack::hmac_sha256_hex("key", "The quick brown fox jumps over the lazy dog") ==
          "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST_CASE("format_decimal and round_to_precision respect precision") {
    CHECK(backpack::format_decimal(99.98, 2) == "99.98");
    CHECK(backpack::format_decimal(0.1, 4) == "0.1000");
    CHECK(backpack::format_decimal(3.0, 0) == "3");
    CHECK(backpack::round_to_precision(100.0 * (1 - 0.0002), 2) == 99.98);
    CHECK(backpack::round_to_precision(0.123456, 3) == 0.123);
}

TEST_CASE("to_upper_copy converts strings to uppercase") {
    using backpack::to_upper_copy;
    CHECK(to_upper_copy("sol_usdc") == "SOL_USDC");
    CHECK(to_upper_copy("already upper") == "ALREADY UPPER");
}

TEST_CASE("order signing params carry every optional flag in wire form") {
    backpack::OrderRequest order;
    order.symbol = "SOL_USDC";
    order.side = "Bid";
    order.quantity = "0.10";
    order.price = "99.98";
    order.post_only = true;
    order.client_id = 7;
    order.auto_borrow = false;

    const auto params = backpack::order_signing_params(order);
    const auto payload = backpack::build_signing_payload("orderExecute", params, 1, 5000);
    CHECK(payload ==
          "instruction=orderExecute&autoBorrow=false&clientId=7&orderType=Limit&postOnly=true"
          "&price=99.98&quantity=0.10&side=Bid&symbol=SOL_USDC&timeInForce=GTC&timestamp=1&window=5000");

    const auto body = backpack::order_body(order);
    CHECK(body.at("postOnly").get<bool>());
    CHECK(body.at("clientId").get<unsigned>() == 7u);
    CHECK(body.at("price").get<std::string>() == "99.98");
    CHECK_FALSE(body.contains("reduceOnly"));
}

TEST_CASE("kline intervals map to seconds") {
    CHECK(backpack::kline_interval_seconds("1m") == 60);
    CHECK(backpack::kline_interval_seconds("5m") == 300);
    CHECK(backpack::kline_interval_seconds("1h") == 3600);
    CHECK(backpack::kline_interval_seconds("1month") == 2592000);
    CHECK_THROWS_AS(backpack::kline_interval_seconds("7m"), std::invalid_argument);
}
