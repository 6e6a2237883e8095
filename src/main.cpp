#include "backpack/rest_client.hpp"
#include "backpack/ws_client.hpp"
#include "bollmaker/config.hpp"
#include "bollmaker/event_channel.hpp"
#include "bollmaker/exchange_gateway.hpp"
#include "bollmaker/indicator_engine.hpp"
#include "bollmaker/market_data_feed.hpp"
#include "bollmaker/order_book.hpp"
#include "bollmaker/ordering_engine.hpp"
#include "bollmaker/position_cache.hpp"
#include "bollmaker/position_ledger.hpp"
#include "bollmaker/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

} // namespace

int main(int argc, char** argv) {
    bollmaker::load_env_file(".env");

    bollmaker::BotConfig config;
    try {
        if (argc > 1) {
            config = bollmaker::load_config(argv[1]);
        }
        bollmaker::validate(config);
    } catch (const std::exception& ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
        return 2;
    }

    const auto credentials = bollmaker::credentials_from_env();
    if (credentials.empty()) {
        std::cerr << "[Config] BACKPACK_API_KEY and BACKPACK_SECRET_KEY must be set" << std::endl;
        return 2;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        backpack::ClientOptions options;
        options.base_url = config.rest_url;
        options.window_ms = config.window_ms;
        backpack::RestClient rest{credentials, options};
        bollmaker::BackpackGateway gateway{rest, config.price_precision, config.quantity_precision};

        backpack::WsClient transport{config.ws_url};
        transport.set_heartbeat_interval_ms(config.heartbeat_timeout_ms / 2);
        bollmaker::EventChannel<bollmaker::FeedEvent> events;

        bollmaker::FeedConfig feed_config;
        feed_config.heartbeat_timeout = std::chrono::milliseconds(config.heartbeat_timeout_ms);
        feed_config.window_ms = config.window_ms;
        bollmaker::MarketDataFeed feed{transport, events, credentials, feed_config};

        bollmaker::PositionLedgerConfig ledger_config;
        ledger_config.data_dir = config.data_dir;
        ledger_config.retention = std::chrono::hours(24 * config.trade_retention_days);

        bollmaker::PositionCacheConfig cache_config;
        cache_config.refresh_interval = std::chrono::milliseconds(config.position_refresh_ms);
        cache_config.wait_timeout = std::chrono::milliseconds(config.position_wait_ms);
        bollmaker::PositionCache cache{
            config.symbol,
            std::make_unique<bollmaker::PositionLedger>(ledger_config),
            cache_config};

        bollmaker::IndicatorEngine indicators{
            config.long_band.period, config.long_band.std_dev,
            config.short_band.period, config.short_band.std_dev};
        bollmaker::OrderBook book{config.symbol};
        bollmaker::OrderingEngine ordering{config, gateway, indicators, cache};

        bollmaker::Scheduler scheduler{config, gateway, feed, events, indicators, cache, ordering, book};
        scheduler.start();
        scheduler.run(stop_requested);

        std::cout << "[Scheduler] Shutdown requested" << std::endl;
        scheduler.shutdown();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
