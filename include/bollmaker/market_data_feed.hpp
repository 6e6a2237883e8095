#pragma once

#include "backpack/client_base.hpp"
#include "backpack/retry_policy.hpp"
#include "backpack/ws_client.hpp"
#include "bollmaker/event_channel.hpp"
#include "bollmaker/market_events.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace bollmaker {

struct FeedConfig {
    std::chrono::milliseconds heartbeat_timeout{30000};
    backpack::RetryPolicy reconnect_policy{-1, std::chrono::milliseconds(1000), 2.0,
                                           std::chrono::milliseconds(30000), 0.2};
    long window_ms = 5000;
};

// One streaming session to the venue.
//
//   Disconnected -> Connecting -> Authenticating -> Subscribed -> Live
//
// Any close or error drops back to Disconnected and schedules a reconnect.
// Reconnects and heartbeat checks happen in supervise(), never inside a
// transport callback. Every state change and market event is pushed to the
// event channel.
class MarketDataFeed {
public:
    using Clock = std::chrono::steady_clock;

    MarketDataFeed(backpack::WsTransport& transport,
                   EventChannel<FeedEvent>& events,
                   backpack::Credentials credentials,
                   FeedConfig config = {});
    ~MarketDataFeed();

    MarketDataFeed(const MarketDataFeed&) = delete;
    MarketDataFeed& operator=(const MarketDataFeed&) = delete;

    // Opens the first connection. False if the transport refused to start;
    // a reconnect is then already scheduled.
    bool start();
    void stop();

    // Adds the channel to the replay set and sends it when the session is up.
    // Returns false if the channel was already held.
    bool subscribe(const std::string& channel);
    bool unsubscribe(const std::string& channel);

    // Supervisory tick: forces a reconnect when the heartbeat is stale while
    // Live, expires hung connection attempts, and runs any due reconnect.
    // Safe to call from several threads; ticks are serialized.
    void supervise(Clock::time_point now);

    bool wait_until_live(std::chrono::milliseconds timeout);

    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_live() const noexcept { return state_.load() == ConnectionState::Live; }
    [[nodiscard]] Clock::time_point last_heartbeat() const noexcept;
    [[nodiscard]] std::size_t dropped_messages() const noexcept { return dropped_messages_.load(); }
    [[nodiscard]] std::size_t reconnect_count() const noexcept { return reconnect_count_.load(); }
    [[nodiscard]] std::vector<std::string> subscriptions() const;

    // Builds the SUBSCRIBE frame; private channels carry a signature.
    [[nodiscard]] std::optional<std::string> subscribe_message(const std::string& channel,
                                                               std::int64_t timestamp_ms) const;

    static bool is_private_channel(const std::string& channel);

private:
    void on_transport_state(backpack::WsConnectionState state);
    void on_message(const std::string& message);
    void on_error(const std::string& error);

    void begin_session();
    bool send_subscribe(const std::string& channel);
    void schedule_reconnect(Clock::time_point now, const std::string& reason);
    void connect_now(Clock::time_point now);
    bool set_state(ConnectionState next);
    void touch_heartbeat(Clock::time_point now);
    void drop(const std::string& reason);

    void handle_stream(const std::string& stream, const nlohmann::json& data);

    backpack::WsTransport& transport_;
    EventChannel<FeedEvent>& events_;
    backpack::Credentials credentials_;
    FeedConfig config_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> running_{false};
    std::atomic<Clock::rep> last_heartbeat_{0};
    std::atomic<std::size_t> dropped_messages_{0};
    std::atomic<std::size_t> reconnect_count_{0};

    mutable std::mutex subscriptions_mutex_;
    std::set<std::string> subscriptions_;

    std::mutex supervise_mutex_;
    std::mutex reconnect_mutex_;
    std::optional<Clock::time_point> reconnect_at_;
    std::optional<Clock::time_point> connect_started_at_;
    int reconnect_attempt_ = 0;
    std::mt19937_64 rng_{std::random_device{}()};

    std::mutex state_mutex_;
    std::condition_variable state_changed_;
};

} // namespace bollmaker
