#include "bollmaker/market_data_feed.hpp"

#include "backpack/util.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace bollmaker {

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

double to_number(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return std::stod(value.get_ref<const std::string&>());
    }
    throw std::invalid_argument("expected numeric field, got " + value.dump());
}

std::vector<PriceLevel> parse_levels(const nlohmann::json& data, const char* key) {
    std::vector<PriceLevel> levels;
    const auto it = data.find(key);
    if (it == data.end()) {
        return levels;
    }
    if (!it->is_array()) {
        throw std::invalid_argument(std::string("depth field '") + key + "' is not an array");
    }
    levels.reserve(it->size());
    for (const auto& level : *it) {
        if (!level.is_array() || level.size() < 2) {
            throw std::invalid_argument("malformed depth level " + level.dump());
        }
        levels.emplace_back(to_number(level.at(0)), to_number(level.at(1)));
    }
    return levels;
}

std::string suffix_symbol(const std::string& stream) {
    const auto dot = stream.rfind('.');
    return dot == std::string::npos ? std::string() : stream.substr(dot + 1);
}

} // namespace

MarketDataFeed::MarketDataFeed(backpack::WsTransport& transport,
                               EventChannel<FeedEvent>& events,
                               backpack::Credentials credentials,
                               FeedConfig config)
    : transport_(transport),
      events_(events),
      credentials_(std::move(credentials)),
      config_(std::move(config)) {
    transport_.set_state_callback([this](backpack::WsConnectionState state) {
        on_transport_state(state);
    });
    transport_.set_message_callback([this](const std::string& message) {
        on_message(message);
    });
    transport_.set_error_callback([this](const std::string& error) {
        on_error(error);
    });
    transport_.set_pong_callback([this]() {
        touch_heartbeat(Clock::now());
    });
}

MarketDataFeed::~MarketDataFeed() {
    stop();
    transport_.set_state_callback(nullptr);
    transport_.set_message_callback(nullptr);
    transport_.set_error_callback(nullptr);
    transport_.set_pong_callback(nullptr);
}

bool MarketDataFeed::start() {
    running_ = true;
    connect_now(Clock::now());
    return state_.load() != ConnectionState::Disconnected;
}

void MarketDataFeed::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnect_at_.reset();
        connect_started_at_.reset();
    }
    transport_.disconnect();
    set_state(ConnectionState::Disconnected);
    state_changed_.notify_all();
    std::cout << "[Feed] Stopped" << std::endl;
}

bool MarketDataFeed::subscribe(const std::string& channel) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        if (!subscriptions_.insert(channel).second) {
            return false;
        }
    }
    // Otherwise replayed by the next session.
    if (is_live()) {
        send_subscribe(channel);
    }
    return true;
}

bool MarketDataFeed::unsubscribe(const std::string& channel) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        if (subscriptions_.erase(channel) == 0) {
            return false;
        }
    }
    if (is_live()) {
        nlohmann::json message = {
            {"method", "UNSUBSCRIBE"},
            {"params", nlohmann::json::array({channel})}
        };
        if (!transport_.send(message.dump())) {
            std::cerr << "[Feed] Failed to send UNSUBSCRIBE for " << channel << std::endl;
        }
    }
    return true;
}

std::vector<std::string> MarketDataFeed::subscriptions() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return {subscriptions_.begin(), subscriptions_.end()};
}

bool MarketDataFeed::is_private_channel(const std::string& channel) {
    return starts_with(channel, "account.");
}

std::optional<std::string> MarketDataFeed::subscribe_message(const std::string& channel,
                                                             std::int64_t timestamp_ms) const {
    nlohmann::json message = {
        {"method", "SUBSCRIBE"},
        {"params", nlohmann::json::array({channel})}
    };

    if (is_private_channel(channel)) {
        if (credentials_.empty()) {
            return std::nullopt;
        }
        const auto payload = backpack::build_signing_payload("subscribe", {}, timestamp_ms, config_.window_ms);
        message["signature"] = nlohmann::json::array({
            credentials_.api_key,
            backpack::hmac_sha256_hex(credentials_.api_secret, payload),
            std::to_string(timestamp_ms),
            std::to_string(config_.window_ms)
        });
    }
    return message.dump();
}

bool MarketDataFeed::send_subscribe(const std::string& channel) {
    const auto message = subscribe_message(channel, backpack::current_timestamp_ms());
    if (!message) {
        std::cerr << "[Feed] Skipping private channel " << channel << ": no API credentials" << std::endl;
        return true;
    }
    if (!transport_.send(*message)) {
        std::cerr << "[Feed] Failed to send SUBSCRIBE for " << channel << std::endl;
        return false;
    }
    return true;
}

void MarketDataFeed::on_transport_state(backpack::WsConnectionState state) {
    if (state == backpack::WsConnectionState::Connected) {
        if (running_) {
            begin_session();
        }
        return;
    }

    if (state == backpack::WsConnectionState::Disconnected) {
        if (set_state(ConnectionState::Disconnected)) {
            schedule_reconnect(Clock::now(), "connection closed");
        }
    }
}

void MarketDataFeed::begin_session() {
    set_state(ConnectionState::Authenticating);

    for (const auto& channel : subscriptions()) {
        if (!send_subscribe(channel)) {
            if (set_state(ConnectionState::Disconnected)) {
                schedule_reconnect(Clock::now(), "subscription replay failed");
            }
            return;
        }
    }
    set_state(ConnectionState::Subscribed);

    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnect_attempt_ = 0;
        connect_started_at_.reset();
    }
    touch_heartbeat(Clock::now());
    set_state(ConnectionState::Live);
}

void MarketDataFeed::on_error(const std::string& error) {
    std::cerr << "[Feed] Transport error: " << error << std::endl;
}

void MarketDataFeed::on_message(const std::string& message) {
    touch_heartbeat(Clock::now());

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(message);
    } catch (const nlohmann::json::exception& ex) {
        drop(std::string("unparseable message: ") + ex.what());
        return;
    }

    if (!doc.is_object()) {
        drop("message is not a JSON object");
        return;
    }

    if (doc.contains("error")) {
        std::cerr << "[Feed] Venue error: " << doc.at("error").dump() << std::endl;
        return;
    }

    const auto stream = doc.find("stream");
    const auto data = doc.find("data");
    if (stream == doc.end() || data == doc.end()) {
        return;
    }
    if (!stream->is_string() || !data->is_object()) {
        drop("envelope has wrong field types");
        return;
    }

    try {
        handle_stream(stream->get<std::string>(), *data);
    } catch (const std::exception& ex) {
        drop(stream->get<std::string>() + ": " + ex.what());
    }
}

void MarketDataFeed::handle_stream(const std::string& stream, const nlohmann::json& data) {
    if (starts_with(stream, "bookTicker.")) {
        BookTickerEvent event;
        event.symbol = data.value("s", suffix_symbol(stream));
        event.best_bid = to_number(data.at("b"));
        event.best_ask = to_number(data.at("a"));
        events_.push(std::move(event));
        return;
    }

    if (starts_with(stream, "depth.")) {
        DepthEvent event;
        event.symbol = data.value("s", suffix_symbol(stream));
        event.bids = parse_levels(data, "b");
        event.asks = parse_levels(data, "a");
        event.first_update_id = data.value("U", 0LL);
        event.last_update_id = data.value("u", 0LL);
        events_.push(std::move(event));
        return;
    }

    const std::string order_stream = "account.orderUpdate";
    if (starts_with(stream, order_stream)) {
        if (data.value("e", "") != "orderFill") {
            return;
        }
        FillEvent event;
        const auto fallback = stream.size() > order_stream.size() + 1
                              ? stream.substr(order_stream.size() + 1)
                              : std::string();
        event.symbol = data.value("s", fallback);
        event.order_id = data.value("i", "");
        const auto side = data.at("S").get<std::string>();
        if (side == "Bid") {
            event.side = Side::Buy;
        } else if (side == "Ask") {
            event.side = Side::Sell;
        } else {
            throw std::invalid_argument("unknown fill side " + side);
        }
        event.quantity = to_number(data.at("l"));
        event.price = data.contains("L") ? to_number(data.at("L")) : to_number(data.at("p"));
        if (event.quantity <= 0.0 || event.price <= 0.0) {
            throw std::invalid_argument("fill without quantity or price");
        }
        // Event time is in microseconds.
        if (data.contains("E") && data.at("E").is_number_integer()) {
            event.timestamp = std::chrono::system_clock::time_point{
                std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::microseconds(data.at("E").get<long long>()))};
        } else {
            event.timestamp = std::chrono::system_clock::now();
        }
        events_.push(std::move(event));
    }
}

void MarketDataFeed::supervise(Clock::time_point now) {
    // Callers on several threads must not drive the transport concurrently.
    std::lock_guard<std::mutex> supervise_lock(supervise_mutex_);
    if (!running_) {
        return;
    }

    const auto current = state_.load();
    if (current == ConnectionState::Live) {
        if (now - last_heartbeat() > config_.heartbeat_timeout) {
            std::cerr << "[Feed] Heartbeat stale for "
                      << std::chrono::duration_cast<std::chrono::seconds>(now - last_heartbeat()).count()
                      << "s; forcing reconnect" << std::endl;
            if (set_state(ConnectionState::Disconnected)) {
                transport_.disconnect();
                ++reconnect_count_;
                connect_now(now);
            }
        }
        return;
    }

    if (current == ConnectionState::Connecting ||
        current == ConnectionState::Authenticating ||
        current == ConnectionState::Subscribed) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex_);
            expired = connect_started_at_ && now - *connect_started_at_ > config_.heartbeat_timeout;
        }
        if (expired && set_state(ConnectionState::Disconnected)) {
            transport_.disconnect();
            schedule_reconnect(now, "connection attempt timed out");
        }
        return;
    }

    bool due = false;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        due = reconnect_at_ && now >= *reconnect_at_;
        if (due) {
            reconnect_at_.reset();
        }
    }
    if (due) {
        ++reconnect_count_;
        connect_now(now);
    }
}

void MarketDataFeed::connect_now(Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnect_at_.reset();
        connect_started_at_ = now;
    }

    set_state(ConnectionState::Connecting);
    transport_.disconnect();
    if (!transport_.connect()) {
        std::cerr << "[Feed] Transport refused to connect" << std::endl;
        if (state_.load() == ConnectionState::Connecting && set_state(ConnectionState::Disconnected)) {
            schedule_reconnect(now, "connect failed");
        }
    }
}

void MarketDataFeed::schedule_reconnect(Clock::time_point now, const std::string& reason) {
    if (!running_) {
        return;
    }

    std::lock_guard<std::mutex> lock(reconnect_mutex_);
    connect_started_at_.reset();
    if (!config_.reconnect_policy.allows_retry(reconnect_attempt_)) {
        std::cerr << "[Feed] " << reason << "; reconnect attempts exhausted" << std::endl;
        reconnect_at_.reset();
        return;
    }
    const auto delay = config_.reconnect_policy.delay_for(reconnect_attempt_++, rng_);
    reconnect_at_ = now + delay;
    std::cerr << "[Feed] " << reason << "; reconnecting in " << delay.count()
              << " ms (attempt " << reconnect_attempt_ << ")" << std::endl;
}

bool MarketDataFeed::set_state(ConnectionState next) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_.exchange(next);
    }
    if (previous == next) {
        return false;
    }
    state_changed_.notify_all();
    std::cout << "[Feed] " << to_string(previous) << " -> " << to_string(next) << std::endl;
    events_.push(StateEvent{next});
    return true;
}

bool MarketDataFeed::wait_until_live(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_changed_.wait_for(lock, timeout, [this] {
        return state_.load() == ConnectionState::Live || !running_;
    });
    return state_.load() == ConnectionState::Live;
}

void MarketDataFeed::touch_heartbeat(Clock::time_point now) {
    last_heartbeat_ = now.time_since_epoch().count();
}

MarketDataFeed::Clock::time_point MarketDataFeed::last_heartbeat() const noexcept {
    return Clock::time_point{Clock::duration{last_heartbeat_.load()}};
}

void MarketDataFeed::drop(const std::string& reason) {
    const auto count = ++dropped_messages_;
    std::cerr << "[Feed] Dropped message (" << count << " total): " << reason << std::endl;
}

} // namespace bollmaker
