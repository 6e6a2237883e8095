#pragma once

#include "backpack/ws_client.hpp"
#include "bollmaker/exchange_gateway.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace test_support {

class TempDir {
public:
    explicit TempDir(const std::string& prefix = "bollmaker_test") {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(rd()) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// In-process transport. connect() reports Connected synchronously unless
// auto_connect is off, in which case the test drives fire_connected().
class FakeTransport : public backpack::WsTransport {
public:
    bool auto_connect = true;
    bool refuse_connect = false;
    bool fail_send = false;

    bool connect() override {
        ++connect_calls;
        if (refuse_connect) {
            return false;
        }
        if (auto_connect) {
            fire_connected();
        }
        return true;
    }

    void disconnect() override {
        ++disconnect_calls;
        connected_ = false;
    }

    bool send(const std::string& message) override {
        if (fail_send || !connected_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(message);
        return true;
    }

    bool is_connected() const noexcept override { return connected_; }

    void set_message_callback(backpack::WsMessageCallback callback) override { on_message_ = std::move(callback); }
    void set_error_callback(backpack::WsErrorCallback callback) override { on_error_ = std::move(callback); }
    void set_state_callback(backpack::WsStateCallback callback) override { on_state_ = std::move(callback); }
    void set_pong_callback(backpack::WsPongCallback callback) override { on_pong_ = std::move(callback); }

    void fire_connected() {
        connected_ = true;
        if (on_state_) {
            on_state_(backpack::WsConnectionState::Connected);
        }
    }

    void fire_closed() {
        connected_ = false;
        if (on_state_) {
            on_state_(backpack::WsConnectionState::Disconnected);
        }
    }

    void deliver(const std::string& message) {
        if (on_message_) {
            on_message_(message);
        }
    }

    void pong() {
        if (on_pong_) {
            on_pong_();
        }
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    void clear_sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    std::atomic<int> connect_calls{0};
    std::atomic<int> disconnect_calls{0};

private:
    std::atomic<bool> connected_{false};
    backpack::WsMessageCallback on_message_;
    backpack::WsErrorCallback on_error_;
    backpack::WsStateCallback on_state_;
    backpack::WsPongCallback on_pong_;
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
};

// Records every order and serves canned klines.
class FakeGateway : public bollmaker::ExchangeGateway {
public:
    std::string place_order(const bollmaker::OrderRequest& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reject_all) {
            throw std::runtime_error("order rejected");
        }
        placed.push_back(order);
        return "order-" + std::to_string(placed.size());
    }

    void cancel_all_orders(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cancel_all_calls;
    }

    std::vector<bollmaker::OpenOrder> open_orders(const std::string&) override {
        return {};
    }

    std::vector<bollmaker::Kline> klines(const std::string&, const std::string& interval, int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++kline_calls;
        if (fail_klines) {
            throw std::runtime_error("klines unavailable");
        }
        std::vector<bollmaker::Kline> bars;
        // Newest first, as a shuffled response would be.
        for (int i = limit - 1; i >= 0; --i) {
            bollmaker::Kline bar;
            bar.start_time = 1700000000LL + i * (interval == "1h" ? 3600 : 300);
            bar.close = kline_close;
            bars.push_back(bar);
        }
        return bars;
    }

    double ticker_price(const std::string&) override {
        return kline_close;
    }

    bollmaker::AccountBalances account_balances(const std::string&) override {
        return {1.0, 100.0};
    }

    std::vector<bollmaker::OrderRequest> orders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return placed;
    }

    int cancels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancel_all_calls;
    }

    bool reject_all = false;
    bool fail_klines = false;
    double kline_close = 100.0;
    int kline_calls = 0;

private:
    mutable std::mutex mutex_;
    std::vector<bollmaker::OrderRequest> placed;
    int cancel_all_calls = 0;
};

} // namespace test_support
