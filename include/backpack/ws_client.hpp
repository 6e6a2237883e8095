#pragma once

#include <functional>
#include <memory>
#include <string>

namespace backpack {

enum class WsConnectionState {
    Disconnected,
    Connecting,
    Connected
};

using WsMessageCallback = std::function<void(const std::string& message)>;
using WsErrorCallback = std::function<void(const std::string& error)>;
using WsStateCallback = std::function<void(WsConnectionState state)>;
using WsPongCallback = std::function<void()>;

// Text-frame websocket transport. Callbacks run on the transport's own thread
// and must not call connect()/disconnect() re-entrantly.
class WsTransport {
public:
    virtual ~WsTransport() = default;

    virtual bool connect() = 0;
    // Local close; does not fire the state callback.
    virtual void disconnect() = 0;
    virtual bool send(const std::string& message) = 0;
    virtual bool is_connected() const noexcept = 0;

    virtual void set_message_callback(WsMessageCallback callback) = 0;
    virtual void set_error_callback(WsErrorCallback callback) = 0;
    virtual void set_state_callback(WsStateCallback callback) = 0;
    virtual void set_pong_callback(WsPongCallback callback) = 0;
};

// libwebsockets client. Sends a ping frame every heartbeat interval.
class WsClient : public WsTransport {
public:
    explicit WsClient(const std::string& url);
    ~WsClient() override;

    WsClient(const WsClient&) = delete;
    WsClient& operator=(const WsClient&) = delete;
    WsClient(WsClient&&) noexcept = delete;
    WsClient& operator=(WsClient&&) noexcept = delete;

    bool connect() override;
    void disconnect() override;
    bool send(const std::string& message) override;
    bool is_connected() const noexcept override;

    void set_message_callback(WsMessageCallback callback) override;
    void set_error_callback(WsErrorCallback callback) override;
    void set_state_callback(WsStateCallback callback) override;
    void set_pong_callback(WsPongCallback callback) override;

    void set_heartbeat_interval_ms(int interval_ms);

    WsConnectionState state() const noexcept;

    // Public for callback access (implementation detail)
    struct Impl;

private:
    void stop_service();

    std::unique_ptr<Impl> pimpl_;
};

} // namespace backpack
