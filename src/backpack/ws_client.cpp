#include "backpack/ws_client.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace backpack {

struct WsClient::Impl {
    std::string url;
    ::lws_context* context = nullptr;
    ::lws* wsi = nullptr;
    std::thread worker_thread;
    std::atomic<bool> should_stop{false};
    std::atomic<bool> connected{false};
    std::atomic<WsConnectionState> state{WsConnectionState::Disconnected};

    WsMessageCallback message_callback;
    WsErrorCallback error_callback;
    WsStateCallback state_callback;
    WsPongCallback pong_callback;

    std::mutex callbacks_mutex;
    std::mutex send_mutex;
    std::queue<std::string> send_queue;
    std::atomic<bool> ping_pending{false};
    std::string message_buffer; // For fragmented text messages

    int heartbeat_interval_ms = 15000;
    std::chrono::steady_clock::time_point last_ping_time;

    void notify_state(WsConnectionState next) {
        state = next;
        std::lock_guard<std::mutex> lock(callbacks_mutex);
        if (state_callback) {
            state_callback(next);
        }
    }

    void notify_error(const std::string& error) {
        std::lock_guard<std::mutex> lock(callbacks_mutex);
        if (error_callback) {
            error_callback(error);
        }
    }
};

} // namespace backpack

namespace {

struct ParsedUrl {
    std::string host;
    std::string path = "/";
    int port = 443;
    bool ssl = true;
};

bool parse_ws_url(const std::string& url, ParsedUrl& out) {
    std::size_t start = 0;
    if (url.rfind("wss://", 0) == 0) {
        out.ssl = true;
        out.port = 443;
        start = 6;
    } else if (url.rfind("ws://", 0) == 0) {
        out.ssl = false;
        out.port = 80;
        start = 5;
    } else {
        return false;
    }

    const std::size_t slash = url.find('/', start);
    if (slash == std::string::npos) {
        out.host = url.substr(start);
    } else {
        out.host = url.substr(start, slash - start);
        out.path = url.substr(slash);
    }

    const std::size_t colon = out.host.find(':');
    if (colon != std::string::npos) {
        out.port = std::stoi(out.host.substr(colon + 1));
        out.host = out.host.substr(0, colon);
    }
    return !out.host.empty();
}

int callback_ws_client(struct lws* wsi, enum lws_callback_reasons reason,
                       void* /*user*/, void* in, size_t len) {
    auto* impl = static_cast<backpack::WsClient::Impl*>(lws_get_opaque_user_data(wsi));
    if (!impl) {
        impl = static_cast<backpack::WsClient::Impl*>(lws_context_user(lws_get_context(wsi)));
        if (impl) {
            lws_set_opaque_user_data(wsi, impl);
        }
        if (!impl) {
            return 0;
        }
    }

    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED: {
            impl->connected = true;
            impl->last_ping_time = std::chrono::steady_clock::now();
            impl->notify_state(backpack::WsConnectionState::Connected);
            break;
        }

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            impl->connected = false;
            impl->wsi = nullptr;
            const char* error_msg = in ? static_cast<const char*>(in) : "Connection error";
            impl->notify_error(in ? std::string(error_msg, len) : std::string(error_msg));
            impl->notify_state(backpack::WsConnectionState::Disconnected);
            break;
        }

        case LWS_CALLBACK_CLIENT_CLOSED:
        case LWS_CALLBACK_CLOSED: {
            if (impl->state == backpack::WsConnectionState::Disconnected) {
                break;
            }
            impl->connected = false;
            impl->wsi = nullptr;
            impl->notify_state(backpack::WsConnectionState::Disconnected);
            break;
        }

        case LWS_CALLBACK_CLIENT_RECEIVE: {
            if (in && len > 0 && !lws_frame_is_binary(wsi)) {
                impl->message_buffer.append(static_cast<const char*>(in), len);
                if (lws_is_final_fragment(wsi)) {
                    std::lock_guard<std::mutex> lock(impl->callbacks_mutex);
                    if (impl->message_callback) {
                        impl->message_callback(impl->message_buffer);
                    }
                    impl->message_buffer.clear();
                }
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_RECEIVE_PONG: {
            std::lock_guard<std::mutex> lock(impl->callbacks_mutex);
            if (impl->pong_callback) {
                impl->pong_callback();
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_WRITEABLE: {
            if (impl->ping_pending.exchange(false)) {
                unsigned char ping[LWS_PRE + 1];
                if (lws_write(wsi, ping + LWS_PRE, 0, LWS_WRITE_PING) < 0) {
                    impl->notify_error("Failed to send WebSocket ping");
                }
                lws_callback_on_writable(wsi);
                break;
            }

            std::string message;
            {
                std::lock_guard<std::mutex> lock(impl->send_mutex);
                if (impl->send_queue.empty()) {
                    break;
                }
                message = std::move(impl->send_queue.front());
                impl->send_queue.pop();
            }

            std::vector<unsigned char> buf(LWS_PRE + message.size());
            std::memcpy(buf.data() + LWS_PRE, message.data(), message.size());
            const int n = lws_write(wsi, buf.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
            if (n < 0) {
                impl->notify_error("Failed to send WebSocket message");
            } else {
                lws_callback_on_writable(wsi);
            }
            break;
        }

        default:
            break;
    }

    return 0;
}

const struct lws_protocols protocols[] = {
    {
        "ws-client",
        callback_ws_client,
        0,
        65536, // rx_buffer_size
    },
    {nullptr, nullptr, 0, 0}
};

} // anonymous namespace

namespace backpack {

WsClient::WsClient(const std::string& url)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->url = url;
}

WsClient::~WsClient() {
    stop_service();
}

bool WsClient::connect() {
    if (pimpl_->connected) {
        return true;
    }
    if (pimpl_->state == WsConnectionState::Connecting) {
        return false;
    }

    // A previous session may still own a context after a remote close.
    stop_service();

    ParsedUrl target;
    if (!parse_ws_url(pimpl_->url, target)) {
        pimpl_->notify_error("Invalid WebSocket URL: " + pimpl_->url);
        return false;
    }

    pimpl_->notify_state(WsConnectionState::Connecting);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = pimpl_.get();

    pimpl_->context = lws_create_context(&info);
    if (!pimpl_->context) {
        pimpl_->state = WsConnectionState::Disconnected;
        return false;
    }

    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = pimpl_->context;
    ccinfo.address = target.host.c_str();
    ccinfo.port = target.port;
    ccinfo.path = target.path.c_str();
    ccinfo.host = target.host.c_str();
    ccinfo.origin = target.host.c_str();
    ccinfo.protocol = protocols[0].name;
    ccinfo.ssl_connection = target.ssl ? LCCSCF_USE_SSL : 0;
    ccinfo.opaque_user_data = pimpl_.get();

    pimpl_->wsi = lws_client_connect_via_info(&ccinfo);
    if (!pimpl_->wsi) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
        pimpl_->state = WsConnectionState::Disconnected;
        return false;
    }

    pimpl_->should_stop = false;
    pimpl_->worker_thread = std::thread([impl = pimpl_.get()]() {
        while (!impl->should_stop) {
            lws_service(impl->context, 0);

            const auto now = std::chrono::steady_clock::now();
            if (impl->connected && impl->wsi &&
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - impl->last_ping_time).count() >= impl->heartbeat_interval_ms) {
                impl->ping_pending = true;
                lws_callback_on_writable(impl->wsi);
                impl->last_ping_time = now;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    return true;
}

void WsClient::stop_service() {
    pimpl_->should_stop = true;
    pimpl_->connected = false;
    pimpl_->state = WsConnectionState::Disconnected;
    if (pimpl_->context) {
        lws_cancel_service(pimpl_->context);
    }
    if (pimpl_->worker_thread.joinable()) {
        pimpl_->worker_thread.join();
    }
    if (pimpl_->context) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
    }
    pimpl_->wsi = nullptr;
    pimpl_->message_buffer.clear();
    pimpl_->ping_pending = false;

    std::lock_guard<std::mutex> lock(pimpl_->send_mutex);
    std::queue<std::string>().swap(pimpl_->send_queue);
}

void WsClient::disconnect() {
    stop_service();
}

bool WsClient::send(const std::string& message) {
    if (!pimpl_->connected || !pimpl_->wsi) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl_->send_mutex);
        pimpl_->send_queue.push(message);
    }

    lws_cancel_service(pimpl_->context);
    lws_callback_on_writable(pimpl_->wsi);
    return true;
}

bool WsClient::is_connected() const noexcept {
    return pimpl_->connected;
}

void WsClient::set_message_callback(WsMessageCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callbacks_mutex);
    pimpl_->message_callback = std::move(callback);
}

void WsClient::set_error_callback(WsErrorCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callbacks_mutex);
    pimpl_->error_callback = std::move(callback);
}

void WsClient::set_state_callback(WsStateCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callbacks_mutex);
    pimpl_->state_callback = std::move(callback);
}

void WsClient::set_pong_callback(WsPongCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callbacks_mutex);
    pimpl_->pong_callback = std::move(callback);
}

void WsClient::set_heartbeat_interval_ms(int interval_ms) {
    pimpl_->heartbeat_interval_ms = interval_ms;
}

WsConnectionState WsClient::state() const noexcept {
    return pimpl_->state;
}

} // namespace backpack
