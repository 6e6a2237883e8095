#include "bollmaker/market_events.hpp"

namespace bollmaker {

const char* to_string(Side side) noexcept {
    return side == Side::Buy ? "buy" : "sell";
}

const char* venue_side(Side side) noexcept {
    return side == Side::Buy ? "Bid" : "Ask";
}

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected:
            return "Disconnected";
        case ConnectionState::Connecting:
            return "Connecting";
        case ConnectionState::Authenticating:
            return "Authenticating";
        case ConnectionState::Subscribed:
            return "Subscribed";
        case ConnectionState::Live:
            return "Live";
    }
    return "Unknown";
}

} // namespace bollmaker
