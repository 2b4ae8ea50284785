#pragma once

#include <cstdint>
#include <string_view>


namespace gemstream::stream {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    WaitingReconnect
};

// ------------------------------------------------------------
// enum → string
// ------------------------------------------------------------
[[nodiscard]] inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:     return "disconnected";
        case State::Connecting:       return "connecting";
        case State::Connected:        return "connected";
        case State::Disconnecting:    return "disconnecting";
        case State::WaitingReconnect: return "waiting_reconnect";
        default:                      return "unknown";
    }
}

} // namespace gemstream::stream
