#pragma once

#include <string>
#include <concepts>
#include <functional>

#include "gemstream/transport/error.hpp"

namespace gemstream::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Minimal contract required by stream::Client.
//
// The WebSocket implementation:
//
//   • Connects to a single endpoint; no retries, no reconnection policy
//   • Delivers every received text/binary frame through the message callback
//   • Signals close exactly once per connection (local or remote)
//   • Reports failures on an established connection through the error callback
//   • Can be connected again after close()
//   • Receive-only: the market data feed takes no client messages
//
// -----------------------------------------------------------------------------

using MessageCallback = std::function<void(const std::string&)>;
using CloseCallback   = std::function<void()>;
using ErrorCallback   = std::function<void(Error)>;

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        MessageCallback on_message,
        CloseCallback on_close,
        ErrorCallback on_error
    )
{
    // Lifecycle
    { ws.connect(host, port, path) } -> std::same_as<bool>;
    { ws.close() } -> std::same_as<void>;

    // Signaling
    { ws.set_message_callback(on_message) } -> std::same_as<void>;
    { ws.set_close_callback(on_close) } -> std::same_as<void>;
    { ws.set_error_callback(on_error) } -> std::same_as<void>;
};

} // namespace gemstream::transport
