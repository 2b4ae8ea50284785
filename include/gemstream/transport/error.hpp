#pragma once

#include <string_view>

namespace gemstream {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification, abstracted away from library-specific
error codes (Boost.Asio / Beast / OpenSSL).

Higher layers (stream::Client) use it for diagnostics. Recovery is decided
there, never inside the transport.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection gracefully (CLOSE frame)

    // --- Transient / recoverable failures -----------------------------------
    ConnectionFailed, // DNS resolution or TCP connect failed
    HandshakeFailed,  // TLS or WebSocket handshake failed

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Read/write failure on an established connection
};


/// Helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace gemstream
