#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>


namespace gemstream::config {

// Gemini v1 market data endpoint (symbol is appended as a path segment)
inline constexpr std::string_view market_data_url = "wss://api.gemini.com/v1/marketdata";

// The exchange sends a heartbeat every few seconds on an idle connection.
// Both signals must be stale before the connection is considered dead.
inline constexpr auto heartbeat_timeout = std::chrono::seconds(15);
inline constexpr auto message_timeout   = std::chrono::seconds(15);

// Reconnect backoff: base * 2^attempt, capped
inline constexpr auto reconnect_backoff_base = std::chrono::milliseconds(100);
inline constexpr auto reconnect_backoff_max  = std::chrono::milliseconds(5000);

// Bytes of a rejected frame echoed into the log
inline constexpr std::size_t log_snippet_max = 256;

} // namespace gemstream::config
