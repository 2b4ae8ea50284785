#pragma once

#include <cstdint>
#include <string_view>


namespace gemstream::protocol::gemini {

// ===============================================
// MARKET SIDE ENUM (change.side / trade.makerSide)
// ===============================================
enum class MarketSide : uint8_t {
    Bid,
    Ask,
    Unknown     // Not documented by the exchange, but must never fail a decode
};

// Convert enum → string
[[nodiscard]] inline constexpr std::string_view to_string(MarketSide s) noexcept {
    switch (s) {
        case MarketSide::Bid: return "bid";
        case MarketSide::Ask: return "ask";
        default:              return "unknown";
    }
}

// Convert string → enum (case-sensitive, exact match)
[[nodiscard]] inline constexpr MarketSide to_market_side_enum(std::string_view s) noexcept {
    if (s.size() == 3) {
        if (s[0] == 'a' && s == "ask") return MarketSide::Ask;
        if (s[0] == 'b' && s == "bid") return MarketSide::Bid;
    }
    return MarketSide::Unknown;
}

} // namespace gemstream::protocol::gemini
