#pragma once

#include <cstdint>
#include <string_view>


namespace gemstream::protocol::gemini {

// ===============================================
// MESSAGE KIND ENUM (events[].type)
// ===============================================
enum class MessageKind : uint8_t {
    Trade,
    Change,
    Unknown     // auction, block_trade, ... or anything added later
};

// Convert enum → string
[[nodiscard]] inline constexpr std::string_view to_string(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::Trade:  return "trade";
        case MessageKind::Change: return "change";
        default:                  return "unknown";
    }
}

// Convert string → enum
[[nodiscard]] inline constexpr MessageKind to_message_kind_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 5: // "trade"
            if (s[0] == 't' && s == "trade") return MessageKind::Trade;
            break;
        case 6: // "change"
            if (s[0] == 'c' && s == "change") return MessageKind::Change;
            break;
    }
    return MessageKind::Unknown;
}

} // namespace gemstream::protocol::gemini
