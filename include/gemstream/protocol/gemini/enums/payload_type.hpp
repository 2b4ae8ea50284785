#pragma once

#include <cstdint>
#include <string_view>


namespace gemstream::protocol::gemini {

// ===============================================
// PAYLOAD TYPE ENUM (envelope "type")
// ===============================================
enum class PayloadType : uint8_t {
    Update,
    Heartbeat,
    Unknown
};

// Convert enum → string
[[nodiscard]] inline constexpr std::string_view to_string(PayloadType t) noexcept {
    switch (t) {
        case PayloadType::Update:    return "update";
        case PayloadType::Heartbeat: return "heartbeat";
        default:                     return "unknown";
    }
}

// Convert string → enum
[[nodiscard]] inline constexpr PayloadType to_payload_type_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 6: // "update"
            if (s[0] == 'u' && s == "update") return PayloadType::Update;
            break;
        case 9: // "heartbeat"
            if (s[0] == 'h' && s == "heartbeat") return PayloadType::Heartbeat;
            break;
    }
    return PayloadType::Unknown;
}

} // namespace gemstream::protocol::gemini
