#pragma once

#include <cstdint>
#include <string_view>


namespace gemstream::protocol::gemini::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ignored           = 0,     // Not applicable here (routed elsewhere)
    InvalidJson       = 1,     // Buffer is not a JSON document
    InvalidSchema     = 2,     // Envelope field missing or mistyped (eventId, events, socket_sequence)
    InvalidEventField = 3,     // Mandatory per-event field missing or not a decimal (price, amount)
    Parsed            = 4      // Parsed successfully
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:           return "Ignored";
        case Result::InvalidJson:       return "InvalidJson";
        case Result::InvalidSchema:     return "InvalidSchema";
        case Result::InvalidEventField: return "InvalidEventField";
        case Result::Parsed:            return "Parsed";
        default:                        return "unknown";
    }
}

// -----------------------------------------------------------------------------
// Error classes
//
//   MalformedMessage    → InvalidJson | InvalidSchema
//   MalformedEventField → InvalidEventField
//
// Both reject the whole message. None of its events are delivered.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr bool is_malformed_message(Result r) noexcept {
    return r == Result::InvalidJson || r == Result::InvalidSchema;
}

[[nodiscard]]
inline constexpr bool is_malformed_event_field(Result r) noexcept {
    return r == Result::InvalidEventField;
}

} // namespace gemstream::protocol::gemini::parser
