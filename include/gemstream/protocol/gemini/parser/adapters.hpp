#pragma once

#include <cstdint>
#include <string_view>
#include <optional>

#include "gemstream/protocol/gemini/enums.hpp"
#include "gemstream/protocol/gemini/parser/result.hpp"
#include "gemstream/protocol/gemini/parser/helpers.hpp"

#include "simdjson.h"

/*
================================================================================
Gemini Parsing Adapters (Domain-Level Converters)
================================================================================

Adapters convert validated JSON primitives into domain values (decimals,
MarketSide, MessageKind) and decide, field by field, whether a problem is a
default or a failure.

Separation of concerns:
  - helper::*   → JSON mechanics and type extraction
  - adapter::*  → Domain semantics and default-or-fail decisions
  - parser::*   → Message orchestration, logging, and control flow

Unlike the exchange-side enum fields of other feeds, unknown side and
event-type strings are NOT rejected here: they map to the Unknown sentinels.
================================================================================
*/


namespace gemstream::protocol::gemini::parser::adapter {

// ------------------------------------------------------------
// Decimal carried as string (required)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_decimal_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    std::string_view sv;
    if (helper::parse_string_required(obj, key, sv) != Result::Parsed) {
        return Result::InvalidEventField;
    }
    if (!helper::parse_decimal(sv, out)) {
        return Result::InvalidEventField;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// Decimal carried as string (optional)
//
// Absent or non-string → nullopt.
// Present string that is not a decimal → failure; never defaulted.
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_decimal_optional(const simdjson::dom::element& obj, const char* key, std::optional<double>& out) noexcept {
    // Always reset output (streaming safety)
    out.reset();
    bool presence = false;
    std::string_view sv;
    if (helper::parse_string_optional(obj, key, sv, presence) != Result::Parsed) {
        return Result::InvalidEventField;
    }
    if (!presence) {
        return Result::Parsed;
    }
    double value{};
    if (!helper::parse_decimal(sv, value)) {
        return Result::InvalidEventField;
    }
    out = value;
    return Result::Parsed;
}

// ------------------------------------------------------------
// MarketSide (optional, defaults to Unknown)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_side_optional(const simdjson::dom::element& obj, const char* key, MarketSide& out) noexcept {
    out = MarketSide::Unknown;
    bool presence = false;
    std::string_view sv;
    if (helper::parse_string_optional(obj, key, sv, presence) != Result::Parsed) {
        return Result::InvalidEventField;
    }
    if (presence) {
        out = to_market_side_enum(sv);
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// MessageKind (events[].type, required)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_message_kind_required(const simdjson::dom::element& obj, MessageKind& out) noexcept {
    std::string_view sv;
    if (helper::parse_string_required(obj, "type", sv) != Result::Parsed) {
        return Result::InvalidEventField;
    }
    out = to_message_kind_enum(sv);
    return Result::Parsed;
}

// ------------------------------------------------------------
// PayloadType (envelope "type", optional)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_payload_type_optional(const simdjson::dom::element& root, PayloadType& out) noexcept {
    out = PayloadType::Unknown;
    bool presence = false;
    std::string_view sv;
    auto r = helper::parse_string_optional(root, "type", sv, presence);
    if (r != Result::Parsed) {
        return r;
    }
    if (presence) {
        out = to_payload_type_enum(sv);
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// Socket sequence (u32 carried as JSON integer, required)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_socket_sequence_required(const simdjson::dom::element& root, std::uint32_t& out) noexcept {
    std::uint64_t raw{};
    auto r = helper::parse_uint64_required(root, "socket_sequence", raw);
    if (r != Result::Parsed) {
        return r;
    }
    if (raw > UINT32_MAX) {
        return Result::InvalidSchema;
    }
    out = static_cast<std::uint32_t>(raw);
    return Result::Parsed;
}

} // namespace gemstream::protocol::gemini::parser::adapter
