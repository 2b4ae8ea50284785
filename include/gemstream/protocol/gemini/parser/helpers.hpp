#pragma once

#include <cstdint>
#include <string_view>
#include <optional>
#include <charconv>
#include <system_error>

#include "gemstream/protocol/gemini/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
Gemini JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the Gemini market data parsers to extract primitive
values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (integer, string, decimal-in-string)
  • Provide explicit required / optional / nullable field semantics

Rules:
  • Helpers never interpret values semantically
  • Helpers never log
  • Helpers never throw
  • Outputs are only meaningful when Result::Parsed is returned

Higher layers decide how a helper failure is classified (a missing `price`
is an event-field error, a missing `eventId` is a schema error).
================================================================================
*/


namespace gemstream::protocol::gemini::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    // Parent must be an object
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    // Extract array
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    // Extract value (negative, fractional or non-numeric values are rejected)
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    // Extract string
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
//
// A field counts as present only when it holds the expected JSON type.
// Absent, null and mistyped fields all report presence = false.
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& presence) noexcept {
    // Default outputs
    presence = false;
    out = std::string_view{};
    // Parent must be an object
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    // Extract string
    if (field.get(out)) {
        out = std::string_view{};
        return Result::Parsed; // wrong type, treated as not present
    }
    presence = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_nullable(const simdjson::dom::element& obj, const char* key, std::optional<std::uint64_t>& out) noexcept {
    // Always reset output (streaming safety)
    out.reset();
    // Parent must be an object
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    // Extract value (null or mistyped → absent)
    std::uint64_t tmp{};
    if (field.get(tmp)) {
        return Result::Parsed;
    }
    out = tmp;
    return Result::Parsed;
}

// ============================================================================
// DECIMAL STRINGS
// ============================================================================

// Parses a decimal carried as a JSON string ("3641.00"). The whole string must
// be consumed; empty strings and trailing garbage are rejected.
[[nodiscard]]
inline bool parse_decimal(std::string_view sv, double& out) noexcept {
    if (sv.empty()) {
        return false;
    }
    const char* first = sv.data();
    const char* last  = sv.data() + sv.size();
    // from_chars does not accept a leading '+'
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') {
            return false;
        }
    }
    double tmp{};
    auto [ptr, ec] = std::from_chars(first, last, tmp);
    if (ec != std::errc{} || ptr != last) {
        return false;
    }
    out = tmp;
    return true;
}

} // namespace gemstream::protocol::gemini::parser::helper
