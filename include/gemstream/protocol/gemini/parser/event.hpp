#pragma once

#include <string>
#include <string_view>

#include "gemstream/protocol/gemini/schema/event.hpp"
#include "gemstream/protocol/gemini/parser/result.hpp"
#include "gemstream/protocol/gemini/parser/helpers.hpp"
#include "gemstream/protocol/gemini/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace gemstream::protocol::gemini::parser {

// Parses one element of the `events` array.
//
// `type` and `price` are required on every element, whatever its type.
//
// Dispatch on `type`:
//   "change" → schema::Quote
//   "trade"  → schema::Trade
//   other    → schema::UnknownEvent (nothing beyond type and price is read)
struct event {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& elem, schema::Event& out) noexcept {
        // Element must be an object
        if (helper::require_object(elem) != Result::Parsed) {
            GS_DEBUG("[PARSER] Event element not an object -> reject message.");
            return Result::InvalidEventField;
        }

        // type (required)
        MessageKind kind;
        auto r = adapter::parse_message_kind_required(elem, kind);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'type' missing or not a string in event -> reject message.");
            return r;
        }

        // price (required)
        double price = 0.0;
        r = adapter::parse_decimal_required(elem, "price", price);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'price' missing or invalid in event -> reject message.");
            return r;
        }

        switch (kind) {
            case MessageKind::Change:
                return parse_quote_(elem, price, out);
            case MessageKind::Trade:
                return parse_trade_(elem, price, out);
            default:
                out = schema::UnknownEvent{};
                return Result::Parsed;
        }
    }

private:
    [[nodiscard]]
    static inline Result parse_quote_(const simdjson::dom::element& elem, double price, schema::Event& out) noexcept {
        schema::Quote quote{};
        quote.price = price;

        // reason (optional, defaults to "")
        bool presence = false;
        std::string_view reason;
        auto r = helper::parse_string_optional(elem, "reason", reason, presence);
        if (r != Result::Parsed) {
            return Result::InvalidEventField;
        }
        if (presence) {
            quote.reason.assign(reason);
        }

        // remaining (optional, defaults to 0.0)
        std::optional<double> remaining;
        r = adapter::parse_decimal_optional(elem, "remaining", remaining);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'remaining' is not a decimal in change event -> reject message.");
            return r;
        }
        quote.remaining = remaining.value_or(0.0);

        // side (optional, defaults to Unknown)
        r = adapter::parse_side_optional(elem, "side", quote.side);
        if (r != Result::Parsed) {
            return r;
        }

        // delta (optional, absent stays absent)
        r = adapter::parse_decimal_optional(elem, "delta", quote.delta);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'delta' is not a decimal in change event -> reject message.");
            return r;
        }

        out = std::move(quote);
        return Result::Parsed;
    }

    [[nodiscard]]
    static inline Result parse_trade_(const simdjson::dom::element& elem, double price, schema::Event& out) noexcept {
        schema::Trade trade{};
        trade.price = price;

        // amount (required)
        auto r = adapter::parse_decimal_required(elem, "amount", trade.amount);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'amount' missing or invalid in trade event -> reject message.");
            return r;
        }

        // makerSide (optional, defaults to Unknown)
        r = adapter::parse_side_optional(elem, "makerSide", trade.maker_side);
        if (r != Result::Parsed) {
            return r;
        }

        out = trade;
        return Result::Parsed;
    }
};

} // namespace gemstream::protocol::gemini::parser
