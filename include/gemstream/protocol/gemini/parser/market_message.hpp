#pragma once

#include "gemstream/protocol/gemini/schema/market_message.hpp"
#include "gemstream/protocol/gemini/parser/result.hpp"
#include "gemstream/protocol/gemini/parser/helpers.hpp"
#include "gemstream/protocol/gemini/parser/adapters.hpp"
#include "gemstream/protocol/gemini/parser/event.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace gemstream::protocol::gemini::parser {

struct market_message {

    // Parse a Gemini v1 market data update envelope.
    //
    // On any failure `out` is left reset: a rejected message never exposes a
    // partial event batch.
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::MarketMessage& out) noexcept {
        out.reset();
        auto r = parse_(root, out);
        if (r != Result::Parsed) {
            out.reset();
        }
        return r;
    }

private:
    [[nodiscard]]
    static inline Result parse_(const simdjson::dom::element& root, schema::MarketMessage& out) noexcept {
        // Root must be an object
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Root not an object in market message -> reject message.");
            return r;
        }

        // events (required array)
        simdjson::dom::array events;
        r = helper::parse_array_required(root, "events", events);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'events' missing or not an array in market message -> reject message.");
            return r;
        }

        // eventId (required)
        r = helper::parse_uint64_required(root, "eventId", out.event_id);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'eventId' missing or invalid in market message -> reject message.");
            return r;
        }

        // socket_sequence (required)
        r = adapter::parse_socket_sequence_required(root, out.socket_sequence);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'socket_sequence' missing or invalid in market message -> reject message.");
            return r;
        }

        // timestamp / timestampms (optional, independently nullable)
        r = helper::parse_uint64_nullable(root, "timestamp", out.timestamp);
        if (r != Result::Parsed) {
            return r;
        }
        r = helper::parse_uint64_nullable(root, "timestampms", out.timestampms);
        if (r != Result::Parsed) {
            return r;
        }

        // ------------------------------------------------------------
        // Parse event objects (wire order preserved)
        // ------------------------------------------------------------
        out.events.reserve(events.size());
        std::size_t index = 0;
        for (simdjson::dom::element elem : events) {
            schema::Event ev{schema::UnknownEvent{}};
            r = event::parse(elem, ev);
            if (r != Result::Parsed) {
                GS_DEBUG("[PARSER] Event #" << index << " rejected (" << to_string(r) << ") in market message " << out.event_id << ".");
                return r;
            }
            out.events.emplace_back(std::move(ev));
            ++index;
        }

        return Result::Parsed;
    }
};

} // namespace gemstream::protocol::gemini::parser
