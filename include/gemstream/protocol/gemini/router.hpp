#pragma once

#include <string_view>

#include "gemstream/protocol/gemini/enums/payload_type.hpp"
#include "gemstream/protocol/gemini/schema/market_message.hpp"
#include "gemstream/protocol/gemini/schema/heartbeat.hpp"
#include "gemstream/protocol/gemini/parser/result.hpp"
#include "gemstream/protocol/gemini/parser/adapters.hpp"
#include "gemstream/protocol/gemini/parser/heartbeat.hpp"
#include "gemstream/protocol/gemini/decoder.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace gemstream::protocol::gemini {

/*
================================================================================
Gemini Market Data Parsing Architecture
================================================================================

1) Router (this class)
   Parses the raw frame once, through its Decoder, and routes on the
   envelope "type":
     • "heartbeat"        → parser::heartbeat
     • anything else      → Decoder (parser::market_message)
   A missing or unrecognized envelope type still goes through the Decoder,
   which decides on its own whether the frame is valid. Updates therefore
   decode exactly as Decoder::decode() would decode them.

2) Message parsers (parser::market_message, parser::heartbeat, parser::event)
   Validate required vs optional fields, log rejections, and populate the
   strongly typed schema structures.

3) Adapters (parser::adapter)
   Domain-aware field conversion: decimal strings, sides, event kinds.

4) Helpers (parser::helper)
   JSON structure and primitive extraction. Never log, never throw.

Outputs are kept inside the router and overwritten by the next route() call.
================================================================================
*/
class Router {
public:
    Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Parse and route one frame.
    //
    // On Result::Parsed, routed_type() tells which output is valid:
    //   PayloadType::Heartbeat → heartbeat()
    //   otherwise              → message()
    [[nodiscard]]
    inline parser::Result route(std::string_view raw) noexcept {
        routed_type_ = PayloadType::Unknown;

        simdjson::dom::element root;
        auto r = decoder_.parse_document(raw, root);
        if (r != parser::Result::Parsed) {
            message_.reset();
            return r;
        }

        PayloadType type;
        r = parser::adapter::parse_payload_type_optional(root, type);
        if (r != parser::Result::Parsed) {
            message_.reset();
            GS_DEBUG("[ROUTER] Root not an object -> reject message.");
            return r;
        }

        if (type == PayloadType::Heartbeat) {
            r = parser::heartbeat::parse(root, heartbeat_);
            if (r == parser::Result::Parsed) {
                routed_type_ = PayloadType::Heartbeat;
            }
            return r;
        }

        r = decoder_.decode(root, message_);
        if (r == parser::Result::Parsed) {
            routed_type_ = PayloadType::Update;
        }
        return r;
    }

    [[nodiscard]]
    inline PayloadType routed_type() const noexcept {
        return routed_type_;
    }

    [[nodiscard]]
    inline const schema::MarketMessage& message() const noexcept {
        return message_;
    }

    [[nodiscard]]
    inline const schema::Heartbeat& heartbeat() const noexcept {
        return heartbeat_;
    }

private:
    Decoder decoder_;
    PayloadType routed_type_{PayloadType::Unknown};
    schema::MarketMessage message_;
    schema::Heartbeat heartbeat_;
};

} // namespace gemstream::protocol::gemini
