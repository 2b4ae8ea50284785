#pragma once

#include <string_view>

#include "gemstream/protocol/gemini/schema/market_message.hpp"
#include "gemstream/protocol/gemini/parser/result.hpp"
#include "gemstream/protocol/gemini/parser/market_message.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace gemstream::protocol::gemini {

/*
===============================================================================
 gemini::Decoder
===============================================================================

Turns one raw market data frame into a schema::MarketMessage.

Decoding happens in two explicit phases:
  1) simdjson parses the buffer into a generic DOM
  2) parser::market_message projects the DOM field by field into the schema,
     applying the default-or-fail rule of each field

The DOM parser is reused between calls to keep its buffers warm. It holds no
state that influences the result: the same bytes always decode to the same
message.

Callers must not pass empty buffers (the stream client drops empty frames).
===============================================================================
*/
class Decoder {
public:
    Decoder() = default;

    // Non-copyable (owns the simdjson parser buffers)
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    [[nodiscard]]
    inline parser::Result decode(std::string_view raw, schema::MarketMessage& out) noexcept {
        simdjson::dom::element root;
        auto r = parse_document(raw, root);
        if (r != parser::Result::Parsed) {
            out.reset();
            return r;
        }
        return decode(root, out);
    }

    // Second phase only, for callers that already hold the parsed document
    [[nodiscard]]
    inline parser::Result decode(const simdjson::dom::element& root, schema::MarketMessage& out) noexcept {
        return parser::market_message::parse(root, out);
    }

    // First phase only. The element stays valid until the next parse.
    [[nodiscard]]
    inline parser::Result parse_document(std::string_view raw, simdjson::dom::element& root) noexcept {
        auto error = parser_.parse(raw.data(), raw.size()).get(root);
        if (error) {
            GS_DEBUG("[DECODER] JSON parse error: " << simdjson::error_message(error));
            return parser::Result::InvalidJson;
        }
        return parser::Result::Parsed;
    }

private:
    simdjson::dom::parser parser_;
};

} // namespace gemstream::protocol::gemini
