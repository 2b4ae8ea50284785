#pragma once

#include "gemstream/protocol/gemini/schema/heartbeat.hpp"
#include "gemstream/protocol/gemini/parser/result.hpp"
#include "gemstream/protocol/gemini/parser/helpers.hpp"
#include "gemstream/protocol/gemini/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace gemstream::protocol::gemini::parser {

struct heartbeat {

    // Expected shape:
    // { "type": "heartbeat", "socket_sequence": 42 }
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Heartbeat& out) noexcept {
        out = schema::Heartbeat{};

        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Root not an object in heartbeat -> ignore message.");
            return r;
        }

        r = adapter::parse_socket_sequence_required(root, out.socket_sequence);
        if (r != Result::Parsed) {
            GS_DEBUG("[PARSER] Field 'socket_sequence' missing or invalid in heartbeat -> ignore message.");
            return r;
        }

        return Result::Parsed;
    }
};

} // namespace gemstream::protocol::gemini::parser
