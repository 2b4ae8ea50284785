#pragma once

#include <cstdint>
#include <vector>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

#include "gemstream/protocol/gemini/schema/event.hpp"


namespace gemstream::protocol::gemini::schema {

/*
===============================================================================
MarketMessage (Gemini v1 market data "update" envelope)
===============================================================================

Example payload:
{
  "type": "update",
  "eventId": 5375461993,
  "timestamp": 1547760288,
  "timestampms": 1547760288001,
  "socket_sequence": 15,
  "events": [
    { "type": "trade", "tid": 5375461993, "price": "3641.00",
      "amount": "0.0062", "makerSide": "bid" },
    { "type": "change", "side": "bid", "price": "3641.00",
      "remaining": "0.0", "delta": "-0.0062", "reason": "trade" }
  ]
}

`events` keeps wire order. Both timestamps may be absent at the same time.
===============================================================================
*/
struct MarketMessage {
    std::uint64_t                event_id{0};
    std::vector<Event>           events{};
    std::optional<std::uint64_t> timestamp{};       // seconds
    std::optional<std::uint64_t> timestampms{};     // milliseconds
    std::uint32_t                socket_sequence{0};

    inline void reset() noexcept {
        event_id = 0;
        events.clear();
        timestamp.reset();
        timestampms.reset();
        socket_sequence = 0;
    }

    // ---------------------------------------------------------
    // Dump
    // ---------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[MARKET MESSAGE] {"
           << "event_id=" << event_id
           << ", socket_sequence=" << socket_sequence;
        if (timestamp) {
            os << ", timestamp=" << *timestamp;
        }
        if (timestampms) {
            os << ", timestampms=" << *timestampms;
        }
        os << ", events=[";
        for (std::size_t i = 0; i < events.size(); ++i) {
            os << events[i];
            if (i + 1 < events.size()) {
                os << ", ";
            }
        }
        os << "]}";
    }

#ifndef NDEBUG
    // ---------------------------------------------------------
    // String helper (debug / logging)
    // NOTE: Allocates. Intended for debugging/logging only.
    // ---------------------------------------------------------
    [[nodiscard]]
    inline std::string str() const {
        std::ostringstream oss;
        dump(oss);
        return oss.str();
    }
#endif
};

// Stream operator<< delegates to dump()
inline std::ostream& operator<<(std::ostream& os, const MarketMessage& m) {
    m.dump(os);
    return os;
}

} // namespace gemstream::protocol::gemini::schema
