#pragma once

#include <cstdint>
#include <ostream>


namespace gemstream::protocol::gemini::schema {

/*
===============================================================================
Heartbeat
===============================================================================

Sent by the exchange every few seconds while no market data is flowing:

  { "type": "heartbeat", "socket_sequence": 42 }

Heartbeats share the socket sequence counter with update messages.
===============================================================================
*/
struct Heartbeat {
    std::uint32_t socket_sequence{0};

    inline void dump(std::ostream& os) const {
        os << "[HEARTBEAT] {socket_sequence=" << socket_sequence << "}";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Heartbeat& h) {
    h.dump(os);
    return os;
}

} // namespace gemstream::protocol::gemini::schema
