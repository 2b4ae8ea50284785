#pragma once

#include <string>
#include <optional>
#include <ostream>
#include <sstream>

#include "gemstream/protocol/gemini/enums/side.hpp"


namespace gemstream::protocol::gemini::schema {

/*
===============================================================================
Quote (events[] element with type = "change")
===============================================================================

Example element:
{
  "type": "change",
  "side": "bid",
  "price": "50000.00",
  "remaining": "1.5",
  "delta": "0.25",
  "reason": "place"
}

Only `price` is required. `reason`, `remaining`, `side` and `delta` each fall
back to their defaults when absent. A missing `delta` stays absent, which is
not the same as a delta of zero.
===============================================================================
*/
struct Quote {
    double                price{0.0};
    std::string           reason{};
    double                remaining{0.0};
    MarketSide            side{MarketSide::Unknown};
    std::optional<double> delta{};

    // ---------------------------------------------------------
    // Dump (no allocations)
    // ---------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[QUOTE] {"
           << "price=" << price
           << ", remaining=" << remaining
           << ", side=" << to_string(side)
           << ", reason=" << reason;
        if (delta) {
            os << ", delta=" << *delta;
        }
        os << "}";
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

// Stream operator<< delegates to dump(); allocation-free.
inline std::ostream& operator<<(std::ostream& os, const Quote& q) {
    q.dump(os);
    return os;
}

} // namespace gemstream::protocol::gemini::schema
