#pragma once

#include <string>
#include <ostream>
#include <sstream>

#include "gemstream/protocol/gemini/enums/side.hpp"


namespace gemstream::protocol::gemini::schema {

// ===============================================
// TRADE (events[] element with type = "trade")
// ===============================================
struct Trade {
    double     price{0.0};
    double     amount{0.0};
    MarketSide maker_side{MarketSide::Unknown};

    // ---------------------------------------------------------
    // Dump (no allocations)
    // ---------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[TRADE] {"
           << "price=" << price
           << ", amount=" << amount
           << ", maker_side=" << to_string(maker_side)
           << "}";
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
inline std::ostream& operator<<(std::ostream& os, const Trade& t) {
    t.dump(os);
    return os;
}

} // namespace gemstream::protocol::gemini::schema
