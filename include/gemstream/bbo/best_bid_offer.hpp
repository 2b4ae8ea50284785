#pragma once

#include <ostream>


namespace gemstream::bbo {

// -----------------------------
// Top-of-book snapshot
// -----------------------------
//
// All fields start at zero. A zero is therefore ambiguous: it means either
// "no quote seen yet on this side" or an explicit zero from the feed.
struct BestBidOffer {
    double best_bid{0.0};
    double best_offer{0.0};
    double bid_amount_remaining{0.0};
    double ask_amount_remaining{0.0};

    friend bool operator==(const BestBidOffer&, const BestBidOffer&) noexcept = default;
};

std::ostream& operator<<(std::ostream&, const BestBidOffer&);

} // namespace gemstream::bbo
