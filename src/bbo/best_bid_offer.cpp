#include "gemstream/bbo/best_bid_offer.hpp"

#include <ostream>


namespace gemstream::bbo {

std::ostream& operator<<(std::ostream& os, const BestBidOffer& b) {
    os << "[BBO] {"
       << "best_bid=" << b.best_bid
       << ", bid_amount_remaining=" << b.bid_amount_remaining
       << ", best_offer=" << b.best_offer
       << ", ask_amount_remaining=" << b.ask_amount_remaining
       << "}";
    return os;
}

} // namespace gemstream::bbo
