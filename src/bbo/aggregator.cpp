#include "gemstream/bbo/aggregator.hpp"

#include <utility>

#include "lcr/log/logger.hpp"


namespace gemstream::bbo {

using protocol::gemini::MarketSide;

Aggregator::Aggregator(sink_t sink)
    : sink_(std::move(sink))
{
}

void Aggregator::set_sink(sink_t sink) {
    sink_ = std::move(sink);
}

BestBidOffer Aggregator::apply(const protocol::gemini::schema::Quote& quote) {
    BestBidOffer snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (quote.side) {
            case MarketSide::Bid:
                bbo_.best_bid = quote.price;
                bbo_.bid_amount_remaining = quote.remaining;
                ++updates_;
                break;
            case MarketSide::Ask:
                bbo_.best_offer = quote.price;
                bbo_.ask_amount_remaining = quote.remaining;
                ++updates_;
                break;
            default:
                break;
        }
        snap = bbo_;
    }

    if (quote.side == MarketSide::Unknown) {
        GS_TRACE("[BBO] Quote without side left top-of-book unchanged: " << quote);
    }

    if (sink_) {
        sink_(snap);
    }
    return snap;
}

BestBidOffer Aggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bbo_;
}

std::uint64_t Aggregator::updates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updates_;
}

} // namespace gemstream::bbo
