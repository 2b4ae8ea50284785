#pragma once

#include <cstdint>
#include <mutex>
#include <functional>

#include "gemstream/bbo/best_bid_offer.hpp"
#include "gemstream/protocol/gemini/schema/quote.hpp"


namespace gemstream::bbo {

/*
===============================================================================
 bbo::Aggregator
===============================================================================

Folds Quote events into a single top-of-book record.

  • Bid quote     → best_bid, bid_amount_remaining
  • Ask quote     → best_offer, ask_amount_remaining
  • Unknown side  → no change

Both fields of a side are written under one lock, and snapshots are copied
under the same lock, so a reader never sees a new price next to an old
remaining amount.

Every apply() call reports exactly one snapshot to the sink, after the update,
including calls that changed nothing. The sink runs outside the lock and only
ever receives a copy.

No crossed-book check is made: best_bid >= best_offer is passed through as the
feed sent it.
===============================================================================
*/
class Aggregator {
public:
    using sink_t = std::function<void(const BestBidOffer&)>;

public:
    Aggregator() = default;
    explicit Aggregator(sink_t sink);

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    // Sink registration is not synchronized with apply(); set it before streaming.
    void set_sink(sink_t sink);

    // Apply one quote and return the snapshot that was reported
    BestBidOffer apply(const protocol::gemini::schema::Quote& quote);

    [[nodiscard]] BestBidOffer snapshot() const;

    // Number of apply() calls that changed state
    [[nodiscard]] std::uint64_t updates() const;

private:
    mutable std::mutex mutex_;
    BestBidOffer bbo_{};
    std::uint64_t updates_{0};
    sink_t sink_{};
};

} // namespace gemstream::bbo
