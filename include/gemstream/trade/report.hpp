#pragma once

#include <functional>
#include <ostream>

#include "gemstream/protocol/gemini/schema/trade.hpp"


namespace gemstream::trade {

// -----------------------------
// Trade plus its notional value
// -----------------------------
struct TradeReport {
    protocol::gemini::schema::Trade trade;
    double notional;    // amount * price
};

[[nodiscard]] TradeReport make_report(const protocol::gemini::schema::Trade& t) noexcept;

std::ostream& operator<<(std::ostream&, const TradeReport&);


// Stateless trade path: one report per trade event, independent of the BBO.
class Reporter {
public:
    using sink_t = std::function<void(const TradeReport&)>;

public:
    Reporter() = default;
    explicit Reporter(sink_t sink);

    void set_sink(sink_t sink);

    TradeReport report(const protocol::gemini::schema::Trade& t) const;

private:
    sink_t sink_{};
};

} // namespace gemstream::trade
