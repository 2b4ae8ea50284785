#include "gemstream/trade/report.hpp"

#include <ostream>
#include <utility>


namespace gemstream::trade {

TradeReport make_report(const protocol::gemini::schema::Trade& t) noexcept {
    return TradeReport{t, t.amount * t.price};
}

std::ostream& operator<<(std::ostream& os, const TradeReport& r) {
    r.trade.dump(os);
    os << " notional=$" << r.notional;
    return os;
}

Reporter::Reporter(sink_t sink)
    : sink_(std::move(sink))
{
}

void Reporter::set_sink(sink_t sink) {
    sink_ = std::move(sink);
}

TradeReport Reporter::report(const protocol::gemini::schema::Trade& t) const {
    auto r = make_report(t);
    if (sink_) {
        sink_(r);
    }
    return r;
}

} // namespace gemstream::trade
