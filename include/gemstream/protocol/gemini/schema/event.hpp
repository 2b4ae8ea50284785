#pragma once

#include <variant>
#include <ostream>

#include "gemstream/protocol/gemini/enums/message_kind.hpp"
#include "gemstream/protocol/gemini/schema/quote.hpp"
#include "gemstream/protocol/gemini/schema/trade.hpp"


namespace gemstream::protocol::gemini::schema {

/*
===============================================================================
Event
===============================================================================

Tagged union over the event subtypes this client understands.

UnknownEvent carries no payload. It keeps the slot of an unrecognized subtype
in the batch so wire order is preserved and new exchange event types never
abort decoding.
===============================================================================
*/
struct UnknownEvent {
    inline void dump(std::ostream& os) const {
        os << "[UNKNOWN]";
    }

    friend constexpr bool operator==(const UnknownEvent&, const UnknownEvent&) noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const UnknownEvent& u) {
    u.dump(os);
    return os;
}

using Event = std::variant<Trade, Quote, UnknownEvent>;

[[nodiscard]]
inline constexpr MessageKind kind_of(const Event& e) noexcept {
    switch (e.index()) {
        case 0:  return MessageKind::Trade;
        case 1:  return MessageKind::Change;
        default: return MessageKind::Unknown;
    }
}

inline std::ostream& operator<<(std::ostream& os, const Event& e) {
    std::visit([&os](const auto& ev) { ev.dump(os); }, e);
    return os;
}

} // namespace gemstream::protocol::gemini::schema
