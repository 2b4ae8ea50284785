#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <atomic>
#include <cstdint>
#include <utility>
#include <ostream>
#include <variant>

#include "gemstream/config/defaults.hpp"
#include "gemstream/stream/client.hpp"
#include "gemstream/transport/concepts.hpp"
#include "gemstream/protocol/gemini/router.hpp"
#include "gemstream/protocol/gemini/sequence_tracker.hpp"
#include "gemstream/bbo/aggregator.hpp"
#include "gemstream/trade/report.hpp"
#include "lcr/log/logger.hpp"


namespace gemstream {

/*
===============================================================================
 gemstream::Session
===============================================================================

One Gemini market data stream, end to end:

  transport frame
      → stream::Client        (liveness, reconnect, empty frame filter)
      → gemini::Router        (heartbeat | update, JSON → schema)
      → per event:
            Trade  → trade::Reporter   → on_trade
            Quote  → bbo::Aggregator   → on_bbo
            Unknown→ counted, skipped

A frame that fails to decode is logged, counted and dropped. The stream keeps
going with the next frame.

Frames are processed on the transport's receive thread, one at a time. poll()
belongs to the application thread. The aggregator snapshot and the telemetry
counters are safe to read from either.
===============================================================================
*/

// Monotonic counters, updated by the processing thread
struct Telemetry {
    std::atomic<std::uint64_t> messages_received{0};
    std::atomic<std::uint64_t> messages_decoded{0};
    std::atomic<std::uint64_t> decode_failures{0};
    std::atomic<std::uint64_t> heartbeats{0};
    std::atomic<std::uint64_t> unknown_events{0};
    std::atomic<std::uint64_t> sequence_gaps{0};
    std::atomic<std::uint64_t> trades{0};
    std::atomic<std::uint64_t> quotes{0};

    inline void dump(std::ostream& os) const {
        os << "[TELEMETRY] {"
           << "messages_received=" << messages_received.load(std::memory_order_relaxed)
           << ", messages_decoded=" << messages_decoded.load(std::memory_order_relaxed)
           << ", decode_failures=" << decode_failures.load(std::memory_order_relaxed)
           << ", heartbeats=" << heartbeats.load(std::memory_order_relaxed)
           << ", unknown_events=" << unknown_events.load(std::memory_order_relaxed)
           << ", sequence_gaps=" << sequence_gaps.load(std::memory_order_relaxed)
           << ", trades=" << trades.load(std::memory_order_relaxed)
           << ", quotes=" << quotes.load(std::memory_order_relaxed)
           << "}";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Telemetry& t) {
    t.dump(os);
    return os;
}


template <transport::WebSocketConcept WS>
class Session {
public:
    using trade_handler_t        = trade::Reporter::sink_t;
    using bbo_handler_t          = bbo::Aggregator::sink_t;
    using heartbeat_handler_t    = std::function<void(const protocol::gemini::schema::Heartbeat&)>;
    using decode_error_handler_t = std::function<void(protocol::gemini::parser::Result, std::string_view)>;

public:
    Session() {
        stream_.on_message([this](std::string_view raw) {
            process_(raw);
        });
        // Runs after the receive thread is gone, so the tracker is never shared
        stream_.on_disconnect([this]() {
            sequence_.reset();
        });
    }

    // The stream's callbacks reference the members below it
    ~Session() {
        stream_.close();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]]
    inline bool connect(const std::string& url) {
        sequence_.reset();
        return stream_.connect(url);
    }

    inline void close() {
        stream_.close();
    }

    inline void poll() {
        stream_.poll();
    }

    // Handlers must be installed before connect()
    inline void on_trade(trade_handler_t cb) {
        reporter_.set_sink(std::move(cb));
    }

    inline void on_bbo(bbo_handler_t cb) {
        aggregator_.set_sink(std::move(cb));
    }

    inline void on_heartbeat(heartbeat_handler_t cb) {
        on_heartbeat_cb_ = std::move(cb);
    }

    inline void on_decode_error(decode_error_handler_t cb) {
        on_decode_error_cb_ = std::move(cb);
    }

    // Accessors
    [[nodiscard]] inline bbo::BestBidOffer bbo() const {
        return aggregator_.snapshot();
    }

    [[nodiscard]] inline const Telemetry& telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]] inline stream::State state() const noexcept {
        return stream_.state();
    }

    [[nodiscard]] inline stream::Client<WS>& stream() noexcept {
        return stream_;
    }

#ifdef GS_UNIT_TEST
public:
    inline void inject(std::string_view raw) {
        process_(raw);
    }

    inline const protocol::gemini::SequenceTracker& sequence() const noexcept {
        return sequence_;
    }
#endif // GS_UNIT_TEST

private:
    stream::Client<WS> stream_;
    protocol::gemini::Router router_;
    protocol::gemini::SequenceTracker sequence_;
    bbo::Aggregator aggregator_;
    trade::Reporter reporter_;
    Telemetry telemetry_;

    heartbeat_handler_t on_heartbeat_cb_{};
    decode_error_handler_t on_decode_error_cb_{};

private:
    inline void process_(std::string_view raw) {
        using namespace protocol::gemini;

        const auto index = telemetry_.messages_received.fetch_add(1, std::memory_order_relaxed) + 1;

        auto r = router_.route(raw);
        if (r != parser::Result::Parsed) {
            telemetry_.decode_failures.fetch_add(1, std::memory_order_relaxed);
            GS_WARN("[SESSION] Dropping message #" << index << " (" << parser::to_string(r) << "): " << snippet_(raw));
            if (on_decode_error_cb_) {
                on_decode_error_cb_(r, raw);
            }
            return;
        }

        if (router_.routed_type() == PayloadType::Heartbeat) {
            const auto& hb = router_.heartbeat();
            telemetry_.heartbeats.fetch_add(1, std::memory_order_relaxed);
            stream_.record_heartbeat();
            observe_sequence_(hb.socket_sequence);
            GS_TRACE(hb);
            if (on_heartbeat_cb_) {
                on_heartbeat_cb_(hb);
            }
            return;
        }

        const auto& msg = router_.message();
        telemetry_.messages_decoded.fetch_add(1, std::memory_order_relaxed);
        observe_sequence_(msg.socket_sequence);

        for (const auto& ev : msg.events) {
            if (const auto* t = std::get_if<schema::Trade>(&ev)) {
                telemetry_.trades.fetch_add(1, std::memory_order_relaxed);
                (void)reporter_.report(*t);
            }
            else if (const auto* q = std::get_if<schema::Quote>(&ev)) {
                telemetry_.quotes.fetch_add(1, std::memory_order_relaxed);
                (void)aggregator_.apply(*q);
            }
            else {
                telemetry_.unknown_events.fetch_add(1, std::memory_order_relaxed);
                GS_TRACE("[SESSION] Unknown event skipped in message " << msg.event_id);
            }
        }
    }

    inline void observe_sequence_(std::uint32_t seq) {
        const bool had_last = sequence_.has_last();
        const auto expected = sequence_.expected();
        if (!sequence_.observe(seq)) {
            telemetry_.sequence_gaps.fetch_add(1, std::memory_order_relaxed);
            GS_WARN("[SESSION] Socket sequence gap: expected " << expected << ", got " << seq);
        }
        else if (!had_last) {
            GS_DEBUG("[SESSION] Socket sequence baseline: " << seq);
        }
    }

    [[nodiscard]]
    static inline std::string snippet_(std::string_view raw) {
        if (raw.size() <= config::log_snippet_max) {
            return std::string(raw);
        }
        std::string s(raw.substr(0, config::log_snippet_max));
        s += "...";
        return s;
    }
};

} // namespace gemstream
