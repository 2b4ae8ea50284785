#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <cstdint>
#include <utility>

#include "gemstream/config/defaults.hpp"
#include "gemstream/stream/state.hpp"
#include "gemstream/transport/concepts.hpp"
#include "gemstream/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace gemstream {
namespace stream {

/*
===============================================================================
 gemstream::stream::Client
===============================================================================

Streaming client template, parameterized by a WebSocket transport conforming
to transport::WebSocketConcept. Knows nothing about the exchange schema.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Establish and manage a WebSocket connection
- Drop empty frames and hand every other frame to the protocol layer
- Detect connection liveness from message and heartbeat activity
- Reconnect with bounded exponential backoff after a transport close

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
- Frames arrive on the transport's receive thread
- poll() runs on the caller's thread and drives liveness + reconnection
- State and timestamps are atomics shared between the two
- The close callback only publishes WaitingReconnect; retry bookkeeping
  (attempts, next retry time) belongs to the poll() thread

-------------------------------------------------------------------------------
 Liveness & Reconnection Model
-------------------------------------------------------------------------------
- Two signals are tracked: last message and last heartbeat
- A reconnect is triggered only if BOTH are stale
- The transport is force-closed so the normal close path schedules the retry
- Backoff: base * 2^attempt, capped (see config/defaults.hpp)
- close() is a local decision and never schedules a reconnect
===============================================================================
*/


template <transport::WebSocketConcept WS>
class Client {
public:
    using message_handler_t    = std::function<void(std::string_view)>;
    using connect_handler_t    = std::function<void()>;
    using disconnect_handler_t = std::function<void()>;
    using liveness_handler_t   = std::function<void()>;

public:
    explicit Client(std::chrono::milliseconds heartbeat_timeout = config::heartbeat_timeout,
                    std::chrono::milliseconds message_timeout = config::message_timeout)
        : heartbeat_timeout_(heartbeat_timeout)
        , message_timeout_(message_timeout)
    {
        last_heartbeat_ts_.store(std::chrono::steady_clock::now(), std::memory_order_relaxed);
        last_message_ts_.store(std::chrono::steady_clock::now(), std::memory_order_relaxed);
        ws_.set_message_callback([this](const std::string& msg) {
            on_message_received_(msg);
        });
        ws_.set_close_callback([this]() {
            on_transport_closed_();
        });
        ws_.set_error_callback([](transport::Error err) {
            GS_WARN("[STREAM] Transport error: " << transport::to_string(err));
        });
    }

    ~Client() {
        close();
    }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Connection lifecycle
    [[nodiscard]]
    inline bool connect(const std::string& url) {
        last_url_ = url;
        state_.store(State::Connecting, std::memory_order_release);

        GS_INFO("[STREAM] Connecting to: " << url);
        if (!parse_and_connect_(url)) {
            state_.store(State::Disconnected, std::memory_order_release);
            GS_ERROR("[STREAM] Connection failed.");
            return false;
        }
        mark_connected_();
        GS_INFO("[STREAM] Connected successfully.");
        if (hooks_.on_connect_cb_) {
            hooks_.on_connect_cb_();
        }
        return true;
    }

    inline void close() {
        State s = state_.load(std::memory_order_acquire);
        if (s == State::Disconnected) {
            return;
        }
        state_.store(State::Disconnecting, std::memory_order_release);
        ws_.close();
        state_.store(State::Disconnected, std::memory_order_release);
    }

    // Event loop
    inline void poll() {
        auto now = std::chrono::steady_clock::now();
        // === Liveness check ===
        if (state_.load(std::memory_order_acquire) == State::Connected) {
            auto last_msg = last_message_ts_.load(std::memory_order_relaxed);
            bool message_stale   = (now - last_msg) > message_timeout_;
            auto last_hb  = last_heartbeat_ts_.load(std::memory_order_relaxed);
            bool heartbeat_stale = (now - last_hb) > heartbeat_timeout_;
            // Conservative: only reconnect if BOTH are stale
            if (message_stale && heartbeat_stale) {
                auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_msg);
                GS_WARN("[STREAM] Liveness timeout (" << duration.count() << " ms without traffic). Forcing reconnect.");
                if (hooks_.on_liveness_timeout_cb_) {
                    hooks_.on_liveness_timeout_cb_();
                }
                // Force transport close → schedules reconnection
                ws_.close();
            }
        }
        // === Reconnection logic ===
        if (state_.load(std::memory_order_acquire) != State::WaitingReconnect) {
            return;
        }
        if (!retry_scheduled_) {
            retry_attempts_++;
            next_retry_ = now + backoff_(retry_attempts_);
            retry_scheduled_ = true;
            GS_WARN("[STREAM] Connection lost. Reconnecting in " << backoff_(retry_attempts_).count() << " ms.");
        }
        if (now >= next_retry_) {
            GS_INFO("[STREAM] Attempting reconnection...");
            if (!reconnect_()) {
                retry_attempts_++;
                next_retry_ = now + backoff_(retry_attempts_);
                state_.store(State::WaitingReconnect, std::memory_order_release);
            }
        }
    }

    // Callbacks
    void on_message(message_handler_t cb) noexcept {
        hooks_.on_message_cb_ = std::move(cb);
    }

    void on_connect(connect_handler_t cb) noexcept {
        hooks_.on_connect_cb_ = std::move(cb);
    }

    void on_disconnect(disconnect_handler_t cb) noexcept {
        hooks_.on_disconnect_cb_ = std::move(cb);
    }

    void on_liveness_timeout(liveness_handler_t cb) noexcept {
        hooks_.on_liveness_timeout_cb_ = std::move(cb);
    }

    inline void set_liveness_timeout(std::chrono::milliseconds heartbeat_timeout, std::chrono::milliseconds message_timeout) noexcept {
        heartbeat_timeout_ = heartbeat_timeout;
        message_timeout_ = message_timeout;
    }

    // Protocol layers report heartbeats here
    inline void record_heartbeat() noexcept {
        heartbeat_total_.fetch_add(1, std::memory_order_relaxed);
        last_heartbeat_ts_.store(std::chrono::steady_clock::now(), std::memory_order_relaxed);
    }

    // Accessors
    [[nodiscard]] inline State state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline std::uint64_t heartbeat_total() const noexcept {
        return heartbeat_total_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] inline std::uint64_t empty_frames() const noexcept {
        return empty_frames_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] inline int retry_attempts() const noexcept {
        return retry_attempts_;
    }

#ifdef GS_UNIT_TEST
public:
    inline void force_last_message(std::chrono::steady_clock::time_point ts) noexcept {
        last_message_ts_.store(ts, std::memory_order_relaxed);
    }

    inline void force_last_heartbeat(std::chrono::steady_clock::time_point ts) noexcept {
        last_heartbeat_ts_.store(ts, std::memory_order_relaxed);
    }

    inline void force_next_retry(std::chrono::steady_clock::time_point ts) noexcept {
        next_retry_ = ts;
        retry_scheduled_ = true;
    }

    WS& ws() {
        return ws_;
    }
#endif // GS_UNIT_TEST

private:
    std::string last_url_;
    WS ws_;

    std::atomic<std::uint64_t> heartbeat_total_{0};
    std::atomic<std::uint64_t> empty_frames_{0};
    std::atomic<std::chrono::steady_clock::time_point> last_heartbeat_ts_;
    std::atomic<std::chrono::steady_clock::time_point> last_message_ts_;

    std::chrono::milliseconds heartbeat_timeout_;
    std::chrono::milliseconds message_timeout_;

    // User-defined callbacks
    struct Hooks {
        message_handler_t    on_message_cb_{};
        connect_handler_t    on_connect_cb_{};
        disconnect_handler_t on_disconnect_cb_{};
        liveness_handler_t   on_liveness_timeout_cb_{};
    };

    Hooks hooks_;

    std::atomic<State> state_{State::Disconnected};

    // Owned by the poll() thread; the transport thread only publishes state_
    std::chrono::steady_clock::time_point next_retry_{};
    int retry_attempts_ = 0;
    bool retry_scheduled_ = false;

private:
    inline void on_message_received_(std::string_view msg) {
        last_message_ts_.store(std::chrono::steady_clock::now(), std::memory_order_relaxed);
        if (msg.empty()) {
            empty_frames_.fetch_add(1, std::memory_order_relaxed);
            GS_TRACE("[STREAM] Empty frame dropped.");
            return;
        }
        if (hooks_.on_message_cb_) {
            hooks_.on_message_cb_(msg);
        }
    }

    // May run on the transport's receive thread. Backoff is scheduled by poll().
    inline void on_transport_closed_() {
        GS_DEBUG("[STREAM] WebSocket closed.");
        if (hooks_.on_disconnect_cb_) {
            hooks_.on_disconnect_cb_();
        }
        State expected = State::Connected;
        (void)state_.compare_exchange_strong(expected, State::WaitingReconnect, std::memory_order_acq_rel);
    }

    [[nodiscard]]
    inline bool parse_and_connect_(const std::string& url) {
        transport::ParsedUrl parsed;
        auto err = transport::parse_url(url, parsed);
        if (err != transport::Error::None) {
            GS_ERROR("[STREAM] Invalid URL '" << url << "' (" << transport::to_string(err) << ")");
            return false;
        }
        // The transport always speaks TLS
        if (!parsed.secure) {
            GS_ERROR("[STREAM] Only wss:// endpoints are supported: '" << url << "'");
            return false;
        }
        return ws_.connect(parsed.host, parsed.port, parsed.target);
    }

    [[nodiscard]]
    inline bool reconnect_() {
        state_.store(State::Connecting, std::memory_order_release);
        // Release the previous connection (its close was already signaled)
        ws_.close();
        GS_INFO("[STREAM] Reconnecting to: " << last_url_);
        if (!parse_and_connect_(last_url_)) {
            GS_ERROR("[STREAM] Reconnection failed.");
            return false;
        }
        mark_connected_();
        GS_INFO("[STREAM] Connection re-established with server '" << last_url_ << "'.");
        if (hooks_.on_connect_cb_) {
            hooks_.on_connect_cb_();
        }
        return true;
    }

    inline void mark_connected_() noexcept {
        auto now = std::chrono::steady_clock::now();
        last_message_ts_.store(now, std::memory_order_relaxed);
        last_heartbeat_ts_.store(now, std::memory_order_relaxed);
        retry_attempts_ = 0;
        retry_scheduled_ = false;
        state_.store(State::Connected, std::memory_order_release);
    }

    [[nodiscard]]
    inline std::chrono::milliseconds backoff_(int attempt) const noexcept {
        using namespace std::chrono;
        const int shift = std::min(attempt, 16);
        return std::min(
            milliseconds(config::reconnect_backoff_base.count() * (1LL << shift)),
            milliseconds(config::reconnect_backoff_max)
        );
    }
};

} // namespace stream
} // namespace gemstream
