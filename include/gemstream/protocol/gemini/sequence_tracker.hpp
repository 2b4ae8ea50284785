#pragma once

#include <cstdint>


namespace gemstream::protocol::gemini {

// Tracks the per-connection socket_sequence counter.
//
// Every frame on a connection (updates and heartbeats) carries the next
// sequence number, starting at 0. The first frame seen after reset() sets the
// baseline; later frames are expected to be exactly one ahead.
class SequenceTracker {
public:
    SequenceTracker() noexcept = default;

    // Returns false when the frame does not follow the previous one.
    // The tracker resynchronizes on the observed value either way.
    [[nodiscard]]
    inline bool observe(std::uint32_t seq) noexcept {
        bool in_order = true;
        if (has_last_ && seq != static_cast<std::uint32_t>(last_ + 1)) {
            in_order = false;
            ++gaps_;
        }
        last_ = seq;
        has_last_ = true;
        return in_order;
    }

    // Called on reconnect: the exchange restarts the counter
    inline void reset() noexcept {
        has_last_ = false;
        last_ = 0;
    }

    [[nodiscard]] inline bool has_last() const noexcept { return has_last_; }
    [[nodiscard]] inline std::uint32_t last() const noexcept { return last_; }
    [[nodiscard]] inline std::uint64_t gaps() const noexcept { return gaps_; }

    // Expected value of the next frame, meaningful only when has_last()
    [[nodiscard]] inline std::uint32_t expected() const noexcept { return last_ + 1; }

private:
    std::uint32_t last_{0};
    bool has_last_{false};
    std::uint64_t gaps_{0};
};

} // namespace gemstream::protocol::gemini
