#pragma once
/**
 * @file observability.hpp
 * @brief Process-level counters for connections and dispatch.
 */

#include <atomic>
#include <cstdint>

namespace bmux::obs {

    /** @struct Counters
     *  @brief Plain snapshot of the live counters.
     */
    struct Counters {
        uint64_t accepted{0};          ///< Connections admitted
        uint64_t rejected{0};          ///< Connections closed on open (over limit)
        uint64_t closed{0};            ///< Connections torn down
        uint64_t frames{0};            ///< Complete envelopes read
        uint64_t dispatched{0};        ///< Envelopes handed to a handler
        uint64_t dispatch_misses{0};   ///< Envelopes without a handler
        uint64_t decode_failures{0};   ///< Header decode/schema failures
        uint64_t framing_failures{0};  ///< Short reads mid-frame
    };

    /** @class LiveCounters
     *  @brief Atomic counters shared by engines; relaxed ordering, monotonic.
     */
    class LiveCounters {
    public:
        std::atomic<uint64_t> accepted{0};
        std::atomic<uint64_t> rejected{0};
        std::atomic<uint64_t> closed{0};
        std::atomic<uint64_t> frames{0};
        std::atomic<uint64_t> dispatched{0};
        std::atomic<uint64_t> dispatch_misses{0};
        std::atomic<uint64_t> decode_failures{0};
        std::atomic<uint64_t> framing_failures{0};

        static void bump(std::atomic<uint64_t>& c) noexcept { c.fetch_add(1, std::memory_order_relaxed); }

        Counters snapshot() const noexcept {
            Counters c;
            c.accepted         = accepted.load(std::memory_order_relaxed);
            c.rejected         = rejected.load(std::memory_order_relaxed);
            c.closed           = closed.load(std::memory_order_relaxed);
            c.frames           = frames.load(std::memory_order_relaxed);
            c.dispatched       = dispatched.load(std::memory_order_relaxed);
            c.dispatch_misses  = dispatch_misses.load(std::memory_order_relaxed);
            c.decode_failures  = decode_failures.load(std::memory_order_relaxed);
            c.framing_failures = framing_failures.load(std::memory_order_relaxed);
            return c;
        }
    };

} // namespace bmux::obs
