#pragma once
#ifndef ENTRY_H
#define ENTRY_H

#include <chrono>
#include <optional>
#include <utility>

/**
 * A stored value together with its absolute expiry instant.
 * An empty expiry means the entry never expires.
 */
template <class V, class Clock = std::chrono::steady_clock>
struct Entry {
    using time_point = typename Clock::time_point;
    using duration = typename Clock::duration;

    V value;                           ///< Stored value
    std::optional<time_point> expiry;  ///< Absolute expiry, computed once at insertion

    /**
     * Build an entry that expires `ttl` from now.
     * @param value Value to store
     * @param ttl   Time-to-live, or empty for no expiry
     */
    static Entry with_duration(V value, std::optional<duration> ttl) {
        std::optional<time_point> expiry;
        if (ttl) {
            auto now = Clock::now();
            // Saturate instead of overflowing for very long TTLs
            if (*ttl > time_point::max() - now) {
                expiry = time_point::max();
            } else {
                expiry = now + *ttl;
            }
        }
        return Entry{std::move(value), expiry};
    }

    /**
     * Liveness predicate shared by reads and sweeps.
     * @return true once `now` has reached the expiry instant
     */
    bool expired(time_point now) const {
        return expiry.has_value() && *expiry <= now;
    }
};

#endif // ENTRY_H
