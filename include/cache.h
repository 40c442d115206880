#pragma once
#ifndef CACHE_H
#define CACHE_H

#include "entry.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>

/**
 * Thread-safe key-value cache with:
 * - optional per-entry expiry (absolute instant computed at insertion)
 * - a default time-to-live applied when set() gets no duration
 * - lazy expiry: get() hides expired entries, remove_expired() deletes them
 * - basic metrics: cache hits & misses
 *
 * The cache never schedules its own sweeps; see Sweeper for the periodic task.
 * Share one instance between threads through std::shared_ptr.
 */
template <class K, class V, class Clock = std::chrono::steady_clock>
class Cache {
public:
    using clock = Clock;
    using time_point = typename Clock::time_point;
    using duration = typename Clock::duration;
    using entry_type = Entry<V, Clock>;

    /**
     * Constructor
     * @param default_duration TTL for entries inserted without one (empty = never expire)
     */
    explicit Cache(std::optional<duration> default_duration = std::nullopt)
        : default_duration_(default_duration) {}

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    // ---------------- Public API ----------------

    /**
     * Insert or replace the entry for a key.
     * The expiry is taken from `ttl`, else from the default duration, else none.
     * An existing entry's expiry is never carried over.
     * @param key   Key
     * @param value Value
     * @param ttl   Per-entry time-to-live override
     * @return the value previously stored under key, expired or not
     *
     * If V's move assignment can throw, the old value is copied out first and a
     * throwing assignment leaves the stored entry unchanged, provided V's move
     * assignment itself does not modify its target before throwing.
     */
    std::optional<V> set(K key, V value, std::optional<duration> ttl = std::nullopt) {
        auto entry = entry_type::with_duration(std::move(value), ttl ? ttl : default_duration_);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            map_.emplace(std::move(key), std::move(entry));
            return std::nullopt;
        }
        if constexpr (std::is_nothrow_move_assignable_v<V>) {
            std::optional<V> previous(std::move(it->second.value));
            it->second = std::move(entry);
            return previous;
        } else {
            std::optional<V> previous(it->second.value);
            it->second = std::move(entry);
            return previous;
        }
    }

    /**
     * Get value if present and not expired.
     * Expired entries stay in the store until remove_expired() runs.
     * @param key Key to fetch
     * @return std::optional containing a copy of the value if live, empty otherwise
     */
    std::optional<V> get(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = map_.find(key);
        if (it == map_.end() || it->second.expired(Clock::now())) {
            misses_++;
            return std::nullopt;
        }
        hits_++;
        return it->second.value;
    }

    /**
     * Remove a key regardless of its expiry state.
     * @param key Key to erase
     * @return the removed value, or empty if the key was not stored
     */
    std::optional<V> remove(const K& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        std::optional<V> value(std::move(it->second.value));
        map_.erase(it);
        return value;
    }

    /**
     * Sweep: physically delete every entry whose expiry has passed.
     * The whole scan is one exclusive critical section.
     * @return number of entries removed
     */
    std::size_t remove_expired() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = Clock::now();

        std::size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();) {
            if (it->second.expired(now)) {
                it = map_.erase(it); // erase returns next iterator
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    /**
     * Remove every entry regardless of expiry.
     */
    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    /**
     * @return Number of stored entries, including expired ones not yet swept
     */
    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    bool empty() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.empty();
    }

    // Raw presence check, does not look at the expiry.
    bool contains(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    std::optional<duration> default_duration() const {
        return default_duration_;
    }

    /**
     * @return Number of get() calls that returned a value
     */
    std::size_t hits() const {
        return hits_.load();
    }

    /**
     * @return Number of get() calls that found nothing live
     */
    std::size_t misses() const {
        return misses_.load();
    }

private:
    mutable std::shared_mutex mutex_;           ///< Protects map_
    std::unordered_map<K, entry_type> map_;     ///< key -> Entry
    const std::optional<duration> default_duration_;

    // Metrics
    mutable std::atomic<std::size_t> hits_{0};
    mutable std::atomic<std::size_t> misses_{0};
};

#endif // CACHE_H
