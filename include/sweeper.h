#pragma once
#ifndef SWEEPER_H
#define SWEEPER_H

#include "logger.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * Background task that periodically calls remove_expired() on a shared cache.
 * The sweeper keeps its own reference to the cache, so the cache outlives the
 * sweep thread. Works with any type exposing `std::size_t remove_expired()`.
 */
template <class CacheT>
class Sweeper {
public:
    /**
     * Constructor
     * @param cache    Cache to sweep
     * @param interval Wait between two sweeps
     * @throws std::invalid_argument if cache is null or interval is not positive
     */
    Sweeper(std::shared_ptr<CacheT> cache, std::chrono::milliseconds interval)
        : cache_(std::move(cache)), interval_(interval) {
        if (!cache_) {
            throw std::invalid_argument("sweeper needs a cache");
        }
        if (interval_.count() <= 0) {
            throw std::invalid_argument("sweep interval must be positive");
        }
    }

    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    /**
     * Destructor - stops the sweep thread.
     */
    ~Sweeper() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
        std::lock_guard<std::mutex> lock(mtx_);
        if (running_) return;
        running_ = true;
        thread_ = std::thread([this] { loop(); });
        log_message(LogLevel::Info, "Sweeper",
                    "Started, interval " + std::to_string(interval_.count()) + " ms");
    }

    // Holds the lifecycle lock through the join so a concurrent start()
    // cannot replace a thread that is still joinable.
    void stop() {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!running_) return;
            running_ = false;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
        log_message(LogLevel::Info, "Sweeper",
                    "Stopped after " + std::to_string(sweeps_.load()) + " sweeps");
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return running_;
    }

    /**
     * Run one sweep on the calling thread.
     * @return number of entries removed by this sweep
     */
    std::size_t sweep_now() {
        std::size_t removed = cache_->remove_expired();
        sweeps_++;
        removed_ += removed;
        if (removed > 0) {
            log_message(LogLevel::Debug, "Sweeper",
                        "Removed " + std::to_string(removed) + " expired entries");
        }
        return removed;
    }

    std::chrono::milliseconds interval() const {
        return interval_;
    }

    /**
     * @return Number of completed sweeps, periodic and manual
     */
    std::size_t sweeps() const {
        return sweeps_.load();
    }

    /**
     * @return Total entries removed across all sweeps
     */
    std::size_t removed() const {
        return removed_.load();
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mtx_);
        while (running_) {
            if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
                break;
            }
            lock.unlock();
            sweep_now();
            lock.lock();
        }
    }

    std::shared_ptr<CacheT> cache_;
    std::chrono::milliseconds interval_;

    std::mutex lifecycle_mtx_;           ///< Serialises start() and stop()
    bool running_ = false;               ///< Guarded by mtx_
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::thread thread_;

    std::atomic<std::size_t> sweeps_{0};
    std::atomic<std::size_t> removed_{0};
};

#endif // SWEEPER_H
