// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace KeyWarden {

/**
 * @brief Sliding-window limiter for live validation probes
 *
 * Each bucket (normally "provider:keyhash") may issue at most
 * max_requests within any rolling window. A rejected attempt is not
 * recorded, so a caller that backs off regains capacity as old requests
 * leave the window.
 *
 * The bucket table is bounded: once it holds more than max_buckets
 * entries, buckets whose newest request has left the window are dropped
 * first, then the least recently used ones.
 *
 * Thread-safety: all methods lock an internal mutex.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        uint32_t max_requests = 30;
        std::chrono::milliseconds window{std::chrono::seconds(60)};
        size_t max_buckets = 1000;
    };

    RateLimiter();
    explicit RateLimiter(Config config);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Record a request if the bucket has capacity
     * @return true if allowed, false if the bucket is exhausted
     */
    [[nodiscard]] bool try_acquire(std::string_view bucket, Clock::time_point now = Clock::now());

    /** @brief Requests still available to the bucket in the current window */
    [[nodiscard]] uint32_t remaining(std::string_view bucket, Clock::time_point now = Clock::now());

    /** @brief Forget all buckets */
    void reset();

    [[nodiscard]] size_t bucket_count() const;

    [[nodiscard]] const Config& config() const noexcept { return m_config; }

private:
    using Timestamps = std::deque<Clock::time_point>;

    void expire_locked(Timestamps& stamps, Clock::time_point now) const;
    void evict_locked(Clock::time_point now);

    mutable std::mutex m_mutex;
    Config m_config;
    std::map<std::string, Timestamps, std::less<>> m_buckets;
};

} // namespace KeyWarden
