// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "RateLimiter.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace KeyWarden {

RateLimiter::RateLimiter()
    : RateLimiter(Config{}) {
}

RateLimiter::RateLimiter(Config config)
    : m_config(config) {
    if (m_config.max_requests == 0) {
        throw std::invalid_argument("RateLimiter: max_requests must be positive");
    }
    if (m_config.window.count() <= 0) {
        throw std::invalid_argument("RateLimiter: window must be positive");
    }
}

void RateLimiter::expire_locked(Timestamps& stamps, Clock::time_point now) const {
    while (!stamps.empty() && now - stamps.front() >= m_config.window) {
        stamps.pop_front();
    }
}

bool RateLimiter::try_acquire(std::string_view bucket, Clock::time_point now) {
    std::lock_guard lock(m_mutex);

    auto it = m_buckets.find(bucket);
    if (it == m_buckets.end()) {
        it = m_buckets.emplace(std::string(bucket), Timestamps{}).first;
    }

    auto& stamps = it->second;
    expire_locked(stamps, now);

    if (stamps.size() >= m_config.max_requests) {
        Log::debug("RateLimiter: bucket exhausted ({} requests in window)", stamps.size());
        return false;
    }

    stamps.push_back(now);
    if (m_buckets.size() > m_config.max_buckets) {
        evict_locked(now);
    }
    return true;
}

uint32_t RateLimiter::remaining(std::string_view bucket, Clock::time_point now) {
    std::lock_guard lock(m_mutex);

    const auto it = m_buckets.find(bucket);
    if (it == m_buckets.end()) {
        return m_config.max_requests;
    }
    expire_locked(it->second, now);
    const auto used = static_cast<uint32_t>(it->second.size());
    return used >= m_config.max_requests ? 0 : m_config.max_requests - used;
}

void RateLimiter::reset() {
    std::lock_guard lock(m_mutex);
    m_buckets.clear();
}

size_t RateLimiter::bucket_count() const {
    std::lock_guard lock(m_mutex);
    return m_buckets.size();
}

void RateLimiter::evict_locked(Clock::time_point now) {
    // Idle buckets first
    for (auto it = m_buckets.begin(); it != m_buckets.end();) {
        expire_locked(it->second, now);
        if (it->second.empty()) {
            it = m_buckets.erase(it);
        } else {
            ++it;
        }
    }

    if (m_buckets.size() <= m_config.max_buckets) {
        return;
    }

    // Still over: drop the buckets whose newest request is oldest
    std::vector<decltype(m_buckets)::iterator> order;
    order.reserve(m_buckets.size());
    for (auto it = m_buckets.begin(); it != m_buckets.end(); ++it) {
        order.push_back(it);
    }
    std::ranges::sort(order, [](const auto& a, const auto& b) {
        return a->second.back() < b->second.back();
    });

    const size_t excess = m_buckets.size() - m_config.max_buckets;
    for (size_t i = 0; i < excess; ++i) {
        m_buckets.erase(order[i]);
    }
}

} // namespace KeyWarden
