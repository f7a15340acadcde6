// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file ValidationCache.h
 * @brief Bounded, time-expiring memo table for validation results
 *
 * Entries expire after a fixed TTL. When an insert pushes the table past its
 * capacity, the oldest entries (by insertion time) are evicted until 80% of
 * capacity remains. Eviction is oldest-first, not LRU: reading an entry does
 * not refresh it.
 *
 * @code
 * ValidationCache<ValidationResult> cache(std::chrono::minutes(5), 1000);
 * cache.put("openai:sk-...", result);
 * if (auto hit = cache.get("openai:sk-...")) { ... }
 * @endcode
 */

#ifndef KEYWARDEN_VALIDATION_CACHE_H
#define KEYWARDEN_VALIDATION_CACHE_H

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace KeyWarden {

template<typename Value>
class ValidationCache {
public:
    using Clock = std::chrono::steady_clock;

    /// Fraction of capacity kept after a trim
    static constexpr double TRIM_RATIO = 0.8;

    ValidationCache(std::chrono::milliseconds ttl, size_t capacity)
        : m_ttl(ttl), m_capacity(std::max<size_t>(capacity, 1)) {}

    ValidationCache(const ValidationCache&) = delete;
    ValidationCache& operator=(const ValidationCache&) = delete;

    /**
     * @brief Look up a live entry
     * @param now Current time (injectable for tests)
     * @return Copy of the cached value, or std::nullopt if absent or expired
     */
    [[nodiscard]] std::optional<Value> get(std::string_view key, Clock::time_point now = Clock::now()) {
        std::lock_guard lock(m_mutex);
        const auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            ++m_misses;
            return std::nullopt;
        }
        if (now - it->second.stored_at >= m_ttl) {
            m_entries.erase(it);
            ++m_misses;
            return std::nullopt;
        }
        ++m_hits;
        return it->second.value;
    }

    /** @brief Insert or replace; trims the table when over capacity */
    void put(std::string_view key, Value value, Clock::time_point now = Clock::now()) {
        std::lock_guard lock(m_mutex);
        m_entries.insert_or_assign(std::string(key), Entry{std::move(value), now});
        if (m_entries.size() > m_capacity) {
            trim_locked(static_cast<size_t>(static_cast<double>(m_capacity) * TRIM_RATIO));
        }
    }

    void erase(std::string_view key) {
        std::lock_guard lock(m_mutex);
        const auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            m_entries.erase(it);
        }
    }

    void clear() {
        std::lock_guard lock(m_mutex);
        m_entries.clear();
    }

    /** @brief Drop every expired entry */
    void purge_expired(Clock::time_point now = Clock::now()) {
        std::lock_guard lock(m_mutex);
        std::erase_if(m_entries, [&](const auto& item) {
            return now - item.second.stored_at >= m_ttl;
        });
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(m_mutex);
        return m_entries.size();
    }

    [[nodiscard]] size_t hits() const {
        std::lock_guard lock(m_mutex);
        return m_hits;
    }

    [[nodiscard]] size_t misses() const {
        std::lock_guard lock(m_mutex);
        return m_misses;
    }

    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }

private:
    struct Entry {
        Value value;
        Clock::time_point stored_at;
    };

    void trim_locked(size_t target) {
        std::vector<typename std::map<std::string, Entry, std::less<>>::iterator> order;
        order.reserve(m_entries.size());
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            order.push_back(it);
        }
        std::ranges::stable_sort(order, [](const auto& a, const auto& b) {
            return a->second.stored_at < b->second.stored_at;
        });

        const size_t excess = m_entries.size() > target ? m_entries.size() - target : 0;
        for (size_t i = 0; i < excess; ++i) {
            m_entries.erase(order[i]);
        }
    }

    mutable std::mutex m_mutex;
    std::chrono::milliseconds m_ttl;
    size_t m_capacity;
    std::map<std::string, Entry, std::less<>> m_entries;
    size_t m_hits = 0;
    size_t m_misses = 0;
};

} // namespace KeyWarden

#endif // KEYWARDEN_VALIDATION_CACHE_H
