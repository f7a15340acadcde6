// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "MemoryBlobStore.h"

namespace KeyWarden {

StoreResult<std::string> MemoryBlobStore::get(std::string_view key) const {
    std::lock_guard lock(m_mutex);
    const auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::unexpected(StoreError::NOT_FOUND);
    }
    return it->second;
}

StoreResult<> MemoryBlobStore::set(std::string_view key, std::string_view value) {
    std::lock_guard lock(m_mutex);
    const auto it = m_values.find(key);
    if (it != m_values.end()) {
        it->second.assign(value);
    } else {
        m_values.emplace(std::string(key), std::string(value));
    }
    return {};
}

StoreResult<> MemoryBlobStore::remove(std::string_view key) {
    std::lock_guard lock(m_mutex);
    const auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::unexpected(StoreError::NOT_FOUND);
    }
    m_values.erase(it);
    return {};
}

StoreResult<std::map<std::string, std::string>>
MemoryBlobStore::get_batch(const std::vector<std::string>& keys) const {
    std::lock_guard lock(m_mutex);
    std::map<std::string, std::string> found;
    for (const auto& key : keys) {
        const auto it = m_values.find(key);
        if (it != m_values.end()) {
            found.emplace(key, it->second);
        }
    }
    return found;
}

StoreResult<> MemoryBlobStore::set_batch(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::lock_guard lock(m_mutex);
    for (const auto& [key, value] : entries) {
        m_values.insert_or_assign(key, value);
    }
    return {};
}

StoreResult<std::vector<std::string>> MemoryBlobStore::list_keys(std::string_view prefix) const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> keys;
    for (auto it = m_values.lower_bound(prefix); it != m_values.end(); ++it) {
        if (!it->first.starts_with(prefix)) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

} // namespace KeyWarden
