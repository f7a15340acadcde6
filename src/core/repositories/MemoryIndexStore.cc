// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "MemoryIndexStore.h"
#include "../CredentialTypes.h"
#include "../ProviderRules.h"
#include <algorithm>

namespace KeyWarden {

namespace {

bool field_matches(const keywarden::CredentialMetadata& record, IndexField field,
                   std::string_view value) {
    switch (field) {
        case IndexField::PROVIDER:
            return to_string(record.provider()) == value;
        case IndexField::STATUS:
            return to_string(record.status()) == value;
        case IndexField::KEY_TYPE:
            return to_string(record.key_type()) == value;
        case IndexField::TAG:
            return std::any_of(record.tags().begin(), record.tags().end(),
                               [value](const std::string& tag) { return tag == value; });
    }
    return false;
}

} // anonymous namespace

StoreResult<> MemoryIndexStore::put(std::string_view collection,
                                    const keywarden::CredentialMetadata& record) {
    std::lock_guard lock(m_mutex);

    auto it = m_collections.find(collection);
    if (it == m_collections.end()) {
        it = m_collections.emplace(std::string(collection), Collection{}).first;
    }

    auto& records = it->second;
    auto existing = std::ranges::find_if(records,
        [&record](const auto& r) { return r.id() == record.id(); });
    if (existing != records.end()) {
        *existing = record;
    } else {
        records.push_back(record);
    }
    return {};
}

StoreResult<keywarden::CredentialMetadata>
MemoryIndexStore::get(std::string_view collection, std::string_view id) const {
    std::lock_guard lock(m_mutex);

    const auto it = m_collections.find(collection);
    if (it == m_collections.end()) {
        return std::unexpected(StoreError::NOT_FOUND);
    }
    const auto record = std::ranges::find_if(it->second,
        [id](const auto& r) { return r.id() == id; });
    if (record == it->second.end()) {
        return std::unexpected(StoreError::NOT_FOUND);
    }
    return *record;
}

StoreResult<std::vector<keywarden::CredentialMetadata>>
MemoryIndexStore::query(std::string_view collection, IndexField field, std::string_view value,
                        const IndexQueryOptions& options) const {
    std::lock_guard lock(m_mutex);

    std::vector<keywarden::CredentialMetadata> matches;
    const auto it = m_collections.find(collection);
    if (it == m_collections.end()) {
        return matches;
    }

    size_t skipped = 0;
    for (const auto& record : it->second) {
        if (!field_matches(record, field, value)) {
            continue;
        }
        if (skipped < options.offset) {
            ++skipped;
            continue;
        }
        if (options.limit && matches.size() >= *options.limit) {
            break;
        }
        matches.push_back(record);
    }
    return matches;
}

StoreResult<std::vector<keywarden::CredentialMetadata>>
MemoryIndexStore::get_all(std::string_view collection) const {
    std::lock_guard lock(m_mutex);

    const auto it = m_collections.find(collection);
    if (it == m_collections.end()) {
        return std::vector<keywarden::CredentialMetadata>{};
    }
    return it->second;
}

StoreResult<> MemoryIndexStore::remove(std::string_view collection, std::string_view id) {
    std::lock_guard lock(m_mutex);

    const auto it = m_collections.find(collection);
    if (it == m_collections.end()) {
        return std::unexpected(StoreError::NOT_FOUND);
    }
    const auto erased = std::erase_if(it->second, [id](const auto& r) { return r.id() == id; });
    if (erased == 0) {
        return std::unexpected(StoreError::NOT_FOUND);
    }
    return {};
}

size_t MemoryIndexStore::size(std::string_view collection) const {
    std::lock_guard lock(m_mutex);
    const auto it = m_collections.find(collection);
    return it == m_collections.end() ? 0 : it->second.size();
}

} // namespace KeyWarden
