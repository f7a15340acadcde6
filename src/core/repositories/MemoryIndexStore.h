// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include "IIndexStore.h"
#include <map>
#include <mutex>

namespace KeyWarden {

/**
 * @brief In-process IIndexStore
 *
 * Records are kept per collection in insertion order. Replacing a record
 * keeps its original position. Thread-safe.
 */
class MemoryIndexStore final : public IIndexStore {
public:
    MemoryIndexStore() = default;

    MemoryIndexStore(const MemoryIndexStore&) = delete;
    MemoryIndexStore& operator=(const MemoryIndexStore&) = delete;

    [[nodiscard]] StoreResult<> put(std::string_view collection,
                                    const keywarden::CredentialMetadata& record) override;
    [[nodiscard]] StoreResult<keywarden::CredentialMetadata>
        get(std::string_view collection, std::string_view id) const override;
    [[nodiscard]] StoreResult<std::vector<keywarden::CredentialMetadata>>
        query(std::string_view collection, IndexField field, std::string_view value,
              const IndexQueryOptions& options = {}) const override;
    [[nodiscard]] StoreResult<std::vector<keywarden::CredentialMetadata>>
        get_all(std::string_view collection) const override;
    [[nodiscard]] StoreResult<> remove(std::string_view collection, std::string_view id) override;
    [[nodiscard]] bool is_available() const override { return true; }

    /** @brief Number of records in a collection */
    [[nodiscard]] size_t size(std::string_view collection) const;

private:
    using Collection = std::vector<keywarden::CredentialMetadata>;

    mutable std::mutex m_mutex;
    std::map<std::string, Collection, std::less<>> m_collections;
};

} // namespace KeyWarden
