// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IIndexStore.h
 * @brief Interface for the structured metadata store
 *
 * Holds CredentialMetadata records keyed by id, grouped in named
 * collections, and answers equality queries on a few indexed fields.
 * Secrets never reach this store.
 */

#pragma once

#include "StoreError.h"
#include "credential.pb.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace KeyWarden {

/**
 * @brief Fields an index store can be queried on
 */
enum class IndexField {
    PROVIDER,   ///< Provider tag ("openai", ...)
    STATUS,     ///< Status tag ("active", ...)
    KEY_TYPE,   ///< Key type tag ("standard", ...)
    TAG         ///< Matches if any tag equals the value
};

/**
 * @brief Paging for query()
 */
struct IndexQueryOptions {
    size_t offset = 0;
    std::optional<size_t> limit;
};

class IIndexStore {
public:
    virtual ~IIndexStore() = default;

    /**
     * @brief Insert or replace a record
     * @param collection Collection name
     * @param record Record; its id is the key
     *
     * Errors:
     * - UNAVAILABLE: Backend not reachable
     * - WRITE_FAILED: Could not persist
     */
    [[nodiscard]] virtual StoreResult<> put(std::string_view collection,
                                            const keywarden::CredentialMetadata& record) = 0;

    /**
     * @brief Fetch a record by id
     *
     * Errors:
     * - NOT_FOUND: No record with this id
     * - UNAVAILABLE: Backend not reachable
     */
    [[nodiscard]] virtual StoreResult<keywarden::CredentialMetadata>
        get(std::string_view collection, std::string_view id) const = 0;

    /**
     * @brief Records whose field equals value, in insertion order
     */
    [[nodiscard]] virtual StoreResult<std::vector<keywarden::CredentialMetadata>>
        query(std::string_view collection, IndexField field, std::string_view value,
              const IndexQueryOptions& options = {}) const = 0;

    /** @brief Every record in the collection, in insertion order */
    [[nodiscard]] virtual StoreResult<std::vector<keywarden::CredentialMetadata>>
        get_all(std::string_view collection) const = 0;

    /**
     * @brief Delete a record
     *
     * Errors:
     * - NOT_FOUND: No record with this id
     */
    [[nodiscard]] virtual StoreResult<> remove(std::string_view collection, std::string_view id) = 0;

    /** @brief Cheap reachability probe used by health checks */
    [[nodiscard]] virtual bool is_available() const = 0;
};

} // namespace KeyWarden
