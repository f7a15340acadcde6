// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IBlobStore.h
 * @brief Interface for the opaque key/value blob store
 *
 * Stores serialized EncryptedCredential messages and the duplicate-index
 * entries. Values are raw bytes; the store never interprets them.
 */

#pragma once

#include "StoreError.h"
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace KeyWarden {

class IBlobStore {
public:
    virtual ~IBlobStore() = default;

    /**
     * @brief Read a value
     *
     * Errors:
     * - NOT_FOUND: Key absent
     * - READ_FAILED / UNAVAILABLE: Backend failure
     */
    [[nodiscard]] virtual StoreResult<std::string> get(std::string_view key) const = 0;

    /** @brief Insert or overwrite a value */
    [[nodiscard]] virtual StoreResult<> set(std::string_view key, std::string_view value) = 0;

    /**
     * @brief Delete a value
     *
     * Errors:
     * - NOT_FOUND: Key absent
     */
    [[nodiscard]] virtual StoreResult<> remove(std::string_view key) = 0;

    /**
     * @brief Read several values
     * @return Map containing only the keys that exist
     */
    [[nodiscard]] virtual StoreResult<std::map<std::string, std::string>>
        get_batch(const std::vector<std::string>& keys) const = 0;

    /** @brief Write several values; stops at the first failure */
    [[nodiscard]] virtual StoreResult<>
        set_batch(const std::vector<std::pair<std::string, std::string>>& entries) = 0;

    /** @brief All keys starting with prefix, sorted */
    [[nodiscard]] virtual StoreResult<std::vector<std::string>>
        list_keys(std::string_view prefix) const = 0;

    [[nodiscard]] virtual bool is_available() const = 0;
};

} // namespace KeyWarden
