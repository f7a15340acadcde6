// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file FileBlobStore.h
 * @brief IBlobStore that keeps one file per key in a private directory
 *
 * Writes go to a temporary file that is flushed, restricted to 0600 and
 * renamed over the target, so a crash leaves either the old or the new
 * value, never a torn one. Keys are restricted to [A-Za-z0-9._-] so they
 * map directly onto file names.
 */

#pragma once

#include "IBlobStore.h"
#include <filesystem>
#include <mutex>

namespace KeyWarden {

class FileBlobStore final : public IBlobStore {
public:
    /**
     * @brief Open (and create if needed) a store directory
     * @param directory Directory created with 0700 permissions if missing
     * @throws std::filesystem::filesystem_error if the directory cannot be created
     */
    explicit FileBlobStore(std::filesystem::path directory);

    FileBlobStore(const FileBlobStore&) = delete;
    FileBlobStore& operator=(const FileBlobStore&) = delete;

    [[nodiscard]] StoreResult<std::string> get(std::string_view key) const override;
    [[nodiscard]] StoreResult<> set(std::string_view key, std::string_view value) override;
    [[nodiscard]] StoreResult<> remove(std::string_view key) override;
    [[nodiscard]] StoreResult<std::map<std::string, std::string>>
        get_batch(const std::vector<std::string>& keys) const override;
    [[nodiscard]] StoreResult<>
        set_batch(const std::vector<std::pair<std::string, std::string>>& entries) override;
    [[nodiscard]] StoreResult<std::vector<std::string>>
        list_keys(std::string_view prefix) const override;
    [[nodiscard]] bool is_available() const override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_directory; }

    /** @brief Whether key can be stored (non-empty, [A-Za-z0-9._-], no leading dot) */
    [[nodiscard]] static bool is_valid_key(std::string_view key) noexcept;

private:
    [[nodiscard]] StoreResult<std::string> read_locked(std::string_view key) const;
    [[nodiscard]] StoreResult<> write_locked(std::string_view key, std::string_view value);

    mutable std::mutex m_mutex;
    std::filesystem::path m_directory;
};

} // namespace KeyWarden
