// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include "IBlobStore.h"
#include <mutex>

namespace KeyWarden {

/**
 * @brief In-process IBlobStore backed by an ordered map. Thread-safe.
 */
class MemoryBlobStore final : public IBlobStore {
public:
    MemoryBlobStore() = default;

    MemoryBlobStore(const MemoryBlobStore&) = delete;
    MemoryBlobStore& operator=(const MemoryBlobStore&) = delete;

    [[nodiscard]] StoreResult<std::string> get(std::string_view key) const override;
    [[nodiscard]] StoreResult<> set(std::string_view key, std::string_view value) override;
    [[nodiscard]] StoreResult<> remove(std::string_view key) override;
    [[nodiscard]] StoreResult<std::map<std::string, std::string>>
        get_batch(const std::vector<std::string>& keys) const override;
    [[nodiscard]] StoreResult<>
        set_batch(const std::vector<std::pair<std::string, std::string>>& entries) override;
    [[nodiscard]] StoreResult<std::vector<std::string>>
        list_keys(std::string_view prefix) const override;
    [[nodiscard]] bool is_available() const override { return true; }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string, std::less<>> m_values;
};

} // namespace KeyWarden
