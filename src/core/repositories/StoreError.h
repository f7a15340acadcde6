// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include <expected>
#include <string_view>

namespace KeyWarden {

/**
 * @brief Error types for index and blob store operations
 */
enum class StoreError {
    UNAVAILABLE,       ///< Backend cannot be reached
    NOT_FOUND,         ///< No record under this key
    INVALID_KEY,       ///< Key contains characters the backend cannot store
    READ_FAILED,       ///< Backend read error
    WRITE_FAILED,      ///< Backend write error
    CORRUPTED          ///< Stored bytes could not be decoded
};

[[nodiscard]] constexpr std::string_view to_string(StoreError error) noexcept {
    switch (error) {
        case StoreError::UNAVAILABLE:  return "Store unavailable";
        case StoreError::NOT_FOUND:    return "Record not found";
        case StoreError::INVALID_KEY:  return "Invalid store key";
        case StoreError::READ_FAILED:  return "Failed to read from store";
        case StoreError::WRITE_FAILED: return "Failed to write to store";
        case StoreError::CORRUPTED:    return "Stored record is corrupted";
    }
    return "Unknown error";
}

template<typename T = void>
using StoreResult = std::expected<T, StoreError>;

} // namespace KeyWarden
