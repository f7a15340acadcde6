// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file CredentialTypes.h
 * @brief Helpers for the persisted credential record model
 *
 * The record entities themselves (CredentialMetadata, EncryptedCredential,
 * UsageStats, RotationStatus, ...) are protobuf messages generated from
 * credential.proto. This header adds the invariants that sit on top of them:
 * id generation, irreversible masking, expiry and rotation-due computation,
 * and string conversions for the enums.
 *
 * @section masking Masking
 * A masked key is produced by truncation only. It keeps at most 8 leading
 * and 8 trailing characters and can never be used to rebuild the secret.
 */

#ifndef KEYWARDEN_CREDENTIAL_TYPES_H
#define KEYWARDEN_CREDENTIAL_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <glibmm/ustring.h>
#include "credential.pb.h"

namespace KeyWarden {

/// Version stamped on every EncryptedCredential written by this build
inline constexpr uint32_t STORAGE_VERSION = 1;

/// Version of the export bundle layout
inline constexpr uint32_t EXPORT_BUNDLE_VERSION = 1;

/// Characters kept on each side of a masked key by default
inline constexpr size_t DEFAULT_MASK_VISIBLE = 4;

inline constexpr int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

/** @brief Current wall-clock time in Unix epoch milliseconds */
[[nodiscard]] int64_t now_ms();

/**
 * @brief Mask a key for display
 *
 * Returns "***" when the key has no more than 2 * visible characters,
 * otherwise the first and last min(visible, 8) characters joined by "...".
 *
 * @param key Sanitized raw key (UTF-8)
 * @param visible Characters to keep at each end
 */
[[nodiscard]] std::string mask_key(const Glib::ustring& key, size_t visible = DEFAULT_MASK_VISIBLE);

/**
 * @brief Generate a fresh record id
 *
 * Format: `<provider>-<unix-ms>-<6 random base36 chars>[-<hash_suffix>]`.
 * The random part comes from RAND_bytes so ids created within the same
 * millisecond do not collide.
 *
 * @param provider Provider the key belongs to
 * @param hash_suffix Optional suffix, normally the first 8 hex chars of the key hash
 * @throws std::runtime_error if the random generator fails
 */
[[nodiscard]] std::string generate_key_id(keywarden::Provider provider,
                                          std::string_view hash_suffix = {});

/** @brief Permissions granted when the caller does not specify any */
[[nodiscard]] std::vector<keywarden::Permission> default_permissions();

/** @brief True once expires_at (if any) is in the past */
[[nodiscard]] bool is_key_expired(const keywarden::CredentialMetadata& metadata, int64_t now);

/**
 * @brief Whole days until expiry
 * @return std::nullopt if the key never expires; negative once expired
 */
[[nodiscard]] std::optional<int64_t> days_until_expiration(
    const keywarden::CredentialMetadata& metadata, int64_t now);

/**
 * @brief Whether scheduled rotation is due
 *
 * Due when rotation is enabled in the configuration and the last rotation
 * (or creation, if never rotated) is at least interval_days old.
 */
[[nodiscard]] bool needs_rotation(const keywarden::EncryptedCredential& record, int64_t now);

/**
 * @brief Status a caller should see
 *
 * The stored status, except that a key whose expires_at has passed reports
 * KEY_STATUS_EXPIRED. Revoked keys stay revoked.
 */
[[nodiscard]] keywarden::KeyStatus effective_status(
    const keywarden::CredentialMetadata& metadata, int64_t now);

/** @brief Zeroed usage counters with last_reset_at = now */
[[nodiscard]] keywarden::UsageStats make_empty_usage_stats(int64_t now);

// Enum <-> string conversions used in logs, exports and the CLI
[[nodiscard]] std::string_view to_string(keywarden::KeyStatus status) noexcept;
[[nodiscard]] std::string_view to_string(keywarden::KeyType type) noexcept;
[[nodiscard]] std::string_view to_string(keywarden::RotationState state) noexcept;
[[nodiscard]] std::string_view to_string(keywarden::Permission permission) noexcept;
[[nodiscard]] std::optional<keywarden::KeyStatus> parse_key_status(std::string_view tag) noexcept;

} // namespace KeyWarden

#endif // KEYWARDEN_CREDENTIAL_TYPES_H
