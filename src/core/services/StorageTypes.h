// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file StorageTypes.h
 * @brief Inputs and results of CredentialStorageService operations
 */

#ifndef KEYWARDEN_STORAGE_TYPES_H
#define KEYWARDEN_STORAGE_TYPES_H

#include "../../utils/SecureMemory.h"
#include "credential.pb.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace KeyWarden {

/**
 * @brief Storage service settings
 */
struct StorageConfig {
    size_t record_cache_size = 100;
    std::chrono::milliseconds record_cache_ttl{std::chrono::minutes(30)};
    size_t min_passphrase_length = 8;
};

/**
 * @brief Service-wide readiness
 *
 * Uninitialized -> Initializing -> Ready <-> Locked; shutdown() returns to
 * Uninitialized from any state.
 */
enum class StorageState {
    Uninitialized,
    Initializing,
    Ready,
    Locked
};

[[nodiscard]] constexpr std::string_view to_string(StorageState state) noexcept {
    switch (state) {
        case StorageState::Uninitialized: return "uninitialized";
        case StorageState::Initializing:  return "initializing";
        case StorageState::Ready:         return "ready";
        case StorageState::Locked:        return "locked";
    }
    return "uninitialized";
}

/**
 * @brief New credential submitted to add_key()
 */
struct AddKeyInput {
    std::string key;                                  ///< Raw key; wiped by the service after use
    std::optional<keywarden::Provider> provider;      ///< Detected from the key when absent
    std::string name;
    std::optional<std::string> description;
    std::vector<keywarden::Permission> permissions;   ///< Empty means default_permissions()
    std::vector<std::string> tags;
    std::optional<int64_t> expires_at;
    std::optional<keywarden::CredentialConfiguration> configuration;
};

/**
 * @brief Metadata patch for update_key(); unset fields are left unchanged
 *
 * The secret, id, provider, key type and creation time cannot be patched.
 */
struct KeyUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::vector<keywarden::Permission>> permissions;
    std::optional<keywarden::KeyStatus> status;
    std::optional<int64_t> expires_at;
    std::optional<keywarden::CredentialConfiguration> configuration;   ///< Merged field by field
};

/**
 * @brief A stored record together with its decrypted secret
 */
struct DecryptedCredential {
    keywarden::EncryptedCredential record;
    SecureString secret;
};

struct RotationResult {
    bool success = false;
    std::optional<std::string> new_key_id;   ///< Same as the rotated id; identity is preserved
    std::optional<std::string> error;
    bool rollback_available = false;         ///< The pre-rotation secret is still in place
};

enum class SortField { NAME, CREATED_AT, LAST_USED, PROVIDER };
enum class SortOrder { ASC, DESC };

/**
 * @brief Filters, ordering and pagination for list_keys()
 *
 * Filters combine with AND; tags match when the key carries any of them.
 * When both are given, cursor takes precedence over offset.
 */
struct ListOptions {
    std::optional<keywarden::Provider> provider;
    std::optional<keywarden::KeyStatus> status;
    std::optional<keywarden::KeyType> key_type;
    std::vector<std::string> tags;
    std::optional<std::string> search;        ///< Case-insensitive, name and description
    std::optional<SortField> sort_by;
    SortOrder sort_order = SortOrder::ASC;
    size_t offset = 0;
    std::optional<size_t> limit;
    std::optional<std::string> cursor;
};

struct ListResult {
    std::vector<keywarden::CredentialMetadata> keys;
    size_t total = 0;                         ///< Matches before pagination
    bool has_more = false;
    std::optional<std::string> next_cursor;
};

/**
 * @brief One usage report passed to record_usage()
 */
struct UsageRecord {
    uint64_t requests = 0;
    uint64_t failed_requests = 0;             ///< Subset of requests
    uint64_t tokens = 0;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    double cost = 0.0;
    double response_time_ms = 0.0;            ///< Average over this report's requests
};

struct ConnectionTestResult {
    bool success = false;
    std::chrono::milliseconds response_time{0};
    std::optional<std::string> error;
    keywarden::Provider provider = keywarden::PROVIDER_CUSTOM;
    std::string endpoint;
    std::optional<int> status_code;
};

struct ImportError {
    std::string key;                          ///< Record id, or "unknown"
    std::string error;
};

struct ImportResult {
    size_t success = 0;
    size_t failed = 0;
    std::vector<ImportError> errors;
};

enum class HealthState { PASS, FAIL, WARN };

[[nodiscard]] constexpr std::string_view to_string(HealthState state) noexcept {
    switch (state) {
        case HealthState::PASS: return "pass";
        case HealthState::FAIL: return "fail";
        case HealthState::WARN: return "warn";
    }
    return "fail";
}

struct HealthCheck {
    std::string name;
    HealthState status = HealthState::FAIL;
    std::string message;
};

struct HealthReport {
    bool healthy = false;
    std::vector<HealthCheck> checks;
};

struct StorageMetrics {
    size_t total_keys = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    std::map<std::string, size_t> operation_counts;
};

} // namespace KeyWarden

#endif // KEYWARDEN_STORAGE_TYPES_H
