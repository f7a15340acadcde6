// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file CredentialStorageService.h
 * @brief Encrypted, integrity-checked storage of API keys
 *
 * Responsibilities:
 * - CRUD over credential records split between an index store (metadata)
 *   and a blob store (encrypted records)
 * - Global duplicate suppression through a key-hash index
 * - Checksum verification before any decryption
 * - Rotation with snapshot and rollback
 * - Usage accounting, connection tests, export/import, health checks
 *
 * @section layout Persisted Layout
 * | Store       | Key                       | Value                          |
 * |-------------|---------------------------|--------------------------------|
 * | index store | METADATA_COLLECTION / id  | CredentialMetadata             |
 * | blob store  | `api_key_<id>`            | serialized EncryptedCredential |
 * | blob store  | `api_key_hash_<hash>`     | id                             |
 *
 * Every mutating operation leaves either the previous or the new state of a
 * record committed in all three places. Writes that succeed before a later
 * one fails are undone with compensating writes.
 *
 * @section secrets Secrets
 * Raw keys are wiped from the inputs once hashed and encrypted. Decrypted
 * secrets are only ever returned inside a SecureString, and the record
 * cache holds encrypted records only.
 */

#pragma once

#include "ICryptoService.h"
#include "KeyValidationService.h"
#include "StorageTypes.h"
#include "../CredentialError.h"
#include "../repositories/IBlobStore.h"
#include "../repositories/IIndexStore.h"
#include "../validation/ValidationCache.h"
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace KeyWarden {

class CredentialStorageService {
public:
    static constexpr std::string_view METADATA_COLLECTION = "api_key_metadata";
    static constexpr std::string_view RECORD_PREFIX = "api_key_";
    static constexpr std::string_view HASH_PREFIX = "api_key_hash_";
    static constexpr std::string_view DEFAULT_ROTATION_REASON = "Manual rotation";

    /**
     * @brief Construct the service
     * @param crypto Non-owning crypto session
     * @param index_store Non-owning metadata store
     * @param blob_store Non-owning record store
     * @param validator Non-owning validation engine
     * @param config Cache and passphrase settings
     * @throws std::invalid_argument if any collaborator is null
     */
    CredentialStorageService(ICryptoService* crypto,
                             IIndexStore* index_store,
                             IBlobStore* blob_store,
                             KeyValidationService* validator,
                             StorageConfig config = {});

    ~CredentialStorageService() = default;

    CredentialStorageService(const CredentialStorageService&) = delete;
    CredentialStorageService& operator=(const CredentialStorageService&) = delete;
    CredentialStorageService(CredentialStorageService&&) = delete;
    CredentialStorageService& operator=(CredentialStorageService&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open the crypto session and load existing records
     *
     * Records already present in the blob store (for example a FileBlobStore
     * from a previous run) are re-indexed: missing metadata entries and
     * hash-index entries are rebuilt from the stored records.
     *
     * @return AlreadyInitialized, WeakPassphrase, EncryptionFailed or
     *         StorageFailed on failure
     */
    [[nodiscard]] CredentialResult<> initialize_storage(const Glib::ustring& passphrase);

    /** @brief End the session without discarding the derived key */
    void lock();

    /** @brief Re-open a locked session */
    [[nodiscard]] CredentialResult<> unlock(const Glib::ustring& passphrase);

    /** @brief Drop all caches, wipe the session key and return to Uninitialized */
    void shutdown();

    [[nodiscard]] StorageState state() const;

    // ========================================================================
    // CRUD
    // ========================================================================

    /**
     * @brief Validate, deduplicate, encrypt and persist a new key
     *
     * The raw key in input is wiped before returning, on every path.
     *
     * @return The stored record, or InvalidFormat, DuplicateKey,
     *         EncryptionFailed, StorageFailed
     */
    [[nodiscard]] CredentialResult<keywarden::EncryptedCredential> add_key(AddKeyInput input);

    /**
     * @brief Load, verify and decrypt a record
     * @return NotFound, IntegrityCheckFailed or DecryptionFailed on failure
     */
    [[nodiscard]] CredentialResult<DecryptedCredential> get_key(std::string_view id);

    /**
     * @brief Load and verify a record without decrypting it
     */
    [[nodiscard]] CredentialResult<keywarden::EncryptedCredential> get_record(std::string_view id);

    /**
     * @brief Merge a metadata patch; the secret is never touched
     */
    [[nodiscard]] CredentialResult<keywarden::EncryptedCredential> update_key(std::string_view id,
                                                                            const KeyUpdate& update);

    /**
     * @brief Hard delete: metadata, record and hash entry
     * @return false if the id is unknown
     */
    [[nodiscard]] CredentialResult<bool> delete_key(std::string_view id);

    /**
     * @brief Soft delete: status becomes revoked, the record is kept
     * @return false if the id is unknown
     */
    [[nodiscard]] CredentialResult<bool> revoke_key(std::string_view id);

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Filter, sort and paginate metadata
     *
     * Never decrypts. Listed metadata reports effective_status(), so a key
     * past its expires_at shows as expired.
     */
    [[nodiscard]] CredentialResult<ListResult> list_keys(const ListOptions& options = {});

    [[nodiscard]] CredentialResult<std::vector<keywarden::CredentialMetadata>>
        get_keys_by_provider(keywarden::Provider provider);

    // ========================================================================
    // Rotation
    // ========================================================================

    /**
     * @brief Replace a record's secret, keeping its id and history
     *
     * The new key is validated before storage is touched. On any failure
     * after that point the previous record, hash entry and metadata are
     * restored and a failed history entry is appended.
     *
     * @return Precondition errors and NotFound as errors; every other
     *         outcome is described by RotationResult
     */
    [[nodiscard]] CredentialResult<RotationResult> rotate_key(std::string_view id,
                                                              std::string new_raw_key,
                                                              std::string_view reason = DEFAULT_ROTATION_REASON);

    // ========================================================================
    // Usage
    // ========================================================================

    /**
     * @brief Accumulate a usage report into the record's statistics
     *
     * The average response time is weighted by request count. Daily, weekly
     * and monthly buckets restart once their period has elapsed.
     */
    [[nodiscard]] CredentialResult<> record_usage(std::string_view id, const UsageRecord& usage);

    [[nodiscard]] CredentialResult<keywarden::UsageStats> get_key_usage_stats(std::string_view id);

    /**
     * @brief Probe the provider with the stored key
     *
     * The secret is decrypted only for the duration of the probe and never
     * logged or returned.
     */
    [[nodiscard]] CredentialResult<ConnectionTestResult> test_key_connection(std::string_view id,
                                                                             std::stop_token stop = {});

    // ========================================================================
    // Export / Import
    // ========================================================================

    /**
     * @brief Snapshot all records
     * @param include_secrets Include encrypted records; secrets stay encrypted
     */
    [[nodiscard]] CredentialResult<keywarden::ExportBundle> export_keys(bool include_secrets = false);

    /**
     * @brief Restore records from a bundle
     *
     * Each entry is imported independently. Entries without an encrypted
     * record, with a failing checksum or with a key already stored fail
     * individually.
     */
    [[nodiscard]] CredentialResult<ImportResult> import_keys(const keywarden::ExportBundle& bundle);

    // ========================================================================
    // Maintenance
    // ========================================================================

    /** @brief Drop the record cache and the validation caches */
    void clear_cache();

    /**
     * @brief Crypto, session and store checks; healthy when none fails
     */
    [[nodiscard]] HealthReport get_health_status() const;

    [[nodiscard]] StorageMetrics metrics() const;

    [[nodiscard]] static std::string record_key(std::string_view id);
    [[nodiscard]] static std::string hash_key_entry(std::string_view key_hash);

private:
    // All *_locked helpers expect m_mutex to be held
    [[nodiscard]] CredentialResult<> require_ready_locked() const;
    [[nodiscard]] CredentialResult<keywarden::EncryptedCredential> load_record_locked(std::string_view id);
    [[nodiscard]] CredentialResult<> store_record_locked(const keywarden::EncryptedCredential& record,
                                                         const keywarden::EncryptedCredential& previous);
    [[nodiscard]] bool verify_record_locked(const keywarden::EncryptedCredential& record) const;
    [[nodiscard]] std::string payload_checksum_locked(const keywarden::EncryptedPayload& payload) const;
    [[nodiscard]] CredentialResult<std::optional<std::string>> find_id_by_hash_locked(
        std::string_view key_hash) const;
    [[nodiscard]] CredentialResult<> rebuild_indices_locked();
    void count_operation_locked(std::string_view name);

    RotationResult fail_rotation_locked(const keywarden::EncryptedCredential& snapshot,
                                        std::string_view reason,
                                        std::string error);

    ICryptoService* m_crypto;
    IIndexStore* m_index_store;
    IBlobStore* m_blob_store;
    KeyValidationService* m_validator;
    StorageConfig m_config;

    mutable std::mutex m_mutex;
    StorageState m_state = StorageState::Uninitialized;
    ValidationCache<keywarden::EncryptedCredential> m_record_cache;
    StorageMetrics m_metrics;
};

} // namespace KeyWarden
