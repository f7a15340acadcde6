// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "CredentialStorageService.h"
#include "../CredentialTypes.h"
#include "../ProviderRules.h"
#include "../validation/KeyAnalysis.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <charconv>
#include <format>
#include <stdexcept>

namespace KeyWarden {

namespace {

/**
 * @brief Wipes a string holding key material when leaving scope
 */
class KeyWiper {
public:
    explicit KeyWiper(std::string& key) : m_key(key) {}
    ~KeyWiper() { secure_clear_string(m_key); }

    KeyWiper(const KeyWiper&) = delete;
    KeyWiper& operator=(const KeyWiper&) = delete;

private:
    std::string& m_key;
};

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

void accumulate_period(keywarden::UsagePeriod* period, int64_t length_ms, int64_t now,
                       const UsageRecord& usage) {
    if (period->period_start() == 0 || now - period->period_start() >= length_ms) {
        period->Clear();
        period->set_period_start(now);
    }
    period->set_requests(period->requests() + usage.requests);
    period->set_tokens(period->tokens() + usage.tokens);
    period->set_cost(period->cost() + usage.cost);
}

bool contains_folded(const std::string& haystack, const Glib::ustring& folded_needle) {
    return Glib::ustring(haystack).casefold().find(folded_needle) != Glib::ustring::npos;
}

bool matches_search(const keywarden::CredentialMetadata& metadata, const Glib::ustring& folded_needle) {
    if (contains_folded(metadata.name(), folded_needle)) {
        return true;
    }
    return metadata.has_description() && contains_folded(metadata.description(), folded_needle);
}

bool less_by(SortField field,
             const keywarden::CredentialMetadata& a,
             const keywarden::CredentialMetadata& b) {
    switch (field) {
        case SortField::NAME:
            return Glib::ustring(a.name()).casefold().raw() < Glib::ustring(b.name()).casefold().raw();
        case SortField::CREATED_AT:
            return a.created_at() < b.created_at();
        case SortField::LAST_USED:
            return a.last_used() < b.last_used();
        case SortField::PROVIDER:
            return to_string(a.provider()) < to_string(b.provider());
    }
    return false;
}

std::string payload_bytes(const keywarden::EncryptedPayload& payload) {
    return payload.cipher() + payload.iv();
}

} // anonymous namespace

CredentialStorageService::CredentialStorageService(ICryptoService* crypto,
                                                   IIndexStore* index_store,
                                                   IBlobStore* blob_store,
                                                   KeyValidationService* validator,
                                                   StorageConfig config)
    : m_crypto(crypto)
    , m_index_store(index_store)
    , m_blob_store(blob_store)
    , m_validator(validator)
    , m_config(config)
    , m_record_cache(config.record_cache_ttl, config.record_cache_size) {
    if (!m_crypto) {
        throw std::invalid_argument("CredentialStorageService: crypto cannot be null");
    }
    if (!m_index_store) {
        throw std::invalid_argument("CredentialStorageService: index_store cannot be null");
    }
    if (!m_blob_store) {
        throw std::invalid_argument("CredentialStorageService: blob_store cannot be null");
    }
    if (!m_validator) {
        throw std::invalid_argument("CredentialStorageService: validator cannot be null");
    }
}

std::string CredentialStorageService::record_key(std::string_view id) {
    return std::format("{}{}", RECORD_PREFIX, id);
}

std::string CredentialStorageService::hash_key_entry(std::string_view key_hash) {
    return std::format("{}{}", HASH_PREFIX, key_hash);
}

// ============================================================================
// Lifecycle
// ============================================================================

CredentialResult<> CredentialStorageService::initialize_storage(const Glib::ustring& passphrase) {
    std::lock_guard lock(m_mutex);

    if (m_state == StorageState::Ready || m_state == StorageState::Locked) {
        return std::unexpected(CredentialError::AlreadyInitialized);
    }
    if (passphrase.length() < m_config.min_passphrase_length) {
        return std::unexpected(CredentialError::WeakPassphrase);
    }

    m_state = StorageState::Initializing;

    if (auto result = m_crypto->initialize(passphrase); !result) {
        Log::error("Failed to initialize credential storage: {}", to_string(result.error()));
        m_state = StorageState::Uninitialized;
        return std::unexpected(result.error());
    }

    if (auto result = rebuild_indices_locked(); !result) {
        Log::error("Failed to initialize credential storage: {}", to_string(result.error()));
        m_crypto->shutdown();
        m_state = StorageState::Uninitialized;
        return std::unexpected(result.error());
    }

    m_state = StorageState::Ready;
    Log::info("Credential storage initialized ({} keys)", m_metrics.total_keys);
    return {};
}

CredentialResult<> CredentialStorageService::rebuild_indices_locked() {
    if (!m_index_store->is_available() || !m_blob_store->is_available()) {
        return std::unexpected(CredentialError::StorageFailed);
    }

    auto keys = m_blob_store->list_keys(RECORD_PREFIX);
    if (!keys) {
        return std::unexpected(CredentialError::StorageFailed);
    }

    size_t count = 0;
    for (const auto& key : *keys) {
        if (key.starts_with(HASH_PREFIX)) {
            continue;
        }

        auto blob = m_blob_store->get(key);
        keywarden::EncryptedCredential record;
        if (!blob || !record.ParseFromString(*blob) || record.id().empty()) {
            Log::warning("Skipping unreadable record {}", key);
            continue;
        }
        if (!verify_record_locked(record)) {
            Log::warning("Skipping record {} with failing checksum", record.id());
            continue;
        }

        if (!m_index_store->get(METADATA_COLLECTION, record.id())) {
            if (!m_index_store->put(METADATA_COLLECTION, record.metadata())) {
                return std::unexpected(CredentialError::StorageFailed);
            }
        }
        const std::string hash_entry = hash_key_entry(record.key_hash());
        if (!m_blob_store->get(hash_entry)) {
            if (!m_blob_store->set(hash_entry, record.id())) {
                return std::unexpected(CredentialError::StorageFailed);
            }
        }
        ++count;
    }

    m_metrics.total_keys = count;
    return {};
}

void CredentialStorageService::lock() {
    std::lock_guard lock(m_mutex);
    if (m_state != StorageState::Ready) {
        return;
    }
    m_crypto->lock();
    m_record_cache.clear();
    m_state = StorageState::Locked;
    Log::info("Credential storage locked");
}

CredentialResult<> CredentialStorageService::unlock(const Glib::ustring& passphrase) {
    std::lock_guard lock(m_mutex);

    if (m_state == StorageState::Uninitialized || m_state == StorageState::Initializing) {
        return std::unexpected(CredentialError::NotInitialized);
    }
    if (auto result = m_crypto->unlock(passphrase); !result) {
        return std::unexpected(result.error());
    }
    m_state = StorageState::Ready;
    Log::info("Credential storage unlocked");
    return {};
}

void CredentialStorageService::shutdown() {
    std::lock_guard lock(m_mutex);
    m_record_cache.clear();
    m_validator->clear_caches();
    m_crypto->shutdown();
    m_state = StorageState::Uninitialized;
    Log::info("Credential storage shut down");
}

StorageState CredentialStorageService::state() const {
    std::lock_guard lock(m_mutex);
    if (m_state == StorageState::Ready && !m_crypto->is_session_active()) {
        return StorageState::Locked;
    }
    return m_state;
}

// ============================================================================
// Internal helpers
// ============================================================================

CredentialResult<> CredentialStorageService::require_ready_locked() const {
    if (m_state == StorageState::Uninitialized || m_state == StorageState::Initializing ||
        !m_crypto->is_initialized()) {
        return std::unexpected(CredentialError::NotInitialized);
    }
    if (m_state == StorageState::Locked || !m_crypto->is_session_active()) {
        return std::unexpected(CredentialError::SessionExpired);
    }
    return {};
}

void CredentialStorageService::count_operation_locked(std::string_view name) {
    ++m_metrics.operation_counts[std::string(name)];
}

std::string CredentialStorageService::payload_checksum_locked(const keywarden::EncryptedPayload& payload) const {
    return m_crypto->checksum(payload_bytes(payload));
}

bool CredentialStorageService::verify_record_locked(const keywarden::EncryptedCredential& record) const {
    return m_crypto->verify_checksum(payload_bytes(record.encrypted_payload()), record.checksum());
}

CredentialResult<std::optional<std::string>>
CredentialStorageService::find_id_by_hash_locked(std::string_view key_hash) const {
    auto id = m_blob_store->get(hash_key_entry(key_hash));
    if (!id) {
        if (id.error() == StoreError::NOT_FOUND) {
            return std::optional<std::string>{};
        }
        return std::unexpected(CredentialError::StorageFailed);
    }

    // An entry left behind by an interrupted delete does not count
    auto metadata = m_index_store->get(METADATA_COLLECTION, *id);
    if (!metadata) {
        if (metadata.error() == StoreError::NOT_FOUND) {
            return std::optional<std::string>{};
        }
        return std::unexpected(CredentialError::StorageFailed);
    }
    return std::optional<std::string>(std::move(*id));
}

CredentialResult<keywarden::EncryptedCredential>
CredentialStorageService::load_record_locked(std::string_view id) {
    if (auto cached = m_record_cache.get(id)) {
        ++m_metrics.cache_hits;
        return std::move(*cached);
    }
    ++m_metrics.cache_misses;

    auto metadata = m_index_store->get(METADATA_COLLECTION, id);
    if (!metadata) {
        if (metadata.error() == StoreError::NOT_FOUND) {
            return std::unexpected(CredentialError::NotFound);
        }
        Log::error("Failed to read metadata for {}: {}", id, to_string(metadata.error()));
        return std::unexpected(CredentialError::StorageFailed);
    }

    auto blob = m_blob_store->get(record_key(id));
    if (!blob) {
        if (blob.error() == StoreError::NOT_FOUND) {
            return std::unexpected(CredentialError::NotFound);
        }
        Log::error("Failed to read record {}: {}", id, to_string(blob.error()));
        return std::unexpected(CredentialError::StorageFailed);
    }

    keywarden::EncryptedCredential record;
    if (!record.ParseFromString(*blob)) {
        Log::error("Record {} is not a valid credential", id);
        return std::unexpected(CredentialError::IntegrityCheckFailed);
    }
    if (!verify_record_locked(record)) {
        Log::error("Data integrity check failed for {}", id);
        return std::unexpected(CredentialError::IntegrityCheckFailed);
    }

    *record.mutable_metadata() = std::move(*metadata);
    m_record_cache.put(id, record);
    return record;
}

CredentialResult<> CredentialStorageService::store_record_locked(
    const keywarden::EncryptedCredential& record,
    const keywarden::EncryptedCredential& previous) {

    std::string bytes;
    if (!record.SerializeToString(&bytes)) {
        return std::unexpected(CredentialError::SerializationFailed);
    }

    m_record_cache.erase(record.id());

    if (auto result = m_blob_store->set(record_key(record.id()), bytes); !result) {
        Log::error("Failed to write record {}: {}", record.id(), to_string(result.error()));
        return std::unexpected(CredentialError::StorageFailed);
    }
    if (auto result = m_index_store->put(METADATA_COLLECTION, record.metadata()); !result) {
        Log::error("Failed to write metadata for {}: {}", record.id(), to_string(result.error()));
        std::string previous_bytes;
        if (!previous.SerializeToString(&previous_bytes) ||
            !m_blob_store->set(record_key(record.id()), previous_bytes)) {
            Log::error("Failed to restore record {}", record.id());
        }
        return std::unexpected(CredentialError::StorageFailed);
    }
    return {};
}

// ============================================================================
// CRUD
// ============================================================================

CredentialResult<keywarden::EncryptedCredential> CredentialStorageService::add_key(AddKeyInput input) {
    KeyWiper wipe_input(input.key);
    std::lock_guard lock(m_mutex);
    count_operation_locked("add");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    try {
        std::string sanitized = sanitize_key(input.key);
        KeyWiper wipe_sanitized(sanitized);

        const auto provider = input.provider ? input.provider : detect_provider(sanitized);
        if (!provider) {
            Log::info("Rejected new key: could not detect provider");
            return std::unexpected(CredentialError::InvalidFormat);
        }

        const ValidationResult validation = m_validator->validate_format(sanitized, *provider);
        if (!validation.is_valid) {
            Log::info("Rejected new {} key: {}", to_string(*provider), join(validation.errors, ", "));
            return std::unexpected(CredentialError::InvalidFormat);
        }

        const std::string key_hash = m_crypto->hash_key(sanitized);
        auto existing = find_id_by_hash_locked(key_hash);
        if (!existing) {
            return std::unexpected(existing.error());
        }
        if (*existing) {
            Log::info("Rejected new {} key: duplicate of {}", to_string(*provider), **existing);
            return std::unexpected(CredentialError::DuplicateKey);
        }

        auto payload = m_crypto->encrypt(sanitized);
        if (!payload) {
            Log::error("Failed to add API key: {}", to_string(payload.error()));
            if (payload.error() == CredentialError::SessionExpired) {
                return std::unexpected(payload.error());
            }
            return std::unexpected(CredentialError::EncryptionFailed);
        }

        const int64_t now = now_ms();
        const std::string id = generate_key_id(*provider, key_hash);

        keywarden::EncryptedCredential record;
        record.set_id(id);

        auto* metadata = record.mutable_metadata();
        metadata->set_id(id);
        metadata->set_provider(*provider);
        metadata->set_key_type(validation.key_type);
        metadata->set_status(keywarden::KEY_STATUS_ACTIVE);
        metadata->set_name(input.name);
        if (input.description) {
            metadata->set_description(*input.description);
        }
        metadata->set_created_at(now);
        metadata->set_last_used(now);
        if (input.expires_at) {
            metadata->set_expires_at(*input.expires_at);
        }
        metadata->set_masked_key(mask_key(Glib::ustring(sanitized)));
        const auto permissions = input.permissions.empty() ? default_permissions() : input.permissions;
        for (const auto permission : permissions) {
            metadata->add_permissions(permission);
        }
        for (const auto& tag : input.tags) {
            metadata->add_tags(tag);
        }

        *record.mutable_encrypted_payload() = std::move(*payload);
        record.set_key_hash(key_hash);
        record.set_checksum(payload_checksum_locked(record.encrypted_payload()));

        if (input.configuration) {
            *record.mutable_configuration() = *input.configuration;
        } else {
            record.mutable_configuration()->mutable_security()->set_encryption_level(
                keywarden::ENCRYPTION_LEVEL_STANDARD);
        }
        *record.mutable_usage_stats() = make_empty_usage_stats(now);
        record.mutable_rotation_status()->set_status(keywarden::ROTATION_STATE_NONE);
        record.set_storage_version(STORAGE_VERSION);

        std::string bytes;
        if (!record.SerializeToString(&bytes)) {
            return std::unexpected(CredentialError::SerializationFailed);
        }

        // Metadata, then record, then hash entry; undo in reverse on failure
        if (auto result = m_index_store->put(METADATA_COLLECTION, *metadata); !result) {
            Log::error("Failed to add API key: metadata write failed ({})", to_string(result.error()));
            return std::unexpected(CredentialError::StorageFailed);
        }
        if (auto result = m_blob_store->set(record_key(id), bytes); !result) {
            Log::error("Failed to add API key: record write failed ({})", to_string(result.error()));
            if (!m_index_store->remove(METADATA_COLLECTION, id)) {
                Log::error("Rollback of {} left metadata behind", id);
            }
            return std::unexpected(CredentialError::StorageFailed);
        }
        if (auto result = m_blob_store->set(hash_key_entry(key_hash), id); !result) {
            Log::error("Failed to add API key: hash index write failed ({})", to_string(result.error()));
            if (!m_blob_store->remove(record_key(id))) {
                Log::error("Rollback of {} left the record behind", id);
            }
            if (!m_index_store->remove(METADATA_COLLECTION, id)) {
                Log::error("Rollback of {} left metadata behind", id);
            }
            return std::unexpected(CredentialError::StorageFailed);
        }

        ++m_metrics.total_keys;
        Log::info("Added {} key {} ({})", to_string(*provider), id, metadata->masked_key());
        return record;
    } catch (const std::exception& e) {
        Log::error("Failed to add API key: {}", e.what());
        return std::unexpected(CredentialError::StorageFailed);
    }
}

CredentialResult<DecryptedCredential> CredentialStorageService::get_key(std::string_view id) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("get");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    auto record = load_record_locked(id);
    if (!record) {
        return std::unexpected(record.error());
    }

    auto secret = m_crypto->decrypt(record->encrypted_payload());
    if (!secret) {
        Log::error("Failed to decrypt key {}: {}", id, to_string(secret.error()));
        if (secret.error() == CredentialError::SessionExpired) {
            return std::unexpected(secret.error());
        }
        return std::unexpected(CredentialError::DecryptionFailed);
    }

    return DecryptedCredential{std::move(*record), std::move(*secret)};
}

CredentialResult<keywarden::EncryptedCredential> CredentialStorageService::get_record(std::string_view id) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("get");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }
    return load_record_locked(id);
}

CredentialResult<keywarden::EncryptedCredential> CredentialStorageService::update_key(
    std::string_view id, const KeyUpdate& update) {

    std::lock_guard lock(m_mutex);
    count_operation_locked("update");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    // expired is derived from expires_at and rotating belongs to rotate_key()
    if (update.status && (*update.status == keywarden::KEY_STATUS_EXPIRED ||
                          *update.status == keywarden::KEY_STATUS_ROTATING)) {
        Log::warning("Refusing to set status {} on {}", to_string(*update.status), id);
        return std::unexpected(CredentialError::InvalidFormat);
    }

    try {
        auto existing = load_record_locked(id);
        if (!existing) {
            return std::unexpected(existing.error());
        }

        keywarden::EncryptedCredential updated = *existing;
        auto* metadata = updated.mutable_metadata();

        if (update.name) {
            metadata->set_name(*update.name);
        }
        if (update.description) {
            metadata->set_description(*update.description);
        }
        if (update.tags) {
            metadata->clear_tags();
            for (const auto& tag : *update.tags) {
                metadata->add_tags(tag);
            }
        }
        if (update.permissions) {
            metadata->clear_permissions();
            for (const auto permission : *update.permissions) {
                metadata->add_permissions(permission);
            }
        }
        if (update.status) {
            metadata->set_status(*update.status);
        }
        if (update.expires_at) {
            metadata->set_expires_at(*update.expires_at);
        }
        if (update.configuration) {
            // Each sub-config present in the patch replaces the stored one
            const auto& patch = *update.configuration;
            auto* configuration = updated.mutable_configuration();
            if (patch.has_rate_limit()) {
                *configuration->mutable_rate_limit() = patch.rate_limit();
            }
            if (patch.has_endpoint()) {
                *configuration->mutable_endpoint() = patch.endpoint();
            }
            if (patch.has_proxy()) {
                *configuration->mutable_proxy() = patch.proxy();
            }
            if (patch.has_rotation()) {
                *configuration->mutable_rotation() = patch.rotation();
            }
            if (patch.has_security()) {
                *configuration->mutable_security() = patch.security();
            }
        }
        metadata->set_last_used(now_ms());

        if (auto result = store_record_locked(updated, *existing); !result) {
            Log::error("Failed to update API key {}", id);
            return std::unexpected(result.error());
        }

        Log::info("Updated key {}", id);
        return updated;
    } catch (const std::exception& e) {
        Log::error("Failed to update API key {}: {}", id, e.what());
        return std::unexpected(CredentialError::StorageFailed);
    }
}

CredentialResult<bool> CredentialStorageService::delete_key(std::string_view id) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("delete");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    try {
        // A corrupted record must stay deletable, so no checksum gate here
        auto metadata = m_index_store->get(METADATA_COLLECTION, id);
        if (!metadata) {
            if (metadata.error() == StoreError::NOT_FOUND) {
                return false;
            }
            return std::unexpected(CredentialError::StorageFailed);
        }

        std::optional<std::string> key_hash;
        if (auto blob = m_blob_store->get(record_key(id))) {
            keywarden::EncryptedCredential record;
            if (record.ParseFromString(*blob)) {
                key_hash = record.key_hash();
            }
        }

        if (auto result = m_index_store->remove(METADATA_COLLECTION, id); !result) {
            Log::error("Failed to delete API key {}: {}", id, to_string(result.error()));
            return std::unexpected(CredentialError::StorageFailed);
        }
        if (auto result = m_blob_store->remove(record_key(id));
            !result && result.error() != StoreError::NOT_FOUND) {
            Log::error("Failed to delete API key {}: {}", id, to_string(result.error()));
            if (!m_index_store->put(METADATA_COLLECTION, *metadata)) {
                Log::error("Rollback of delete {} lost its metadata", id);
            }
            return std::unexpected(CredentialError::StorageFailed);
        }
        if (key_hash) {
            if (auto result = m_blob_store->remove(hash_key_entry(*key_hash));
                !result && result.error() != StoreError::NOT_FOUND) {
                Log::warning("Hash entry of deleted key {} was not released", id);
            }
        }

        m_record_cache.erase(id);
        if (m_metrics.total_keys > 0) {
            --m_metrics.total_keys;
        }
        Log::info("Deleted key {}", id);
        return true;
    } catch (const std::exception& e) {
        Log::error("Failed to delete API key {}: {}", id, e.what());
        return std::unexpected(CredentialError::StorageFailed);
    }
}

CredentialResult<bool> CredentialStorageService::revoke_key(std::string_view id) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("revoke");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    auto existing = load_record_locked(id);
    if (!existing) {
        if (existing.error() == CredentialError::NotFound) {
            return false;
        }
        return std::unexpected(existing.error());
    }
    if (existing->metadata().status() == keywarden::KEY_STATUS_REVOKED) {
        return true;
    }

    keywarden::EncryptedCredential revoked = *existing;
    revoked.mutable_metadata()->set_status(keywarden::KEY_STATUS_REVOKED);
    if (auto result = store_record_locked(revoked, *existing); !result) {
        return std::unexpected(result.error());
    }

    Log::info("Revoked key {}", id);
    return true;
}

// ============================================================================
// Queries
// ============================================================================

CredentialResult<ListResult> CredentialStorageService::list_keys(const ListOptions& options) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("list");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    size_t offset = options.offset;
    if (options.cursor) {
        const auto& cursor = *options.cursor;
        const auto [ptr, ec] = std::from_chars(cursor.data(), cursor.data() + cursor.size(), offset);
        if (ec != std::errc{} || ptr != cursor.data() + cursor.size()) {
            return std::unexpected(CredentialError::InvalidFormat);
        }
    }

    auto source = options.provider
        ? m_index_store->query(METADATA_COLLECTION, IndexField::PROVIDER, to_string(*options.provider), {})
        : m_index_store->get_all(METADATA_COLLECTION);
    if (!source) {
        Log::error("Failed to list API keys: {}", to_string(source.error()));
        return std::unexpected(CredentialError::StorageFailed);
    }

    const int64_t now = now_ms();
    std::optional<Glib::ustring> needle;
    if (options.search && !options.search->empty()) {
        needle = Glib::ustring(*options.search).casefold();
    }

    std::vector<keywarden::CredentialMetadata> matches;
    for (auto& metadata : *source) {
        metadata.set_status(effective_status(metadata, now));

        if (options.status && metadata.status() != *options.status) {
            continue;
        }
        if (options.key_type && metadata.key_type() != *options.key_type) {
            continue;
        }
        if (!options.tags.empty()) {
            const bool tagged = std::ranges::any_of(options.tags, [&](const std::string& tag) {
                return std::find(metadata.tags().begin(), metadata.tags().end(), tag) != metadata.tags().end();
            });
            if (!tagged) {
                continue;
            }
        }
        if (needle && !matches_search(metadata, *needle)) {
            continue;
        }
        matches.push_back(std::move(metadata));
    }

    if (options.sort_by) {
        const SortField field = *options.sort_by;
        const bool descending = options.sort_order == SortOrder::DESC;
        std::ranges::stable_sort(matches, [&](const auto& a, const auto& b) {
            return descending ? less_by(field, b, a) : less_by(field, a, b);
        });
    }

    ListResult result;
    result.total = matches.size();

    const size_t begin = std::min(offset, matches.size());
    const size_t available = matches.size() - begin;
    const size_t count = std::min(options.limit.value_or(available), available);
    const size_t end = begin + count;

    result.keys.assign(std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(begin)),
                       std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(end)));
    result.has_more = end < result.total;
    if (result.has_more) {
        result.next_cursor = std::to_string(end);
    }
    return result;
}

CredentialResult<std::vector<keywarden::CredentialMetadata>>
CredentialStorageService::get_keys_by_provider(keywarden::Provider provider) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("list");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    auto keys = m_index_store->query(METADATA_COLLECTION, IndexField::PROVIDER, to_string(provider), {});
    if (!keys) {
        Log::error("Failed to get keys for provider {}: {}", to_string(provider), to_string(keys.error()));
        return std::unexpected(CredentialError::StorageFailed);
    }
    return std::move(*keys);
}

// ============================================================================
// Rotation
// ============================================================================

RotationResult CredentialStorageService::fail_rotation_locked(const keywarden::EncryptedCredential& snapshot,
                                                              std::string_view reason,
                                                              std::string error) {
    keywarden::EncryptedCredential restored = snapshot;
    auto* rotation = restored.mutable_rotation_status();
    rotation->set_status(keywarden::ROTATION_STATE_FAILED);

    auto* entry = rotation->add_history();
    entry->set_timestamp(now_ms());
    entry->set_success(false);
    entry->set_reason(std::format("{} ({})", reason, error));
    entry->set_old_key_id(snapshot.id());

    bool restored_ok = true;
    std::string bytes;
    if (!restored.SerializeToString(&bytes) || !m_blob_store->set(record_key(snapshot.id()), bytes)) {
        // Last resort: the untouched snapshot, without the failure entry
        std::string snapshot_bytes;
        restored_ok = snapshot.SerializeToString(&snapshot_bytes) &&
                      m_blob_store->set(record_key(snapshot.id()), snapshot_bytes).has_value();
    }
    if (!m_index_store->put(METADATA_COLLECTION, snapshot.metadata())) {
        restored_ok = false;
    }
    m_record_cache.erase(snapshot.id());

    if (restored_ok) {
        Log::warning("Rotation of {} failed and was rolled back: {}", snapshot.id(), error);
    } else {
        Log::error("Rotation of {} failed and could not be rolled back: {}", snapshot.id(), error);
    }

    RotationResult result;
    result.success = false;
    result.error = std::move(error);
    result.rollback_available = restored_ok;
    return result;
}

CredentialResult<RotationResult> CredentialStorageService::rotate_key(std::string_view id,
                                                                      std::string new_raw_key,
                                                                      std::string_view reason) {
    KeyWiper wipe_input(new_raw_key);
    std::lock_guard lock(m_mutex);
    count_operation_locked("rotate");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    auto existing = load_record_locked(id);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    const keywarden::EncryptedCredential snapshot = std::move(*existing);
    const auto provider = snapshot.metadata().provider();

    std::string sanitized = sanitize_key(new_raw_key);
    KeyWiper wipe_sanitized(sanitized);

    // Rejections below happen before any write
    RotationResult rejected;
    const ValidationResult validation = m_validator->validate_format(sanitized, provider);
    if (!validation.is_valid) {
        rejected.error = std::format("Invalid API key format: {}", join(validation.errors, ", "));
        Log::info("Rotation of {} rejected: {}", id, *rejected.error);
        return rejected;
    }

    const std::string new_hash = m_crypto->hash_key(sanitized);
    if (new_hash == snapshot.key_hash()) {
        rejected.error = "New key is identical to the current key";
        return rejected;
    }
    auto duplicate = find_id_by_hash_locked(new_hash);
    if (!duplicate) {
        rejected.error = std::string(to_string(duplicate.error()));
        return rejected;
    }
    if (*duplicate) {
        rejected.error = std::string(to_string(CredentialError::DuplicateKey));
        return rejected;
    }

    try {
        keywarden::CredentialMetadata rotating = snapshot.metadata();
        rotating.set_status(keywarden::KEY_STATUS_ROTATING);
        if (!m_index_store->put(METADATA_COLLECTION, rotating)) {
            return fail_rotation_locked(snapshot, reason, std::string(to_string(CredentialError::StorageFailed)));
        }
        m_record_cache.erase(id);

        auto payload = m_crypto->encrypt(sanitized);
        if (!payload) {
            return fail_rotation_locked(snapshot, reason, std::string(to_string(payload.error())));
        }

        const int64_t now = now_ms();
        keywarden::EncryptedCredential rotated = snapshot;
        *rotated.mutable_encrypted_payload() = std::move(*payload);
        rotated.set_key_hash(new_hash);
        rotated.set_checksum(payload_checksum_locked(rotated.encrypted_payload()));

        auto* metadata = rotated.mutable_metadata();
        metadata->set_masked_key(mask_key(Glib::ustring(sanitized)));
        metadata->set_last_used(now);
        if (metadata->status() == keywarden::KEY_STATUS_ROTATING) {
            metadata->set_status(keywarden::KEY_STATUS_ACTIVE);
        }

        auto* rotation = rotated.mutable_rotation_status();
        rotation->set_status(keywarden::ROTATION_STATE_COMPLETED);
        rotation->set_last_rotation(now);
        const auto& config = rotated.configuration();
        if (config.has_rotation() && config.rotation().enabled() && config.rotation().interval_days() > 0) {
            rotation->set_next_scheduled_rotation(
                now + static_cast<int64_t>(config.rotation().interval_days()) * MS_PER_DAY);
        }
        auto* entry = rotation->add_history();
        entry->set_timestamp(now);
        entry->set_success(true);
        entry->set_reason(std::string(reason));
        entry->set_old_key_id(std::string(id));
        entry->set_new_key_id(std::string(id));

        std::string bytes;
        if (!rotated.SerializeToString(&bytes)) {
            return fail_rotation_locked(snapshot, reason,
                                        std::string(to_string(CredentialError::SerializationFailed)));
        }

        // New hash entry, record, metadata, then release the old hash entry
        const std::string new_hash_entry = hash_key_entry(new_hash);
        auto release_new_hash = [&] {
            if (!m_blob_store->remove(new_hash_entry)) {
                Log::error("Rollback of {} left a hash entry behind", id);
            }
        };

        if (!m_blob_store->set(new_hash_entry, std::string(id))) {
            return fail_rotation_locked(snapshot, reason, std::string(to_string(CredentialError::StorageFailed)));
        }
        if (!m_blob_store->set(record_key(id), bytes)) {
            release_new_hash();
            return fail_rotation_locked(snapshot, reason, std::string(to_string(CredentialError::StorageFailed)));
        }
        if (!m_index_store->put(METADATA_COLLECTION, rotated.metadata())) {
            release_new_hash();
            return fail_rotation_locked(snapshot, reason, std::string(to_string(CredentialError::StorageFailed)));
        }
        if (auto result = m_blob_store->remove(hash_key_entry(snapshot.key_hash()));
            !result && result.error() != StoreError::NOT_FOUND) {
            release_new_hash();
            return fail_rotation_locked(snapshot, reason, std::string(to_string(CredentialError::StorageFailed)));
        }

        m_record_cache.erase(id);
        Log::info("Rotated key {} ({})", id, metadata->masked_key());

        RotationResult result;
        result.success = true;
        result.new_key_id = std::string(id);
        result.rollback_available = true;
        return result;
    } catch (const std::exception& e) {
        return fail_rotation_locked(snapshot, reason, e.what());
    }
}

// ============================================================================
// Usage
// ============================================================================

CredentialResult<> CredentialStorageService::record_usage(std::string_view id, const UsageRecord& usage) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("usage");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    auto existing = load_record_locked(id);
    if (!existing) {
        return std::unexpected(existing.error());
    }

    const int64_t now = now_ms();
    keywarden::EncryptedCredential updated = *existing;
    if (!updated.has_usage_stats()) {
        *updated.mutable_usage_stats() = make_empty_usage_stats(updated.metadata().created_at());
    }
    auto* stats = updated.mutable_usage_stats();

    const uint64_t previous = stats->total_requests();
    const uint64_t combined = previous + usage.requests;
    if (usage.requests > 0) {
        const double average = previous == 0
            ? usage.response_time_ms
            : (stats->avg_response_time_ms() * static_cast<double>(previous) +
               usage.response_time_ms * static_cast<double>(usage.requests)) / static_cast<double>(combined);
        stats->set_avg_response_time_ms(average);
    }

    const uint64_t failed = std::min(usage.failed_requests, usage.requests);
    stats->set_total_requests(combined);
    stats->set_successful_requests(stats->successful_requests() + usage.requests - failed);
    stats->set_failed_requests(stats->failed_requests() + failed);
    stats->set_input_tokens(stats->input_tokens() + usage.input_tokens);
    stats->set_output_tokens(stats->output_tokens() + usage.output_tokens);
    stats->set_total_tokens(stats->total_tokens() + usage.tokens);
    stats->set_total_cost(stats->total_cost() + usage.cost);

    accumulate_period(stats->mutable_daily(), MS_PER_DAY, now, usage);
    accumulate_period(stats->mutable_weekly(), 7 * MS_PER_DAY, now, usage);
    accumulate_period(stats->mutable_monthly(), 30 * MS_PER_DAY, now, usage);

    updated.mutable_metadata()->set_last_used(now);

    if (auto result = store_record_locked(updated, *existing); !result) {
        Log::error("Failed to record usage for {}", id);
        return std::unexpected(result.error());
    }
    return {};
}

CredentialResult<keywarden::UsageStats> CredentialStorageService::get_key_usage_stats(std::string_view id) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("usage");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    auto record = load_record_locked(id);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (!record->has_usage_stats()) {
        return make_empty_usage_stats(record->metadata().created_at());
    }
    return record->usage_stats();
}

CredentialResult<ConnectionTestResult> CredentialStorageService::test_key_connection(std::string_view id,
                                                                                     std::stop_token stop) {
    ConnectionTestResult result;
    LiveValidationOptions options;
    options.enable_cache = false;
    std::optional<SecureString> secret;

    {
        std::lock_guard lock(m_mutex);
        count_operation_locked("test");

        if (auto ready = require_ready_locked(); !ready) {
            return std::unexpected(ready.error());
        }

        auto record = load_record_locked(id);
        if (!record) {
            return std::unexpected(record.error());
        }

        auto decrypted = m_crypto->decrypt(record->encrypted_payload());
        if (!decrypted) {
            Log::error("Connection test for {} could not decrypt the key: {}", id, to_string(decrypted.error()));
            if (decrypted.error() == CredentialError::SessionExpired) {
                return std::unexpected(decrypted.error());
            }
            return std::unexpected(CredentialError::DecryptionFailed);
        }
        secret = std::move(*decrypted);

        result.provider = record->metadata().provider();
        const auto& config = record->configuration();
        if (config.has_endpoint()) {
            if (!config.endpoint().base_url().empty()) {
                options.base_url = config.endpoint().base_url();
            }
            if (config.endpoint().timeout_ms() > 0) {
                options.timeout = std::chrono::milliseconds(config.endpoint().timeout_ms());
            }
        }
    }

    // The probe runs without holding the service lock
    const LiveValidationResult live = m_validator->validate_live(secret->raw(), result.provider, options, stop);
    secret.reset();

    result.success = live.is_valid;
    result.response_time = live.response_time;
    result.error = live.error;
    result.endpoint = live.endpoint;
    result.status_code = live.status_code;

    Log::info("Connection test for {}: {}", id, result.success ? "ok" : result.error.value_or("failed"));
    return result;
}

// ============================================================================
// Export / Import
// ============================================================================

CredentialResult<keywarden::ExportBundle> CredentialStorageService::export_keys(bool include_secrets) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("export");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }

    auto all = m_index_store->get_all(METADATA_COLLECTION);
    if (!all) {
        Log::error("Failed to export keys: {}", to_string(all.error()));
        return std::unexpected(CredentialError::StorageFailed);
    }

    std::map<std::string, std::string> records;
    if (include_secrets) {
        std::vector<std::string> keys;
        keys.reserve(all->size());
        for (const auto& metadata : *all) {
            keys.push_back(record_key(metadata.id()));
        }
        auto batch = m_blob_store->get_batch(keys);
        if (!batch) {
            Log::error("Failed to export keys: {}", to_string(batch.error()));
            return std::unexpected(CredentialError::StorageFailed);
        }
        records = std::move(*batch);
    }

    keywarden::ExportBundle bundle;
    bundle.set_version(EXPORT_BUNDLE_VERSION);
    bundle.set_timestamp(now_ms());
    bundle.set_include_secrets(include_secrets);

    for (const auto& metadata : *all) {
        auto* entry = bundle.add_keys();
        *entry->mutable_metadata() = metadata;
        if (!include_secrets) {
            continue;
        }
        const auto it = records.find(record_key(metadata.id()));
        if (it == records.end()) {
            Log::warning("Export: record {} missing from the blob store", metadata.id());
            continue;
        }
        if (!entry->mutable_credential()->ParseFromString(it->second)) {
            Log::warning("Export: record {} is unreadable", metadata.id());
            entry->clear_credential();
            continue;
        }
        *entry->mutable_credential()->mutable_metadata() = metadata;
    }

    Log::info("Exported {} keys ({})", bundle.keys_size(), include_secrets ? "with secrets" : "metadata only");
    return bundle;
}

CredentialResult<ImportResult> CredentialStorageService::import_keys(const keywarden::ExportBundle& bundle) {
    std::lock_guard lock(m_mutex);
    count_operation_locked("import");

    if (auto ready = require_ready_locked(); !ready) {
        return std::unexpected(ready.error());
    }
    if (bundle.version() == 0 || bundle.version() > EXPORT_BUNDLE_VERSION) {
        Log::error("Unsupported export bundle version {}", bundle.version());
        return std::unexpected(CredentialError::InvalidBundle);
    }

    ImportResult result;

    for (const auto& entry : bundle.keys()) {
        std::string key_id = entry.metadata().id();
        if (key_id.empty() && entry.has_credential()) {
            key_id = entry.credential().id();
        }
        if (key_id.empty()) {
            key_id = "unknown";
        }

        auto fail = [&](std::string error) {
            Log::warning("Import of {} failed: {}", key_id, error);
            ++result.failed;
            result.errors.push_back(ImportError{key_id, std::move(error)});
        };

        try {
            if (!entry.has_credential() || entry.credential().encrypted_payload().cipher().empty()) {
                fail("Missing encrypted data");
                continue;
            }

            keywarden::EncryptedCredential record = entry.credential();
            if (entry.has_metadata()) {
                *record.mutable_metadata() = entry.metadata();
            }
            if (record.id().empty() || record.id() != record.metadata().id()) {
                fail("Record id does not match its metadata");
                continue;
            }
            if (!verify_record_locked(record)) {
                fail(std::string(to_string(CredentialError::IntegrityCheckFailed)));
                continue;
            }
            if (m_index_store->get(METADATA_COLLECTION, record.id())) {
                fail(std::string(to_string(CredentialError::DuplicateKey)));
                continue;
            }
            auto duplicate = find_id_by_hash_locked(record.key_hash());
            if (!duplicate) {
                fail(std::string(to_string(duplicate.error())));
                continue;
            }
            if (*duplicate) {
                fail(std::string(to_string(CredentialError::DuplicateKey)));
                continue;
            }

            std::string bytes;
            if (!record.SerializeToString(&bytes)) {
                fail(std::string(to_string(CredentialError::SerializationFailed)));
                continue;
            }

            if (!m_index_store->put(METADATA_COLLECTION, record.metadata())) {
                fail(std::string(to_string(CredentialError::StorageFailed)));
                continue;
            }
            if (!m_blob_store->set(record_key(record.id()), bytes)) {
                if (!m_index_store->remove(METADATA_COLLECTION, record.id())) {
                    Log::error("Rollback of import {} left metadata behind", record.id());
                }
                fail(std::string(to_string(CredentialError::StorageFailed)));
                continue;
            }
            if (!m_blob_store->set(hash_key_entry(record.key_hash()), record.id())) {
                if (!m_blob_store->remove(record_key(record.id()))) {
                    Log::error("Rollback of import {} left the record behind", record.id());
                }
                if (!m_index_store->remove(METADATA_COLLECTION, record.id())) {
                    Log::error("Rollback of import {} left metadata behind", record.id());
                }
                fail(std::string(to_string(CredentialError::StorageFailed)));
                continue;
            }

            ++result.success;
            ++m_metrics.total_keys;
        } catch (const std::exception& e) {
            fail(e.what());
        }
    }

    Log::info("Imported {} keys, {} failed", result.success, result.failed);
    return result;
}

// ============================================================================
// Maintenance
// ============================================================================

void CredentialStorageService::clear_cache() {
    std::lock_guard lock(m_mutex);
    m_record_cache.clear();
    m_validator->clear_caches();
    Log::debug("Credential caches cleared");
}

HealthReport CredentialStorageService::get_health_status() const {
    std::lock_guard lock(m_mutex);
    HealthReport report;

    const bool initialized = m_crypto->is_initialized();
    report.checks.push_back(HealthCheck{
        "crypto_service",
        initialized ? HealthState::PASS : HealthState::FAIL,
        initialized ? "Crypto service operational" : "Crypto service not initialized",
    });

    const bool session = m_state == StorageState::Ready && m_crypto->is_session_active();
    report.checks.push_back(HealthCheck{
        "session_status",
        session ? HealthState::PASS : HealthState::FAIL,
        session ? "Session active" : "Session expired or locked",
    });

    const bool index_ok = m_index_store->is_available();
    report.checks.push_back(HealthCheck{
        "index_store",
        index_ok ? HealthState::PASS : HealthState::FAIL,
        index_ok ? "Index store accessible" : "Index store unavailable",
    });

    HealthCheck blob{"blob_store", HealthState::FAIL, "Blob store unavailable"};
    if (m_blob_store->is_available()) {
        auto probe = m_blob_store->get("health_check");
        if (probe || probe.error() == StoreError::NOT_FOUND) {
            blob.status = HealthState::PASS;
            blob.message = "Blob store accessible";
        } else {
            blob.status = HealthState::WARN;
            blob.message = std::format("Blob store reachable but read failed: {}", to_string(probe.error()));
        }
    }
    report.checks.push_back(std::move(blob));

    report.healthy = std::ranges::none_of(report.checks, [](const HealthCheck& check) {
        return check.status == HealthState::FAIL;
    });
    return report;
}

StorageMetrics CredentialStorageService::metrics() const {
    std::lock_guard lock(m_mutex);
    return m_metrics;
}

} // namespace KeyWarden
