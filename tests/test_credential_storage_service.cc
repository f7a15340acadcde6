// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file test_credential_storage_service.cc
 * @brief Unit tests for CredentialStorageService
 *
 * Tests cover:
 * - Lifecycle (initialize, lock, unlock, shutdown, index rebuild)
 * - CRUD with duplicate detection and integrity checks
 * - Listing filters, ordering and cursor pagination
 * - Rotation, including rollback after a failed write
 * - Usage accounting, connection tests, export and import
 */

#include <gtest/gtest.h>
#include "../src/core/services/CredentialStorageService.h"
#include "../src/core/repositories/FileBlobStore.h"
#include "TestDoubles.h"
#include <filesystem>
#include <format>
#include <thread>

using namespace KeyWarden;
using namespace KeyWarden::Testing;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr const char* PASSPHRASE = "correct horse battery";

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class CredentialStorageServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe.respond_ok();
        auto result = storage.initialize_storage(PASSPHRASE);
        ASSERT_TRUE(result.has_value()) << "Storage should initialize";
    }

    keywarden::EncryptedCredential add(const std::string& key,
                                       const std::string& name,
                                       std::optional<keywarden::Provider> provider = std::nullopt) {
        AddKeyInput input;
        input.key = key;
        input.name = name;
        input.provider = provider;
        auto result = storage.add_key(std::move(input));
        if (!result) {
            ADD_FAILURE() << "add_key failed: " << to_string(result.error());
            return {};
        }
        return *result;
    }

    // Flip one cipher byte without touching the stored checksum
    void tamper_record(const std::string& id) {
        auto blob = blobs.get(CredentialStorageService::record_key(id));
        ASSERT_TRUE(blob.has_value());
        keywarden::EncryptedCredential record;
        ASSERT_TRUE(record.ParseFromString(*blob));
        std::string cipher = record.encrypted_payload().cipher();
        cipher[0] = static_cast<char>(cipher[0] ^ 0x01);
        record.mutable_encrypted_payload()->set_cipher(cipher);
        std::string bytes;
        ASSERT_TRUE(record.SerializeToString(&bytes));
        ASSERT_TRUE(blobs.set(CredentialStorageService::record_key(id), bytes).has_value());
    }

    // Change one character of the stored checksum and leave the payload intact
    void tamper_checksum(const std::string& id) {
        auto blob = blobs.get(CredentialStorageService::record_key(id));
        ASSERT_TRUE(blob.has_value());
        keywarden::EncryptedCredential record;
        ASSERT_TRUE(record.ParseFromString(*blob));
        std::string checksum = record.checksum();
        ASSERT_FALSE(checksum.empty());
        checksum[0] = checksum[0] == '0' ? '1' : '0';
        record.set_checksum(checksum);
        std::string bytes;
        ASSERT_TRUE(record.SerializeToString(&bytes));
        ASSERT_TRUE(blobs.set(CredentialStorageService::record_key(id), bytes).has_value());
    }

    FakeHttpProbe probe;
    KeyValidationService validator{&probe};
    FlakyCryptoService crypto;
    MemoryIndexStore index;
    FlakyBlobStore blobs;
    CredentialStorageService storage{&crypto, &index, &blobs, &validator};
};

// ============================================================================
// Construction and Lifecycle Tests
// ============================================================================

TEST(CredentialStorageServiceConstructionTest, NullCollaboratorsThrow) {
    FakeHttpProbe probe;
    KeyValidationService validator{&probe};
    FlakyCryptoService crypto;
    MemoryIndexStore index;
    MemoryBlobStore blobs;

    EXPECT_THROW(CredentialStorageService(nullptr, &index, &blobs, &validator), std::invalid_argument);
    EXPECT_THROW(CredentialStorageService(&crypto, nullptr, &blobs, &validator), std::invalid_argument);
    EXPECT_THROW(CredentialStorageService(&crypto, &index, nullptr, &validator), std::invalid_argument);
    EXPECT_THROW(CredentialStorageService(&crypto, &index, &blobs, nullptr), std::invalid_argument);
}

TEST(CredentialStorageServiceLifecycleTest, OperationsRequireInitialization) {
    FakeHttpProbe probe;
    KeyValidationService validator{&probe};
    FlakyCryptoService crypto;
    MemoryIndexStore index;
    MemoryBlobStore blobs;
    CredentialStorageService storage{&crypto, &index, &blobs, &validator};

    EXPECT_EQ(storage.state(), StorageState::Uninitialized);

    AddKeyInput input;
    input.key = OPENAI_KEY;
    auto added = storage.add_key(std::move(input));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error(), CredentialError::NotInitialized);
    EXPECT_EQ(to_string(added.error()),
              "API key storage not initialized. Call initialize_storage() first.");

    auto listed = storage.list_keys();
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error(), CredentialError::NotInitialized);

    auto unlocked = storage.unlock(PASSPHRASE);
    ASSERT_FALSE(unlocked.has_value());
    EXPECT_EQ(unlocked.error(), CredentialError::NotInitialized);
}

TEST(CredentialStorageServiceLifecycleTest, WeakPassphraseIsRejected) {
    FakeHttpProbe probe;
    KeyValidationService validator{&probe};
    FlakyCryptoService crypto;
    MemoryIndexStore index;
    MemoryBlobStore blobs;
    CredentialStorageService storage{&crypto, &index, &blobs, &validator};

    auto result = storage.initialize_storage("1234567");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::WeakPassphrase);
    EXPECT_EQ(storage.state(), StorageState::Uninitialized);
    EXPECT_FALSE(crypto.is_initialized());
}

TEST_F(CredentialStorageServiceTest, InitializeTwiceFails) {
    EXPECT_EQ(storage.state(), StorageState::Ready);
    auto again = storage.initialize_storage(PASSPHRASE);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), CredentialError::AlreadyInitialized);
}

TEST_F(CredentialStorageServiceTest, LockAndUnlock) {
    const auto record = add(OPENAI_KEY, "Main");

    storage.lock();
    EXPECT_EQ(storage.state(), StorageState::Locked);
    auto locked = storage.get_key(record.id());
    ASSERT_FALSE(locked.has_value());
    EXPECT_EQ(locked.error(), CredentialError::SessionExpired);

    auto wrong = storage.unlock("not the passphrase");
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error(), CredentialError::SessionExpired);
    EXPECT_EQ(storage.state(), StorageState::Locked);

    ASSERT_TRUE(storage.unlock(PASSPHRASE).has_value());
    EXPECT_EQ(storage.state(), StorageState::Ready);
    auto fetched = storage.get_key(record.id());
    ASSERT_TRUE(fetched.has_value()) << "Unlocked storage should decrypt again";
    EXPECT_EQ(fetched->secret.raw(), OPENAI_KEY);
}

TEST_F(CredentialStorageServiceTest, ShutdownReturnsToUninitialized) {
    storage.shutdown();
    EXPECT_EQ(storage.state(), StorageState::Uninitialized);
    EXPECT_FALSE(crypto.is_initialized());
    auto listed = storage.list_keys();
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error(), CredentialError::NotInitialized);
}

TEST_F(CredentialStorageServiceTest, InitializeRebuildsIndexFromBlobs) {
    const auto openai = add(OPENAI_KEY, "Main");
    const auto google = add(GOOGLE_KEY, "Search");
    ASSERT_TRUE(blobs.set("api_key_garbage", "not a credential").has_value());
    storage.shutdown();

    MemoryIndexStore fresh_index;
    CredentialStorageService reopened{&crypto, &fresh_index, &blobs, &validator};
    ASSERT_TRUE(reopened.initialize_storage(PASSPHRASE).has_value());

    EXPECT_EQ(reopened.metrics().total_keys, 2u) << "Unreadable records are skipped";
    EXPECT_EQ(fresh_index.size(CredentialStorageService::METADATA_COLLECTION), 2u);

    auto fetched = reopened.get_key(google.id());
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->secret.raw(), GOOGLE_KEY);

    AddKeyInput duplicate;
    duplicate.key = OPENAI_KEY;
    auto rejected = reopened.add_key(std::move(duplicate));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), CredentialError::DuplicateKey);
}

TEST(CredentialStorageServicePersistenceTest, FileBlobStoreSurvivesRestart) {
    const fs::path dir = fs::temp_directory_path() / "keywarden_storage_persistence";
    std::error_code ec;
    fs::remove_all(dir, ec);

    FakeHttpProbe probe;
    KeyValidationService validator{&probe};
    FlakyCryptoService crypto;
    std::string id;
    {
        MemoryIndexStore index;
        FileBlobStore blobs(dir);
        CredentialStorageService storage{&crypto, &index, &blobs, &validator};
        ASSERT_TRUE(storage.initialize_storage(PASSPHRASE).has_value());
        AddKeyInput input;
        input.key = ANTHROPIC_KEY;
        input.name = "Claude";
        auto added = storage.add_key(std::move(input));
        ASSERT_TRUE(added.has_value());
        id = added->id();
        storage.shutdown();
    }

    MemoryIndexStore index;
    FileBlobStore blobs(dir);
    CredentialStorageService storage{&crypto, &index, &blobs, &validator};
    ASSERT_TRUE(storage.initialize_storage(PASSPHRASE).has_value());
    auto fetched = storage.get_key(id);
    ASSERT_TRUE(fetched.has_value()) << "Record should be readable after restart";
    EXPECT_EQ(fetched->secret.raw(), ANTHROPIC_KEY);
    EXPECT_EQ(fetched->record.metadata().name(), "Claude");

    fs::remove_all(dir, ec);
}

// ============================================================================
// Add / Get Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, AddKeyBuildsRecord) {
    const auto record = add(OPENAI_KEY, "Main", keywarden::PROVIDER_OPENAI);

    EXPECT_TRUE(record.id().starts_with("openai-"));
    EXPECT_EQ(record.metadata().id(), record.id());
    EXPECT_EQ(record.metadata().provider(), keywarden::PROVIDER_OPENAI);
    EXPECT_EQ(record.metadata().status(), keywarden::KEY_STATUS_ACTIVE);
    EXPECT_EQ(record.metadata().masked_key(), "sk-A...Jk6l");
    EXPECT_EQ(record.metadata().permissions_size(), 2);
    EXPECT_GT(record.metadata().created_at(), 0);
    EXPECT_EQ(record.storage_version(), STORAGE_VERSION);
    EXPECT_EQ(record.rotation_status().status(), keywarden::ROTATION_STATE_NONE);
    ASSERT_TRUE(record.has_usage_stats());
    EXPECT_EQ(record.usage_stats().total_requests(), 0u);
    EXPECT_EQ(record.key_hash(), crypto.hash_key(OPENAI_KEY));

    auto blob = blobs.get(CredentialStorageService::record_key(record.id()));
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->find(OPENAI_KEY), std::string::npos) << "Secret must never be stored in the clear";
}

TEST_F(CredentialStorageServiceTest, GetKeyDecrypts) {
    const auto record = add("  " + OPENAI_KEY + "\n", "Main");
    auto fetched = storage.get_key(record.id());
    ASSERT_TRUE(fetched.has_value()) << "Stored key should decrypt";
    EXPECT_EQ(fetched->secret.raw(), OPENAI_KEY) << "Whitespace is stripped before storing";
    EXPECT_EQ(fetched->record.metadata().name(), "Main");

    auto missing = storage.get_key("openai-0-deadbeef");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), CredentialError::NotFound);
}

TEST_F(CredentialStorageServiceTest, ProviderIsDetectedWhenOmitted) {
    const auto record = add(GOOGLE_KEY, "Search");
    EXPECT_EQ(record.metadata().provider(), keywarden::PROVIDER_GOOGLE);
    EXPECT_TRUE(record.id().starts_with("google-"));
}

TEST_F(CredentialStorageServiceTest, InvalidKeysAreRejected) {
    AddKeyInput undetectable;
    undetectable.key = "no-known-provider";
    auto result = storage.add_key(std::move(undetectable));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::InvalidFormat);

    AddKeyInput malformed;
    malformed.key = "sk-short";
    malformed.provider = keywarden::PROVIDER_OPENAI;
    result = storage.add_key(std::move(malformed));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::InvalidFormat);

    EXPECT_EQ(storage.metrics().total_keys, 0u);
}

TEST_F(CredentialStorageServiceTest, DuplicatesAreRejectedAcrossProviders) {
    add(OPENAI_KEY, "Main");

    AddKeyInput same;
    same.key = OPENAI_KEY;
    auto result = storage.add_key(std::move(same));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::DuplicateKey);

    AddKeyInput as_custom;
    as_custom.key = OPENAI_KEY;
    as_custom.provider = keywarden::PROVIDER_CUSTOM;
    result = storage.add_key(std::move(as_custom));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::DuplicateKey);
}

TEST_F(CredentialStorageServiceTest, FailedAddLeavesNothingBehind) {
    blobs.fail_set_prefix = std::string(CredentialStorageService::HASH_PREFIX);

    AddKeyInput input;
    input.key = OPENAI_KEY;
    auto result = storage.add_key(std::move(input));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::StorageFailed);
    EXPECT_EQ(index.size(CredentialStorageService::METADATA_COLLECTION), 0u);
    EXPECT_TRUE(blobs.list_keys(CredentialStorageService::RECORD_PREFIX)->empty());

    blobs.fail_set_prefix.clear();
    add(OPENAI_KEY, "Main");
}

TEST_F(CredentialStorageServiceTest, EncryptionFailureIsReported) {
    crypto.fail_encrypt = true;
    AddKeyInput input;
    input.key = OPENAI_KEY;
    auto result = storage.add_key(std::move(input));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::EncryptionFailed);
}

TEST_F(CredentialStorageServiceTest, TamperedRecordFailsIntegrityCheck) {
    const auto record = add(OPENAI_KEY, "Main");
    tamper_record(record.id());

    auto fetched = storage.get_key(record.id());
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error(), CredentialError::IntegrityCheckFailed);

    auto deleted = storage.delete_key(record.id());
    ASSERT_TRUE(deleted.has_value());
    EXPECT_TRUE(*deleted) << "Corrupted records stay deletable";
}

TEST_F(CredentialStorageServiceTest, AlteredChecksumFailsIntegrityCheck) {
    const auto record = add(OPENAI_KEY, "Main");
    storage.clear_cache();
    tamper_checksum(record.id());

    auto fetched = storage.get_key(record.id());
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error(), CredentialError::IntegrityCheckFailed);
}

TEST_F(CredentialStorageServiceTest, CacheServesVerifiedRecordsUntilCleared) {
    const auto record = add(OPENAI_KEY, "Main");
    ASSERT_TRUE(storage.get_key(record.id()).has_value());

    tamper_record(record.id());
    EXPECT_TRUE(storage.get_key(record.id()).has_value()) << "Served from the record cache";

    storage.clear_cache();
    auto fetched = storage.get_key(record.id());
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error(), CredentialError::IntegrityCheckFailed);
}

TEST_F(CredentialStorageServiceTest, DecryptionFailureIsReported) {
    const auto record = add(OPENAI_KEY, "Main");
    crypto.fail_decrypt = true;
    auto fetched = storage.get_key(record.id());
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error(), CredentialError::DecryptionFailed);
}

// ============================================================================
// Update / Delete / Revoke Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, UpdatePatchesMetadata) {
    const auto record = add(OPENAI_KEY, "Main");

    KeyUpdate update;
    update.name = "Renamed";
    update.description = "Billing service";
    update.tags = std::vector<std::string>{"prod", "billing"};
    keywarden::CredentialConfiguration configuration;
    configuration.mutable_endpoint()->set_base_url("https://proxy.example");
    update.configuration = configuration;

    auto updated = storage.update_key(record.id(), update);
    ASSERT_TRUE(updated.has_value()) << "Update should succeed";
    EXPECT_EQ(updated->metadata().name(), "Renamed");
    EXPECT_EQ(updated->metadata().description(), "Billing service");
    EXPECT_EQ(updated->metadata().tags_size(), 2);
    EXPECT_EQ(updated->metadata().masked_key(), record.metadata().masked_key());
    EXPECT_EQ(updated->configuration().endpoint().base_url(), "https://proxy.example");
    EXPECT_TRUE(updated->configuration().has_security()) << "Untouched sub-configs are kept";

    auto fetched = storage.get_key(record.id());
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->record.metadata().name(), "Renamed");
    EXPECT_EQ(fetched->secret.raw(), OPENAI_KEY);

    auto missing = storage.update_key("missing", update);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), CredentialError::NotFound);

    for (const auto reserved : {keywarden::KEY_STATUS_EXPIRED, keywarden::KEY_STATUS_ROTATING}) {
        KeyUpdate status_update;
        status_update.status = reserved;
        auto rejected = storage.update_key(record.id(), status_update);
        ASSERT_FALSE(rejected.has_value()) << to_string(reserved);
        EXPECT_EQ(rejected.error(), CredentialError::InvalidFormat);
    }
    EXPECT_EQ(storage.get_record(record.id())->metadata().status(), keywarden::KEY_STATUS_ACTIVE);

    KeyUpdate inactive;
    inactive.status = keywarden::KEY_STATUS_INACTIVE;
    auto deactivated = storage.update_key(record.id(), inactive);
    ASSERT_TRUE(deactivated.has_value()) << "Ordinary statuses can still be set";
    EXPECT_EQ(deactivated->metadata().status(), keywarden::KEY_STATUS_INACTIVE);
}

TEST_F(CredentialStorageServiceTest, DeleteReleasesKey) {
    const auto record = add(OPENAI_KEY, "Main");

    auto deleted = storage.delete_key(record.id());
    ASSERT_TRUE(deleted.has_value());
    EXPECT_TRUE(*deleted);
    EXPECT_EQ(storage.metrics().total_keys, 0u);
    EXPECT_FALSE(blobs.get(CredentialStorageService::hash_key_entry(record.key_hash())).has_value());

    auto again = storage.delete_key(record.id());
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(*again);

    add(OPENAI_KEY, "Main again");
}

TEST_F(CredentialStorageServiceTest, StaleHashEntryDoesNotBlockAdd) {
    const auto record = add(OPENAI_KEY, "Main");
    ASSERT_TRUE(index.remove(CredentialStorageService::METADATA_COLLECTION, record.id()).has_value());
    add(OPENAI_KEY, "Recovered");
}

TEST_F(CredentialStorageServiceTest, RevokeIsIdempotent) {
    const auto record = add(OPENAI_KEY, "Main");

    auto revoked = storage.revoke_key(record.id());
    ASSERT_TRUE(revoked.has_value());
    EXPECT_TRUE(*revoked);
    EXPECT_EQ(storage.get_record(record.id())->metadata().status(), keywarden::KEY_STATUS_REVOKED);

    revoked = storage.revoke_key(record.id());
    ASSERT_TRUE(revoked.has_value());
    EXPECT_TRUE(*revoked);

    auto missing = storage.revoke_key("missing");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(*missing);
}

// ============================================================================
// Listing Tests
// ============================================================================

class CredentialStorageListTest : public CredentialStorageServiceTest {
protected:
    void SetUp() override {
        CredentialStorageServiceTest::SetUp();

        AddKeyInput openai;
        openai.key = OPENAI_KEY;
        openai.name = "Beta";
        openai.tags = {"prod"};
        ASSERT_TRUE(storage.add_key(std::move(openai)).has_value());

        AddKeyInput google;
        google.key = GOOGLE_KEY;
        google.name = "alpha";
        google.description = "Search team";
        ASSERT_TRUE(storage.add_key(std::move(google)).has_value());

        AddKeyInput anthropic;
        anthropic.key = ANTHROPIC_KEY;
        anthropic.name = "Gamma";
        anthropic.tags = {"prod", "dev"};
        ASSERT_TRUE(storage.add_key(std::move(anthropic)).has_value());
    }

    static std::vector<std::string> names(const ListResult& result) {
        std::vector<std::string> out;
        for (const auto& metadata : result.keys) {
            out.push_back(metadata.name());
        }
        return out;
    }
};

TEST_F(CredentialStorageListTest, ListsEverything) {
    auto result = storage.list_keys();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->total, 3u);
    EXPECT_EQ(result->keys.size(), 3u);
    EXPECT_FALSE(result->has_more);
    EXPECT_FALSE(result->next_cursor.has_value());
}

TEST_F(CredentialStorageListTest, FiltersCombine) {
    ListOptions by_provider;
    by_provider.provider = keywarden::PROVIDER_GOOGLE;
    EXPECT_EQ(names(*storage.list_keys(by_provider)), std::vector<std::string>{"alpha"});

    ListOptions by_tag;
    by_tag.tags = {"dev", "unused"};
    EXPECT_EQ(names(*storage.list_keys(by_tag)), std::vector<std::string>{"Gamma"});

    ListOptions by_search;
    by_search.search = "SEARCH";
    EXPECT_EQ(names(*storage.list_keys(by_search)), std::vector<std::string>{"alpha"})
        << "Search is case-insensitive and covers the description";

    ListOptions combined;
    combined.tags = {"prod"};
    combined.provider = keywarden::PROVIDER_OPENAI;
    EXPECT_EQ(names(*storage.list_keys(combined)), std::vector<std::string>{"Beta"});
}

TEST_F(CredentialStorageListTest, SortsByName) {
    ListOptions options;
    options.sort_by = SortField::NAME;
    EXPECT_EQ(names(*storage.list_keys(options)), (std::vector<std::string>{"alpha", "Beta", "Gamma"}));

    options.sort_order = SortOrder::DESC;
    EXPECT_EQ(names(*storage.list_keys(options)), (std::vector<std::string>{"Gamma", "Beta", "alpha"}));
}

TEST_F(CredentialStorageListTest, CursorPagination) {
    ListOptions options;
    options.sort_by = SortField::NAME;
    options.limit = 2;

    auto first = storage.list_keys(options);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(names(*first), (std::vector<std::string>{"alpha", "Beta"}));
    EXPECT_EQ(first->total, 3u);
    EXPECT_TRUE(first->has_more);
    ASSERT_TRUE(first->next_cursor.has_value());

    options.cursor = first->next_cursor;
    options.offset = 0;
    auto second = storage.list_keys(options);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(names(*second), std::vector<std::string>{"Gamma"});
    EXPECT_FALSE(second->has_more);
    EXPECT_FALSE(second->next_cursor.has_value());

    options.cursor = "page-two";
    auto invalid = storage.list_keys(options);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error(), CredentialError::InvalidFormat);
}

TEST_F(CredentialStorageListTest, ReportsEffectiveStatus) {
    auto google = storage.list_keys(ListOptions{.provider = keywarden::PROVIDER_GOOGLE});
    ASSERT_TRUE(google.has_value());
    ASSERT_EQ(google->keys.size(), 1u);

    KeyUpdate update;
    update.expires_at = 1;
    ASSERT_TRUE(storage.update_key(google->keys.front().id(), update).has_value());

    ListOptions expired;
    expired.status = keywarden::KEY_STATUS_EXPIRED;
    EXPECT_EQ(names(*storage.list_keys(expired)), std::vector<std::string>{"alpha"});

    ListOptions active;
    active.status = keywarden::KEY_STATUS_ACTIVE;
    EXPECT_EQ(storage.list_keys(active)->total, 2u);
}

TEST_F(CredentialStorageListTest, KeysByProvider) {
    auto keys = storage.get_keys_by_provider(keywarden::PROVIDER_ANTHROPIC);
    ASSERT_TRUE(keys.has_value());
    ASSERT_EQ(keys->size(), 1u);
    EXPECT_EQ(keys->front().name(), "Gamma");
    EXPECT_TRUE(storage.get_keys_by_provider(keywarden::PROVIDER_CUSTOM)->empty());
}

// ============================================================================
// Rotation Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, RotationReplacesSecretAndKeepsId) {
    const auto record = add(OPENAI_KEY, "Main");

    auto rotated = storage.rotate_key(record.id(), OPENAI_KEY_2, "Quarterly rotation");
    ASSERT_TRUE(rotated.has_value());
    ASSERT_TRUE(rotated->success) << rotated->error.value_or("");
    EXPECT_EQ(rotated->new_key_id, record.id());
    EXPECT_TRUE(rotated->rollback_available);

    auto fetched = storage.get_key(record.id());
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->secret.raw(), OPENAI_KEY_2);
    EXPECT_EQ(fetched->record.metadata().masked_key(), "sk-Z...Yu8i");
    EXPECT_EQ(fetched->record.metadata().status(), keywarden::KEY_STATUS_ACTIVE);

    const auto& rotation = fetched->record.rotation_status();
    EXPECT_EQ(rotation.status(), keywarden::ROTATION_STATE_COMPLETED);
    EXPECT_GT(rotation.last_rotation(), 0);
    ASSERT_EQ(rotation.history_size(), 1);
    EXPECT_TRUE(rotation.history(0).success());
    EXPECT_EQ(rotation.history(0).reason(), "Quarterly rotation");

    add(OPENAI_KEY, "Old key is free again");

    AddKeyInput duplicate;
    duplicate.key = OPENAI_KEY_2;
    auto rejected = storage.add_key(std::move(duplicate));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), CredentialError::DuplicateKey);
}

TEST_F(CredentialStorageServiceTest, RotationSchedulesNextRotation) {
    AddKeyInput input;
    input.key = OPENAI_KEY;
    keywarden::CredentialConfiguration configuration;
    configuration.mutable_rotation()->set_enabled(true);
    configuration.mutable_rotation()->set_interval_days(30);
    input.configuration = configuration;
    auto record = storage.add_key(std::move(input));
    ASSERT_TRUE(record.has_value());

    ASSERT_TRUE(storage.rotate_key(record->id(), OPENAI_KEY_2)->success);
    auto stored = storage.get_record(record->id());
    ASSERT_TRUE(stored.has_value());
    const auto& rotation = stored->rotation_status();
    EXPECT_EQ(rotation.next_scheduled_rotation(), rotation.last_rotation() + 30 * MS_PER_DAY);
    EXPECT_EQ(rotation.history(0).reason(), "Manual rotation");
}

TEST_F(CredentialStorageServiceTest, RotationRejectsBadInputWithoutWriting) {
    const auto record = add(OPENAI_KEY, "Main");
    const auto other = add(OPENAI_KEY_2, "Other");

    auto invalid = storage.rotate_key(record.id(), "sk-short");
    ASSERT_TRUE(invalid.has_value());
    EXPECT_FALSE(invalid->success);
    EXPECT_TRUE(invalid->error.value_or("").starts_with("Invalid API key format:"));

    auto identical = storage.rotate_key(record.id(), OPENAI_KEY);
    ASSERT_TRUE(identical.has_value());
    EXPECT_EQ(identical->error, "New key is identical to the current key");

    auto taken = storage.rotate_key(record.id(), OPENAI_KEY_2);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->error, "API key already exists");

    auto stored = storage.get_record(record.id());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->rotation_status().history_size(), 0);
    EXPECT_EQ(stored->key_hash(), record.key_hash());

    auto missing = storage.rotate_key("missing", OPENAI_KEY);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), CredentialError::NotFound);
}

TEST_F(CredentialStorageServiceTest, RotationRollsBackOnEncryptionFailure) {
    const auto record = add(OPENAI_KEY, "Main");

    crypto.fail_encrypt = true;
    auto rotated = storage.rotate_key(record.id(), OPENAI_KEY_2);
    crypto.fail_encrypt = false;

    ASSERT_TRUE(rotated.has_value());
    EXPECT_FALSE(rotated->success);
    EXPECT_TRUE(rotated->rollback_available);
    EXPECT_EQ(rotated->error, "Encryption failed");

    auto fetched = storage.get_key(record.id());
    ASSERT_TRUE(fetched.has_value()) << "Old secret must survive a failed rotation";
    EXPECT_EQ(fetched->secret.raw(), OPENAI_KEY);
    EXPECT_EQ(fetched->record.metadata().status(), keywarden::KEY_STATUS_ACTIVE);

    const auto& rotation = fetched->record.rotation_status();
    EXPECT_EQ(rotation.status(), keywarden::ROTATION_STATE_FAILED);
    ASSERT_EQ(rotation.history_size(), 1);
    EXPECT_FALSE(rotation.history(0).success());
    EXPECT_EQ(rotation.history(0).reason(), "Manual rotation (Encryption failed)");
}

TEST_F(CredentialStorageServiceTest, RotationRollsBackOnWriteFailure) {
    const auto record = add(OPENAI_KEY, "Main");

    blobs.fail_set_prefix = std::string(CredentialStorageService::HASH_PREFIX);
    auto rotated = storage.rotate_key(record.id(), OPENAI_KEY_2);
    blobs.fail_set_prefix.clear();

    ASSERT_TRUE(rotated.has_value());
    EXPECT_FALSE(rotated->success);
    EXPECT_TRUE(rotated->rollback_available);
    EXPECT_EQ(rotated->error, "Storage operation failed");

    auto fetched = storage.get_key(record.id());
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->secret.raw(), OPENAI_KEY);

    add(OPENAI_KEY_2, "New key was never registered");
}

// ============================================================================
// Usage Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, UsageAccumulates) {
    const auto record = add(OPENAI_KEY, "Main");

    UsageRecord first;
    first.requests = 10;
    first.failed_requests = 2;
    first.tokens = 100;
    first.input_tokens = 60;
    first.output_tokens = 40;
    first.cost = 0.5;
    first.response_time_ms = 200.0;
    ASSERT_TRUE(storage.record_usage(record.id(), first).has_value());

    UsageRecord second;
    second.requests = 10;
    second.response_time_ms = 100.0;
    ASSERT_TRUE(storage.record_usage(record.id(), second).has_value());

    auto stats = storage.get_key_usage_stats(record.id());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total_requests(), 20u);
    EXPECT_EQ(stats->successful_requests(), 18u);
    EXPECT_EQ(stats->failed_requests(), 2u);
    EXPECT_EQ(stats->total_tokens(), 100u);
    EXPECT_EQ(stats->input_tokens(), 60u);
    EXPECT_EQ(stats->output_tokens(), 40u);
    EXPECT_DOUBLE_EQ(stats->total_cost(), 0.5);
    EXPECT_DOUBLE_EQ(stats->avg_response_time_ms(), 150.0);
    EXPECT_EQ(stats->daily().requests(), 20u);
    EXPECT_EQ(stats->monthly().tokens(), 100u);
}

TEST_F(CredentialStorageServiceTest, FailedRequestsAreClamped) {
    const auto record = add(OPENAI_KEY, "Main");
    UsageRecord usage;
    usage.requests = 1;
    usage.failed_requests = 5;
    ASSERT_TRUE(storage.record_usage(record.id(), usage).has_value());

    auto stats = storage.get_key_usage_stats(record.id());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->failed_requests(), 1u);
    EXPECT_EQ(stats->successful_requests(), 0u);
}

TEST_F(CredentialStorageServiceTest, UsageForMissingKey) {
    auto result = storage.record_usage("missing", UsageRecord{.requests = 1});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::NotFound);
}

// ============================================================================
// Connection Test Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, ConnectionTestProbesProvider) {
    const auto record = add(OPENAI_KEY, "Main");

    auto result = storage.test_key_connection(record.id());
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->provider, keywarden::PROVIDER_OPENAI);
    EXPECT_EQ(result->endpoint, "https://api.openai.com/v1/models");
    EXPECT_EQ(result->status_code, 200);
    EXPECT_EQ(probe.last_request().headers.at("Authorization"), "Bearer " + OPENAI_KEY);

    ASSERT_TRUE(storage.test_key_connection(record.id()).has_value());
    EXPECT_EQ(probe.request_count(), 2u) << "Connection tests always hit the provider";
}

TEST_F(CredentialStorageServiceTest, ConnectionTestUsesConfiguredEndpoint) {
    const auto record = add(OPENAI_KEY, "Main");

    KeyUpdate update;
    keywarden::CredentialConfiguration configuration;
    configuration.mutable_endpoint()->set_base_url("https://proxy.example");
    configuration.mutable_endpoint()->set_timeout_ms(1500);
    update.configuration = configuration;
    ASSERT_TRUE(storage.update_key(record.id(), update).has_value());

    probe.respond_status(401, "Unauthorized");
    auto result = storage.test_key_connection(record.id());
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->error, "HTTP 401: Unauthorized");
    EXPECT_EQ(result->endpoint, "https://proxy.example/v1/models");
    EXPECT_EQ(probe.last_request().timeout, 1500ms);
}

TEST_F(CredentialStorageServiceTest, ConnectionTestSkipsCustomProvider) {
    const auto record = add("internal-service-token-7f3a", "Internal", keywarden::PROVIDER_CUSTOM);

    KeyUpdate update;
    keywarden::CredentialConfiguration configuration;
    configuration.mutable_endpoint()->set_base_url("https://llm.internal.example");
    update.configuration = configuration;
    ASSERT_TRUE(storage.update_key(record.id(), update).has_value());

    auto result = storage.test_key_connection(record.id());
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->endpoint, "none");
    EXPECT_EQ(result->error, "Live validation not supported for provider: custom");
    EXPECT_EQ(probe.request_count(), 0u);
}

TEST_F(CredentialStorageServiceTest, ConnectionTestNeedsDecryptableKey) {
    const auto record = add(OPENAI_KEY, "Main");
    crypto.fail_decrypt = true;
    auto result = storage.test_key_connection(record.id());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::DecryptionFailed);
    EXPECT_EQ(probe.request_count(), 0u);
}

TEST_F(CredentialStorageServiceTest, ConnectionTestReportsExpiredSession) {
    const auto record = add(OPENAI_KEY, "Main");
    crypto.expire_on_decrypt = true;

    auto connection = storage.test_key_connection(record.id());
    ASSERT_FALSE(connection.has_value());
    EXPECT_EQ(connection.error(), CredentialError::SessionExpired);
    EXPECT_EQ(probe.request_count(), 0u);

    auto key = storage.get_key(record.id());
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error(), CredentialError::SessionExpired) << "get_key reports the same error";
}

// ============================================================================
// Export / Import Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, ExportMetadataOnly) {
    add(OPENAI_KEY, "Main");
    add(GOOGLE_KEY, "Search");

    auto bundle = storage.export_keys();
    ASSERT_TRUE(bundle.has_value());
    EXPECT_EQ(bundle->version(), EXPORT_BUNDLE_VERSION);
    EXPECT_FALSE(bundle->include_secrets());
    ASSERT_EQ(bundle->keys_size(), 2);
    for (const auto& entry : bundle->keys()) {
        EXPECT_FALSE(entry.has_credential());
        EXPECT_FALSE(entry.metadata().masked_key().empty());
    }
}

TEST_F(CredentialStorageServiceTest, ExportImportRoundTrip) {
    const auto openai = add(OPENAI_KEY, "Main");
    const auto google = add(GOOGLE_KEY, "Search");

    auto bundle = storage.export_keys(true);
    ASSERT_TRUE(bundle.has_value());
    ASSERT_EQ(bundle->keys_size(), 2);
    EXPECT_TRUE(bundle->keys(0).has_credential());

    ASSERT_TRUE(*storage.delete_key(openai.id()));
    ASSERT_TRUE(*storage.delete_key(google.id()));

    auto imported = storage.import_keys(*bundle);
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(imported->success, 2u);
    EXPECT_EQ(imported->failed, 0u);

    auto fetched = storage.get_key(google.id());
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->secret.raw(), GOOGLE_KEY);

    auto again = storage.import_keys(*bundle);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->success, 0u);
    EXPECT_EQ(again->failed, 2u);
    EXPECT_EQ(again->errors.front().error, "API key already exists");
}

TEST_F(CredentialStorageServiceTest, ImportReportsPerEntryErrors) {
    add(OPENAI_KEY, "Main");
    auto bundle = storage.export_keys(true);
    ASSERT_TRUE(bundle.has_value());

    keywarden::ExportBundle crafted;
    crafted.set_version(EXPORT_BUNDLE_VERSION);

    auto* tampered = crafted.add_keys();
    *tampered = bundle->keys(0);
    tampered->mutable_credential()->set_checksum(std::string(64, '0'));

    auto* metadata_only = crafted.add_keys();
    metadata_only->mutable_metadata()->set_id("custom-1-abcdef01");

    crafted.add_keys();

    auto result = storage.import_keys(crafted);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->success, 0u);
    EXPECT_EQ(result->failed, 3u);
    ASSERT_EQ(result->errors.size(), 3u);
    EXPECT_EQ(result->errors[0].error, "Data integrity check failed");
    EXPECT_EQ(result->errors[1].key, "custom-1-abcdef01");
    EXPECT_EQ(result->errors[1].error, "Missing encrypted data");
    EXPECT_EQ(result->errors[2].key, "unknown");
}

TEST_F(CredentialStorageServiceTest, ImportRejectsUnknownBundleVersion) {
    keywarden::ExportBundle bundle;
    bundle.set_version(EXPORT_BUNDLE_VERSION + 1);
    auto result = storage.import_keys(bundle);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CredentialError::InvalidBundle);

    bundle.set_version(0);
    EXPECT_FALSE(storage.import_keys(bundle).has_value());
}

// ============================================================================
// Health and Metrics Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, HealthyWhenReady) {
    const auto report = storage.get_health_status();
    EXPECT_TRUE(report.healthy);
    ASSERT_EQ(report.checks.size(), 4u);
    EXPECT_EQ(report.checks[0].name, "crypto_service");
    EXPECT_EQ(report.checks[1].name, "session_status");
    EXPECT_EQ(report.checks[2].name, "index_store");
    EXPECT_EQ(report.checks[3].name, "blob_store");
    for (const auto& check : report.checks) {
        EXPECT_EQ(check.status, HealthState::PASS) << check.name;
    }
}

TEST_F(CredentialStorageServiceTest, BlobReadFailureIsAWarning) {
    blobs.fail_get_prefix = "health_check";
    const auto report = storage.get_health_status();
    EXPECT_TRUE(report.healthy);
    EXPECT_EQ(report.checks[3].status, HealthState::WARN);

    blobs.available = false;
    const auto down = storage.get_health_status();
    EXPECT_FALSE(down.healthy);
    EXPECT_EQ(down.checks[3].status, HealthState::FAIL);
}

TEST_F(CredentialStorageServiceTest, LockedSessionIsUnhealthy) {
    storage.lock();
    const auto report = storage.get_health_status();
    EXPECT_FALSE(report.healthy);
    EXPECT_EQ(report.checks[0].status, HealthState::PASS);
    EXPECT_EQ(report.checks[1].status, HealthState::FAIL);
}

TEST(CredentialStorageServiceHealthTest, UninitializedIsUnhealthy) {
    FakeHttpProbe probe;
    KeyValidationService validator{&probe};
    FlakyCryptoService crypto;
    MemoryIndexStore index;
    MemoryBlobStore blobs;
    CredentialStorageService storage{&crypto, &index, &blobs, &validator};

    const auto report = storage.get_health_status();
    EXPECT_FALSE(report.healthy);
    EXPECT_EQ(report.checks[0].status, HealthState::FAIL);
    EXPECT_EQ(report.checks[0].message, "Crypto service not initialized");
}

TEST_F(CredentialStorageServiceTest, MetricsCountOperationsAndCacheHits) {
    const auto record = add(OPENAI_KEY, "Main");
    ASSERT_TRUE(storage.get_key(record.id()).has_value());
    ASSERT_TRUE(storage.get_key(record.id()).has_value());

    const auto metrics = storage.metrics();
    EXPECT_EQ(metrics.total_keys, 1u);
    EXPECT_EQ(metrics.operation_counts.at("add"), 1u);
    EXPECT_EQ(metrics.operation_counts.at("get"), 2u);
    EXPECT_EQ(metrics.cache_misses, 1u);
    EXPECT_EQ(metrics.cache_hits, 1u);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(CredentialStorageServiceTest, ConcurrentAddsAreSerialized) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 10;

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                AddKeyInput input;
                input.key = std::format("internal-service-token-{}-{}", t, i);
                input.provider = keywarden::PROVIDER_CUSTOM;
                input.name = std::format("svc-{}-{}", t, i);
                if (!storage.add_key(std::move(input))) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    auto listed = storage.list_keys();
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->total, static_cast<size_t>(THREADS * PER_THREAD));
}
