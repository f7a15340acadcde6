// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SessionCryptoService.h
 * @brief OpenSSL-backed ICryptoService with a timed session
 *
 * Responsibilities:
 * - Derive the master key from the passphrase (PBKDF2-HMAC-SHA256)
 * - AES-256-GCM encryption of API keys with a random IV per call
 * - SHA-256 checksums and key hashes
 * - Session lock and idle timeout
 *
 * NOT responsible for:
 * - Persisting the salt (see salt(); the embedding application stores it)
 * - Record layout or storage (see CredentialStorageService)
 */

#pragma once

#include "ICryptoService.h"
#include "../crypto/CredentialCrypto.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace KeyWarden {

/**
 * @class SessionCryptoService
 *
 * Thread-safety: all public methods lock an internal mutex.
 */
class SessionCryptoService final : public ICryptoService {
public:
    static constexpr std::string_view ALGORITHM = "AES-256-GCM";
    static constexpr uint32_t PAYLOAD_VERSION = 1;

    struct Config {
        int pbkdf2_iterations = CredentialCrypto::DEFAULT_PBKDF2_ITERATIONS;
        /// Idle time after which the session expires; zero disables the timeout
        std::chrono::seconds session_timeout{std::chrono::minutes(30)};
        /// Salt from a previous run; a fresh one is generated when empty
        std::vector<uint8_t> salt;
    };

    SessionCryptoService();
    explicit SessionCryptoService(Config config);
    ~SessionCryptoService() override;

    SessionCryptoService(const SessionCryptoService&) = delete;
    SessionCryptoService& operator=(const SessionCryptoService&) = delete;
    SessionCryptoService(SessionCryptoService&&) = delete;
    SessionCryptoService& operator=(SessionCryptoService&&) = delete;

    [[nodiscard]] CredentialResult<> initialize(const Glib::ustring& passphrase) override;
    [[nodiscard]] CredentialResult<> unlock(const Glib::ustring& passphrase) override;
    void lock() override;
    void shutdown() override;

    [[nodiscard]] bool is_initialized() const override;
    [[nodiscard]] bool is_session_active() const override;

    [[nodiscard]] CredentialResult<keywarden::EncryptedPayload> encrypt(
        std::string_view plaintext) override;
    [[nodiscard]] CredentialResult<SecureString> decrypt(
        const keywarden::EncryptedPayload& payload) override;

    [[nodiscard]] std::string checksum(std::string_view bytes) const override;
    [[nodiscard]] bool verify_checksum(std::string_view bytes,
                                       std::string_view digest) const override;
    [[nodiscard]] std::string hash_key(std::string_view raw_key) const override;

    /** @brief Salt used for derivation; persist it to re-derive the same key */
    [[nodiscard]] std::vector<uint8_t> salt() const;

private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] bool session_active_locked() const;
    void touch_locked();

    mutable std::mutex m_mutex;
    Config m_config;
    SecureVector<uint8_t> m_master_key;
    bool m_initialized = false;
    bool m_locked = false;
    Clock::time_point m_last_activity{};
};

} // namespace KeyWarden
