// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "SessionCryptoService.h"
#include "../../utils/Log.h"
#include <cstring>
#include <stdexcept>

#ifdef __linux__
#include <sys/mman.h>
#include <cerrno>
#endif

namespace KeyWarden {

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * @brief Lock the master key in RAM so it is never swapped (best effort)
 */
static void lock_memory(void* data, size_t size) {
#ifdef __linux__
    if (data && size > 0 && mlock(data, size) != 0) {
        Log::debug("SessionCryptoService: Failed to lock memory: {} ({})",
                   std::strerror(errno), errno);
    }
#else
    (void)data;
    (void)size;
#endif
}

static void unlock_memory(void* data, size_t size) {
#ifdef __linux__
    if (data && size > 0) {
        munlock(data, size);
    }
#else
    (void)data;
    (void)size;
#endif
}

// ============================================================================
// Lifecycle
// ============================================================================

SessionCryptoService::SessionCryptoService()
    : SessionCryptoService(Config{}) {
}

SessionCryptoService::SessionCryptoService(Config config)
    : m_config(std::move(config)) {
    if (m_config.pbkdf2_iterations <= 0) {
        throw std::invalid_argument("SessionCryptoService: pbkdf2_iterations must be positive");
    }
    if (m_config.salt.empty()) {
        m_config.salt = CredentialCrypto::generate_random_bytes(CredentialCrypto::SALT_LENGTH);
    }
}

SessionCryptoService::~SessionCryptoService() {
    shutdown();
}

CredentialResult<> SessionCryptoService::initialize(const Glib::ustring& passphrase) {
    std::lock_guard lock(m_mutex);

    SecureVector<uint8_t> key;
    if (!CredentialCrypto::derive_key(passphrase, m_config.salt, key, m_config.pbkdf2_iterations)) {
        Log::error("SessionCryptoService: Key derivation failed");
        return std::unexpected(CredentialError::EncryptionFailed);
    }

    unlock_memory(m_master_key.data(), m_master_key.size());
    m_master_key = std::move(key);
    lock_memory(m_master_key.data(), m_master_key.size());

    m_initialized = true;
    m_locked = false;
    touch_locked();
    Log::debug("SessionCryptoService: Session opened");
    return {};
}

CredentialResult<> SessionCryptoService::unlock(const Glib::ustring& passphrase) {
    std::lock_guard lock(m_mutex);

    if (!m_initialized) {
        return std::unexpected(CredentialError::NotInitialized);
    }

    SecureVector<uint8_t> candidate;
    if (!CredentialCrypto::derive_key(passphrase, m_config.salt, candidate, m_config.pbkdf2_iterations)) {
        return std::unexpected(CredentialError::EncryptionFailed);
    }

    const std::string_view expected(reinterpret_cast<const char*>(m_master_key.data()), m_master_key.size());
    const std::string_view actual(reinterpret_cast<const char*>(candidate.data()), candidate.size());
    if (!CredentialCrypto::constant_time_equals(expected, actual)) {
        Log::warning("SessionCryptoService: Unlock rejected, passphrase mismatch");
        return std::unexpected(CredentialError::SessionExpired);
    }

    m_locked = false;
    touch_locked();
    return {};
}

void SessionCryptoService::lock() {
    std::lock_guard lock(m_mutex);
    m_locked = true;
}

void SessionCryptoService::shutdown() {
    std::lock_guard lock(m_mutex);
    if (!m_master_key.empty()) {
        unlock_memory(m_master_key.data(), m_master_key.size());
        OPENSSL_cleanse(m_master_key.data(), m_master_key.size());
        m_master_key.clear();
    }
    m_initialized = false;
    m_locked = false;
}

bool SessionCryptoService::is_initialized() const {
    std::lock_guard lock(m_mutex);
    return m_initialized;
}

bool SessionCryptoService::is_session_active() const {
    std::lock_guard lock(m_mutex);
    return session_active_locked();
}

bool SessionCryptoService::session_active_locked() const {
    if (!m_initialized || m_locked) {
        return false;
    }
    if (m_config.session_timeout.count() == 0) {
        return true;
    }
    return Clock::now() - m_last_activity < m_config.session_timeout;
}

void SessionCryptoService::touch_locked() {
    m_last_activity = Clock::now();
}

std::vector<uint8_t> SessionCryptoService::salt() const {
    std::lock_guard lock(m_mutex);
    return m_config.salt;
}

// ============================================================================
// Encryption
// ============================================================================

CredentialResult<keywarden::EncryptedPayload> SessionCryptoService::encrypt(std::string_view plaintext) {
    std::lock_guard lock(m_mutex);

    if (!m_initialized) {
        return std::unexpected(CredentialError::NotInitialized);
    }
    if (!session_active_locked()) {
        return std::unexpected(CredentialError::SessionExpired);
    }

    std::vector<uint8_t> iv;
    try {
        iv = CredentialCrypto::generate_random_bytes(CredentialCrypto::IV_LENGTH);
    } catch (const std::runtime_error& e) {
        Log::error("SessionCryptoService: {}", e.what());
        return std::unexpected(CredentialError::EncryptionFailed);
    }

    std::vector<uint8_t> cipher;
    const std::span<const uint8_t> input(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size());
    if (!CredentialCrypto::encrypt(input, m_master_key, iv, cipher)) {
        Log::error("SessionCryptoService: AES-256-GCM encryption failed");
        return std::unexpected(CredentialError::EncryptionFailed);
    }
    touch_locked();

    keywarden::EncryptedPayload payload;
    payload.set_cipher(cipher.data(), cipher.size());
    payload.set_iv(iv.data(), iv.size());
    payload.set_algorithm(std::string(ALGORITHM));
    payload.set_version(PAYLOAD_VERSION);
    return payload;
}

CredentialResult<SecureString> SessionCryptoService::decrypt(const keywarden::EncryptedPayload& payload) {
    std::lock_guard lock(m_mutex);

    if (!m_initialized) {
        return std::unexpected(CredentialError::NotInitialized);
    }
    if (!session_active_locked()) {
        return std::unexpected(CredentialError::SessionExpired);
    }
    if (payload.algorithm() != ALGORITHM) {
        Log::error("SessionCryptoService: Unsupported algorithm '{}'", payload.algorithm());
        return std::unexpected(CredentialError::DecryptionFailed);
    }

    const auto& cipher = payload.cipher();
    const auto& iv = payload.iv();
    SecureVector<uint8_t> plaintext;
    if (!CredentialCrypto::decrypt(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(cipher.data()), cipher.size()),
            m_master_key,
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(iv.data()), iv.size()),
            plaintext)) {
        Log::error("SessionCryptoService: Authentication failed while decrypting");
        return std::unexpected(CredentialError::DecryptionFailed);
    }
    touch_locked();

    // Glib::ustring(const char*, n) counts characters, so go through std::string
    std::string raw(reinterpret_cast<const char*>(plaintext.data()), plaintext.size());
    SecureString secret{Glib::ustring(raw)};
    secure_clear_string(raw);
    return secret;
}

// ============================================================================
// Digests
// ============================================================================

std::string SessionCryptoService::checksum(std::string_view bytes) const {
    return CredentialCrypto::sha256_hex(bytes);
}

bool SessionCryptoService::verify_checksum(std::string_view bytes, std::string_view digest) const {
    return CredentialCrypto::constant_time_equals(CredentialCrypto::sha256_hex(bytes), digest);
}

std::string SessionCryptoService::hash_key(std::string_view raw_key) const {
    return CredentialCrypto::sha256_hex(raw_key);
}

} // namespace KeyWarden
