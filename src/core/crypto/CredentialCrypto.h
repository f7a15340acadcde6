// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef KEYWARDEN_CREDENTIAL_CRYPTO_H
#define KEYWARDEN_CREDENTIAL_CRYPTO_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <glibmm/ustring.h>
#include "../../utils/SecureMemory.h"

namespace KeyWarden {

/**
 * @brief OpenSSL primitives used to protect stored API keys
 *
 * - PBKDF2-HMAC-SHA256 derivation of the master key from the passphrase
 * - AES-256-GCM authenticated encryption, 16-byte tag appended to the cipher
 * - SHA-256 digests for duplicate detection and integrity checksums
 * - RAND_bytes for salts and IVs
 *
 * Stateless; all methods are static.
 *
 * @code
 * auto salt = CredentialCrypto::generate_random_bytes(CredentialCrypto::SALT_LENGTH);
 * SecureVector<uint8_t> key;
 * if (!CredentialCrypto::derive_key(passphrase, salt, key)) {
 *     // Handle error
 * }
 * auto iv = CredentialCrypto::generate_random_bytes(CredentialCrypto::IV_LENGTH);
 * std::vector<uint8_t> cipher;
 * if (!CredentialCrypto::encrypt(plaintext, key, iv, cipher)) {
 *     // Handle error
 * }
 * @endcode
 */
class CredentialCrypto {
public:
    static constexpr size_t KEY_LENGTH = 32;        ///< AES-256 key length
    static constexpr size_t SALT_LENGTH = 16;
    static constexpr size_t IV_LENGTH = 12;         ///< GCM IV length (96 bits)
    static constexpr size_t TAG_LENGTH = 16;        ///< GCM tag length (128 bits)
    static constexpr int DEFAULT_PBKDF2_ITERATIONS = 600000;

    /**
     * @brief Derive the master key from a passphrase with PBKDF2-HMAC-SHA256
     * @param passphrase UTF-8 passphrase
     * @param salt Random salt
     * @param key Output; resized to KEY_LENGTH
     * @param iterations PBKDF2 iteration count
     * @return true on success
     */
    [[nodiscard]] static bool derive_key(
        const Glib::ustring& passphrase,
        std::span<const uint8_t> salt,
        SecureVector<uint8_t>& key,
        int iterations = DEFAULT_PBKDF2_ITERATIONS);

    /**
     * @brief Encrypt with AES-256-GCM
     * @param plaintext Data to encrypt
     * @param key KEY_LENGTH bytes
     * @param iv IV_LENGTH bytes, never reused with the same key
     * @param ciphertext Output: cipher bytes followed by the 16-byte tag
     * @return true on success
     */
    [[nodiscard]] static bool encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::vector<uint8_t>& ciphertext);

    /**
     * @brief Decrypt and authenticate AES-256-GCM output
     * @return false on any error, including a tag mismatch
     */
    [[nodiscard]] static bool decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        SecureVector<uint8_t>& plaintext);

    /**
     * @brief Cryptographically secure random bytes
     * @throws std::runtime_error if RAND_bytes fails
     */
    [[nodiscard]] static std::vector<uint8_t> generate_random_bytes(size_t length);

    /** @brief Lower-case hex SHA-256 of the input */
    [[nodiscard]] static std::string sha256_hex(std::span<const uint8_t> data);
    [[nodiscard]] static std::string sha256_hex(std::string_view data);

    /** @brief Constant-time equality (CRYPTO_memcmp); false if sizes differ */
    [[nodiscard]] static bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

    CredentialCrypto() = delete;
    ~CredentialCrypto() = delete;
    CredentialCrypto(const CredentialCrypto&) = delete;
    CredentialCrypto& operator=(const CredentialCrypto&) = delete;
};

} // namespace KeyWarden

#endif // KEYWARDEN_CREDENTIAL_CRYPTO_H
