// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file ICryptoService.h
 * @brief Interface for the encryption collaborator of the storage manager
 *
 * The storage manager never touches cipher internals. It asks this service
 * to encrypt a secret into an EncryptedPayload, to decrypt one back, and to
 * compute the digests used for duplicate detection and integrity checks.
 *
 * The session model lives here too: a service is "initialized" once a
 * master key has been derived, and the session is "active" until it is
 * locked or times out.
 */

#pragma once

#include "../CredentialError.h"
#include "../../utils/SecureMemory.h"
#include "credential.pb.h"
#include <string>
#include <string_view>
#include <glibmm/ustring.h>

namespace KeyWarden {

class ICryptoService {
public:
    virtual ~ICryptoService() = default;

    /**
     * @brief Derive the master key and open a session
     * @param passphrase User passphrase
     * @return CredentialError::EncryptionFailed if key derivation fails
     */
    [[nodiscard]] virtual CredentialResult<> initialize(const Glib::ustring& passphrase) = 0;

    /**
     * @brief Re-open a locked session
     * @return CredentialError::NotInitialized if never initialized,
     *         CredentialError::SessionExpired if the passphrase does not match
     */
    [[nodiscard]] virtual CredentialResult<> unlock(const Glib::ustring& passphrase) = 0;

    /** @brief End the session; the master key stays derived but unusable */
    virtual void lock() = 0;

    /** @brief Wipe the master key and return to the uninitialized state */
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_initialized() const = 0;
    [[nodiscard]] virtual bool is_session_active() const = 0;

    /**
     * @brief Encrypt a secret with a freshly generated IV
     * @return Payload with cipher, IV, algorithm tag and version
     */
    [[nodiscard]] virtual CredentialResult<keywarden::EncryptedPayload> encrypt(
        std::string_view plaintext) = 0;

    /**
     * @brief Decrypt a payload produced by encrypt()
     * @return CredentialError::DecryptionFailed on authentication failure
     */
    [[nodiscard]] virtual CredentialResult<SecureString> decrypt(
        const keywarden::EncryptedPayload& payload) = 0;

    /** @brief Integrity digest (hex) over arbitrary bytes */
    [[nodiscard]] virtual std::string checksum(std::string_view bytes) const = 0;

    /** @brief Constant-time comparison of checksum(bytes) against digest */
    [[nodiscard]] virtual bool verify_checksum(std::string_view bytes,
                                               std::string_view digest) const = 0;

    /**
     * @brief Deterministic one-way hash of a raw key
     *
     * Used only as the duplicate-index key; never reversible.
     */
    [[nodiscard]] virtual std::string hash_key(std::string_view raw_key) const = 0;
};

} // namespace KeyWarden
