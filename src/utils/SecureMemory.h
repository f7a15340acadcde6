// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SecureMemory.h
 * @brief Secure memory handling for key material and decrypted API keys
 *
 * RAII wrappers that wipe derived keys and plaintext credentials with
 * OPENSSL_cleanse() before the memory is released.
 */

#ifndef KEYWARDEN_SECURE_MEMORY_H
#define KEYWARDEN_SECURE_MEMORY_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <glibmm/ustring.h>

namespace KeyWarden {

/**
 * @brief Custom deleter for EVP_CIPHER_CTX
 */
struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

/** @brief Owning handle for an OpenSSL cipher context */
using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;

/**
 * @brief Allocator that zeroes memory before handing it back
 *
 * @tparam T Element type (typically uint8_t for key buffers)
 *
 * @code
 * SecureVector<uint8_t> master_key(32);
 * // ... use master_key ...
 * // Zeroized on destruction or reallocation
 * @endcode
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief Wipe a std::string that held sensitive bytes
 * @param str String to clear; left empty afterwards
 */
inline void secure_clear_string(std::string& str) {
    if (!str.empty()) {
        OPENSSL_cleanse(str.data(), str.size());
        str.clear();
    }
}

/**
 * @brief Wipe a Glib::ustring that held a passphrase or an API key
 * @param str String to clear; left empty afterwards
 */
inline void secure_clear_ustring(Glib::ustring& str) {
    if (!str.empty()) {
        OPENSSL_cleanse(const_cast<char*>(str.data()), str.bytes());
        str.clear();
    }
}

/**
 * @brief Move-only holder for a plaintext secret
 *
 * Decrypted API keys are handed to callers in a SecureString so the
 * plaintext is wiped as soon as the caller drops it. Copying is disabled;
 * use clone() when a second owner is required.
 */
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(Glib::ustring str) : str_(std::move(str)) {}

    ~SecureString() {
        secure_clear_ustring(str_);
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept
        : str_(std::move(other.str_)) {
        secure_clear_ustring(other.str_);
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear_ustring(str_);
            str_ = std::move(other.str_);
            secure_clear_ustring(other.str_);
        }
        return *this;
    }

    [[nodiscard]] const Glib::ustring& get() const noexcept { return str_; }

    /** @brief Raw UTF-8 bytes, for hashing and encryption */
    [[nodiscard]] const std::string& raw() const noexcept { return str_.raw(); }

    [[nodiscard]] SecureString clone() const { return SecureString(str_); }

    void clear() noexcept { secure_clear_ustring(str_); }

    [[nodiscard]] bool empty() const noexcept { return str_.empty(); }

    /** @brief Length in characters (UTF-8 code points) */
    [[nodiscard]] size_t length() const noexcept { return str_.length(); }

    [[nodiscard]] size_t bytes() const noexcept { return str_.bytes(); }

private:
    Glib::ustring str_;
};

} // namespace KeyWarden

#endif // KEYWARDEN_SECURE_MEMORY_H
