// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "CredentialCrypto.h"
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace KeyWarden {

bool CredentialCrypto::derive_key(
    const Glib::ustring& passphrase,
    std::span<const uint8_t> salt,
    SecureVector<uint8_t>& key,
    int iterations) {

    key.resize(KEY_LENGTH);

    const int result = PKCS5_PBKDF2_HMAC(
        passphrase.c_str(), static_cast<int>(passphrase.bytes()),
        salt.data(), static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        static_cast<int>(KEY_LENGTH),
        key.data());

    return result == 1;
}

bool CredentialCrypto::encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::vector<uint8_t>& ciphertext) {

    if (key.size() != KEY_LENGTH || iv.size() != IV_LENGTH) {
        return false;
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return false;
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1) {
        return false;
    }

    ciphertext.resize(plaintext.size() + EVP_CIPHER_block_size(EVP_aes_256_gcm()) + TAG_LENGTH);
    int len = 0;
    int ciphertext_len = 0;

    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return false;
    }
    ciphertext_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + len, &len) != 1) {
        return false;
    }
    ciphertext_len += len;

    SecureVector<uint8_t> tag(TAG_LENGTH);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(TAG_LENGTH), tag.data()) != 1) {
        return false;
    }

    ciphertext.resize(ciphertext_len);
    ciphertext.insert(ciphertext.end(), tag.begin(), tag.end());
    return true;
}

bool CredentialCrypto::decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    SecureVector<uint8_t>& plaintext) {

    if (key.size() != KEY_LENGTH || iv.size() != IV_LENGTH || ciphertext.size() < TAG_LENGTH) {
        return false;
    }

    const auto body = ciphertext.first(ciphertext.size() - TAG_LENGTH);
    SecureVector<uint8_t> tag(ciphertext.end() - TAG_LENGTH, ciphertext.end());

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return false;
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1) {
        return false;
    }

    plaintext.resize(body.size() + EVP_CIPHER_block_size(EVP_aes_256_gcm()));
    int len = 0;
    int plaintext_len = 0;

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          body.data(), static_cast<int>(body.size())) != 1) {
        return false;
    }
    plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(TAG_LENGTH), tag.data()) != 1) {
        return false;
    }

    // Verifies the tag
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) != 1) {
        plaintext.clear();
        return false;
    }
    plaintext_len += len;

    plaintext.resize(plaintext_len);
    return true;
}

std::vector<uint8_t> CredentialCrypto::generate_random_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
    }
    return bytes;
}

std::string CredentialCrypto::sha256_hex(std::span<const uint8_t> data) {
    static constexpr char HEX[] = "0123456789abcdef";

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), digest);

    std::string hex;
    hex.reserve(SHA256_DIGEST_LENGTH * 2);
    for (const unsigned char byte : digest) {
        hex.push_back(HEX[byte >> 4]);
        hex.push_back(HEX[byte & 0x0F]);
    }
    return hex;
}

std::string CredentialCrypto::sha256_hex(std::string_view data) {
    return sha256_hex(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

bool CredentialCrypto::constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace KeyWarden
