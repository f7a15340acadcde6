// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef KEYWARDEN_BUNDLE_IO_H
#define KEYWARDEN_BUNDLE_IO_H

#include "../core/CredentialError.h"
#include "credential.pb.h"
#include <cstdint>
#include <filesystem>

/**
 * @brief Reading and writing export bundles on disk
 *
 * Bundles are stored as serialized keywarden.ExportBundle messages. Secrets
 * inside a bundle stay encrypted, but the file still reveals key metadata,
 * so it is written with owner-only permissions.
 */
namespace KeyWarden::BundleIO {

/** @brief Largest bundle load_bundle() will read */
inline constexpr std::uintmax_t MAX_BUNDLE_SIZE = 64 * 1024 * 1024;

/**
 * @brief Write a bundle atomically (temporary file, fsync, rename)
 * @param path Destination file
 * @param bundle Bundle to serialize
 * @return SerializationFailed or StorageFailed on failure
 */
[[nodiscard]] CredentialResult<> save_bundle(const std::filesystem::path& path,
                                             const keywarden::ExportBundle& bundle);

/**
 * @brief Read a bundle written by save_bundle()
 * @return NotFound if the file is missing, InvalidBundle if it is empty,
 *         oversized or does not parse, StorageFailed on read errors
 */
[[nodiscard]] CredentialResult<keywarden::ExportBundle> load_bundle(const std::filesystem::path& path);

} // namespace KeyWarden::BundleIO

#endif // KEYWARDEN_BUNDLE_IO_H
