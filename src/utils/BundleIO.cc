// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "BundleIO.h"
#include "Log.h"
#include <fstream>
#include <iterator>
#include <string>
#include <fcntl.h>     // For open
#include <unistd.h>    // For fsync

namespace KeyWarden::BundleIO {

namespace fs = std::filesystem;

namespace {

void sync_file(const fs::path& path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd >= 0) {
        fsync(fd);
        close(fd);
    }
}

} // namespace

CredentialResult<> save_bundle(const fs::path& path, const keywarden::ExportBundle& bundle) {
    std::string data;
    if (!bundle.SerializeToString(&data)) {
        Log::error("BundleIO: Failed to serialize bundle with {} entries", bundle.keys_size());
        return std::unexpected(CredentialError::SerializationFailed);
    }

    fs::path temp_path = path;
    temp_path += ".tmp";

    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                Log::error("BundleIO: Failed to create {}", temp_path.string());
                return std::unexpected(CredentialError::StorageFailed);
            }
            file.write(data.data(), static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file.good()) {
                Log::error("BundleIO: Failed to write {}", temp_path.string());
                std::error_code ec;
                fs::remove(temp_path, ec);
                return std::unexpected(CredentialError::StorageFailed);
            }
        }

        fs::permissions(temp_path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
        sync_file(temp_path);
        fs::rename(temp_path, path);
    } catch (const fs::filesystem_error& e) {
        Log::error("BundleIO: Exception writing {}: {}", path.string(), e.what());
        std::error_code ec;
        fs::remove(temp_path, ec);
        return std::unexpected(CredentialError::StorageFailed);
    }

    Log::info("BundleIO: Wrote {} entries to {}", bundle.keys_size(), path.string());
    return {};
}

CredentialResult<keywarden::ExportBundle> load_bundle(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(CredentialError::NotFound);
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        Log::error("BundleIO: Cannot stat {}: {}", path.string(), ec.message());
        return std::unexpected(CredentialError::StorageFailed);
    }
    if (size == 0 || size > MAX_BUNDLE_SIZE) {
        Log::warning("BundleIO: Rejecting bundle of {} bytes", size);
        return std::unexpected(CredentialError::InvalidBundle);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Log::error("BundleIO: Failed to open {}", path.string());
        return std::unexpected(CredentialError::StorageFailed);
    }
    std::string data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::unexpected(CredentialError::StorageFailed);
    }

    keywarden::ExportBundle bundle;
    if (!bundle.ParseFromString(data)) {
        Log::warning("BundleIO: {} is not a valid bundle", path.string());
        return std::unexpected(CredentialError::InvalidBundle);
    }
    return bundle;
}

} // namespace KeyWarden::BundleIO
