// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "FileBlobStore.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <fstream>
#include <iterator>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace KeyWarden {

namespace {

constexpr std::string_view TEMP_SUFFIX = ".tmp";

void sync_directory(const fs::path& dir) {
#ifndef _WIN32
    const int dir_fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
        fsync(dir_fd);
        close(dir_fd);
    }
#else
    (void)dir;
#endif
}

} // anonymous namespace

FileBlobStore::FileBlobStore(fs::path directory)
    : m_directory(std::move(directory)) {
    if (!fs::exists(m_directory)) {
        fs::create_directories(m_directory);
#ifndef _WIN32
        fs::permissions(m_directory, fs::perms::owner_all, fs::perm_options::replace);
#endif
    }
}

bool FileBlobStore::is_valid_key(std::string_view key) noexcept {
    if (key.empty() || key.front() == '.') {
        return false;
    }
    return std::ranges::all_of(key, [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    });
}

bool FileBlobStore::is_available() const {
    std::error_code ec;
    return fs::is_directory(m_directory, ec);
}

// ============================================================================
// Reading
// ============================================================================

StoreResult<std::string> FileBlobStore::read_locked(std::string_view key) const {
    if (!is_valid_key(key)) {
        return std::unexpected(StoreError::INVALID_KEY);
    }

    const fs::path path = m_directory / std::string(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(StoreError::NOT_FOUND);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Log::error("FileBlobStore: Failed to open {}", path.string());
        return std::unexpected(StoreError::READ_FAILED);
    }

    std::string value((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        Log::error("FileBlobStore: Failed to read {}", path.string());
        return std::unexpected(StoreError::READ_FAILED);
    }
    return value;
}

StoreResult<std::string> FileBlobStore::get(std::string_view key) const {
    std::lock_guard lock(m_mutex);
    return read_locked(key);
}

StoreResult<std::map<std::string, std::string>>
FileBlobStore::get_batch(const std::vector<std::string>& keys) const {
    std::lock_guard lock(m_mutex);
    std::map<std::string, std::string> found;
    for (const auto& key : keys) {
        auto value = read_locked(key);
        if (value) {
            found.emplace(key, std::move(*value));
        } else if (value.error() != StoreError::NOT_FOUND) {
            return std::unexpected(value.error());
        }
    }
    return found;
}

StoreResult<std::vector<std::string>> FileBlobStore::list_keys(std::string_view prefix) const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> keys;
    try {
        for (const auto& entry : fs::directory_iterator(m_directory)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const std::string name = entry.path().filename().string();
            if (name.ends_with(TEMP_SUFFIX) || !name.starts_with(prefix)) {
                continue;
            }
            keys.push_back(name);
        }
    } catch (const fs::filesystem_error& e) {
        Log::error("FileBlobStore: Failed to list {}: {}", m_directory.string(), e.what());
        return std::unexpected(StoreError::READ_FAILED);
    }
    std::ranges::sort(keys);
    return keys;
}

// ============================================================================
// Writing
// ============================================================================

StoreResult<> FileBlobStore::write_locked(std::string_view key, std::string_view value) {
    if (!is_valid_key(key)) {
        return std::unexpected(StoreError::INVALID_KEY);
    }

    const fs::path path = m_directory / std::string(key);
    const fs::path temp_path = m_directory / (std::string(key) + std::string(TEMP_SUFFIX));

    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                Log::error("FileBlobStore: Failed to create temporary file: {}", temp_path.string());
                return std::unexpected(StoreError::WRITE_FAILED);
            }
            file.write(value.data(), static_cast<std::streamsize>(value.size()));
            file.flush();
            if (!file.good()) {
                Log::error("FileBlobStore: Failed to write {}", temp_path.string());
                std::error_code ec;
                fs::remove(temp_path, ec);
                return std::unexpected(StoreError::WRITE_FAILED);
            }
        }

#ifndef _WIN32
        fs::permissions(temp_path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
#endif
        fs::rename(temp_path, path);
        sync_directory(m_directory);
        return {};

    } catch (const fs::filesystem_error& e) {
        Log::error("FileBlobStore: Exception writing {}: {}", path.string(), e.what());
        std::error_code ec;
        fs::remove(temp_path, ec);
        return std::unexpected(StoreError::WRITE_FAILED);
    }
}

StoreResult<> FileBlobStore::set(std::string_view key, std::string_view value) {
    std::lock_guard lock(m_mutex);
    return write_locked(key, value);
}

StoreResult<> FileBlobStore::set_batch(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::lock_guard lock(m_mutex);
    for (const auto& [key, value] : entries) {
        auto result = write_locked(key, value);
        if (!result) {
            return result;
        }
    }
    return {};
}

StoreResult<> FileBlobStore::remove(std::string_view key) {
    std::lock_guard lock(m_mutex);
    if (!is_valid_key(key)) {
        return std::unexpected(StoreError::INVALID_KEY);
    }

    const fs::path path = m_directory / std::string(key);
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        if (ec) {
            Log::error("FileBlobStore: Failed to remove {}: {}", path.string(), ec.message());
            return std::unexpected(StoreError::WRITE_FAILED);
        }
        return std::unexpected(StoreError::NOT_FOUND);
    }
    sync_directory(m_directory);
    return {};
}

} // namespace KeyWarden
