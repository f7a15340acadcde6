// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "CredentialTypes.h"
#include "ProviderRules.h"
#include <algorithm>
#include <array>
#include <chrono>
#include <format>
#include <stdexcept>
#include <openssl/rand.h>

namespace KeyWarden {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string mask_key(const Glib::ustring& key, size_t visible) {
    const size_t length = key.length();
    if (length <= visible * 2) {
        return "***";
    }

    const size_t keep = std::min<size_t>(visible, 8);
    return std::string(key.substr(0, keep).raw()) + "..." +
           std::string(key.substr(length - keep).raw());
}

std::string generate_key_id(keywarden::Provider provider, std::string_view hash_suffix) {
    static constexpr std::string_view BASE36 = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::array<unsigned char, 6> random_bytes{};
    if (RAND_bytes(random_bytes.data(), static_cast<int>(random_bytes.size())) != 1) {
        throw std::runtime_error("Failed to generate random key id");
    }

    std::string random_part;
    random_part.reserve(random_bytes.size());
    for (const auto byte : random_bytes) {
        random_part.push_back(BASE36[byte % BASE36.size()]);
    }

    std::string id = std::format("{}-{}-{}", to_string(provider), now_ms(), random_part);
    if (!hash_suffix.empty()) {
        id += '-';
        id += hash_suffix.substr(0, std::min<size_t>(hash_suffix.size(), 8));
    }
    return id;
}

std::vector<keywarden::Permission> default_permissions() {
    return {keywarden::PERMISSION_READ, keywarden::PERMISSION_WRITE};
}

bool is_key_expired(const keywarden::CredentialMetadata& metadata, int64_t now) {
    return metadata.has_expires_at() && metadata.expires_at() <= now;
}

std::optional<int64_t> days_until_expiration(const keywarden::CredentialMetadata& metadata,
                                             int64_t now) {
    if (!metadata.has_expires_at()) {
        return std::nullopt;
    }
    const int64_t remaining = metadata.expires_at() - now;
    // Round towards +inf so a key expiring later today reports 1 day
    if (remaining > 0) {
        return (remaining + MS_PER_DAY - 1) / MS_PER_DAY;
    }
    return remaining / MS_PER_DAY;
}

bool needs_rotation(const keywarden::EncryptedCredential& record, int64_t now) {
    if (!record.configuration().has_rotation()) {
        return false;
    }
    const auto& rotation = record.configuration().rotation();
    if (!rotation.enabled() || rotation.interval_days() == 0) {
        return false;
    }

    int64_t since = record.metadata().created_at();
    if (record.has_rotation_status() && record.rotation_status().last_rotation() > 0) {
        since = record.rotation_status().last_rotation();
    }
    return now - since >= static_cast<int64_t>(rotation.interval_days()) * MS_PER_DAY;
}

keywarden::KeyStatus effective_status(const keywarden::CredentialMetadata& metadata, int64_t now) {
    if (metadata.status() == keywarden::KEY_STATUS_REVOKED) {
        return metadata.status();
    }
    if (is_key_expired(metadata, now)) {
        return keywarden::KEY_STATUS_EXPIRED;
    }
    return metadata.status();
}

keywarden::UsageStats make_empty_usage_stats(int64_t now) {
    keywarden::UsageStats stats;
    stats.set_last_reset_at(now);
    return stats;
}

std::string_view to_string(keywarden::KeyStatus status) noexcept {
    switch (status) {
        case keywarden::KEY_STATUS_ACTIVE:   return "active";
        case keywarden::KEY_STATUS_INACTIVE: return "inactive";
        case keywarden::KEY_STATUS_EXPIRED:  return "expired";
        case keywarden::KEY_STATUS_REVOKED:  return "revoked";
        case keywarden::KEY_STATUS_ROTATING: return "rotating";
        default:                             break;
    }
    return "unknown";
}

std::string_view to_string(keywarden::KeyType type) noexcept {
    switch (type) {
        case keywarden::KEY_TYPE_STANDARD:   return "standard";
        case keywarden::KEY_TYPE_PRO:        return "pro";
        case keywarden::KEY_TYPE_ENTERPRISE: return "enterprise";
        default:                             break;
    }
    return "standard";
}

std::string_view to_string(keywarden::RotationState state) noexcept {
    switch (state) {
        case keywarden::ROTATION_STATE_NONE:        return "none";
        case keywarden::ROTATION_STATE_SCHEDULED:   return "scheduled";
        case keywarden::ROTATION_STATE_IN_PROGRESS: return "in_progress";
        case keywarden::ROTATION_STATE_COMPLETED:   return "completed";
        case keywarden::ROTATION_STATE_FAILED:      return "failed";
        default:                                    break;
    }
    return "none";
}

std::string_view to_string(keywarden::Permission permission) noexcept {
    switch (permission) {
        case keywarden::PERMISSION_READ:   return "read";
        case keywarden::PERMISSION_WRITE:  return "write";
        case keywarden::PERMISSION_DELETE: return "delete";
        case keywarden::PERMISSION_ADMIN:  return "admin";
        default:                           break;
    }
    return "read";
}

std::optional<keywarden::KeyStatus> parse_key_status(std::string_view tag) noexcept {
    static constexpr std::array<keywarden::KeyStatus, 5> STATUSES = {
        keywarden::KEY_STATUS_ACTIVE, keywarden::KEY_STATUS_INACTIVE,
        keywarden::KEY_STATUS_EXPIRED, keywarden::KEY_STATUS_REVOKED,
        keywarden::KEY_STATUS_ROTATING,
    };
    for (const auto status : STATUSES) {
        if (to_string(status) == tag) {
            return status;
        }
    }
    return std::nullopt;
}

} // namespace KeyWarden
