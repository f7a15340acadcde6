// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef KEYWARDEN_SETTINGS_VALIDATOR_H
#define KEYWARDEN_SETTINGS_VALIDATOR_H

#include "Log.h"
#include "../core/services/SessionCryptoService.h"
#include "../core/services/StorageTypes.h"
#include "../core/validation/ValidationTypes.h"
#include <algorithm>
#include <chrono>
#include <string_view>
#include <giomm/settings.h>

namespace KeyWarden {

/**
 * @brief Loads configuration from GSettings and enforces safe ranges
 *
 * The schema (com.keywarden.settings) declares no ranges; every value is
 * clamped here at runtime so an edited schema or dconf database cannot
 * disable rate limiting or stretch timeouts.
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class SettingsValidator final {
public:
    static inline constexpr std::string_view SCHEMA_ID{"com.keywarden.settings"};

    static inline constexpr int MIN_LIVE_TIMEOUT_MS{1000};
    static inline constexpr int MAX_LIVE_TIMEOUT_MS{60000};

    static inline constexpr int MIN_BATCH_TIMEOUT_MS{1000};
    static inline constexpr int MAX_BATCH_TIMEOUT_MS{120000};

    static inline constexpr int MIN_CACHE_SIZE{10};
    static inline constexpr int MAX_CACHE_SIZE{10000};

    static inline constexpr int MIN_CACHE_TTL{10};          // seconds
    static inline constexpr int MAX_CACHE_TTL{3600};

    static inline constexpr int MIN_RATE_LIMIT{1};
    static inline constexpr int MAX_RATE_LIMIT{600};

    static inline constexpr int MIN_BATCH_CONCURRENCY{1};
    static inline constexpr int MAX_BATCH_CONCURRENCY{32};

    static inline constexpr int MIN_BATCH_SIZE{1};
    static inline constexpr int MAX_BATCH_SIZE{100};

    static inline constexpr int MIN_RECORD_CACHE_SIZE{10};
    static inline constexpr int MAX_RECORD_CACHE_SIZE{1000};

    static inline constexpr int MIN_SESSION_TIMEOUT{60};     // seconds; 0 disables
    static inline constexpr int MAX_SESSION_TIMEOUT{86400};

    static inline constexpr int MIN_PBKDF2_ITERATIONS{100000};
    static inline constexpr int MAX_PBKDF2_ITERATIONS{2000000};

    /**
     * @brief Live probe timeout
     * @param settings GSettings instance (must not be null)
     * @return Milliseconds (1000-60000)
     */
    [[nodiscard]] static std::chrono::milliseconds get_live_timeout(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("live-timeout-ms")};
        return std::chrono::milliseconds(std::clamp(value, MIN_LIVE_TIMEOUT_MS, MAX_LIVE_TIMEOUT_MS));
    }

    [[nodiscard]] static std::chrono::milliseconds get_batch_timeout(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("batch-timeout-ms")};
        return std::chrono::milliseconds(std::clamp(value, MIN_BATCH_TIMEOUT_MS, MAX_BATCH_TIMEOUT_MS));
    }

    /**
     * @brief Capacity of each validation cache (10-10000)
     */
    [[nodiscard]] static size_t get_cache_size(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("validation-cache-size")};
        return static_cast<size_t>(std::clamp(value, MIN_CACHE_SIZE, MAX_CACHE_SIZE));
    }

    [[nodiscard]] static std::chrono::seconds get_format_cache_ttl(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("format-cache-ttl")};
        return std::chrono::seconds(std::clamp(value, MIN_CACHE_TTL, MAX_CACHE_TTL));
    }

    [[nodiscard]] static std::chrono::seconds get_live_cache_ttl(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("live-cache-ttl")};
        return std::chrono::seconds(std::clamp(value, MIN_CACHE_TTL, MAX_CACHE_TTL));
    }

    /**
     * @brief Live probes allowed per key per 60 s window (1-600)
     */
    [[nodiscard]] static uint32_t get_rate_limit(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("rate-limit-requests")};
        return static_cast<uint32_t>(std::clamp(value, MIN_RATE_LIMIT, MAX_RATE_LIMIT));
    }

    [[nodiscard]] static size_t get_batch_concurrency(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("batch-concurrency")};
        return static_cast<size_t>(std::clamp(value, MIN_BATCH_CONCURRENCY, MAX_BATCH_CONCURRENCY));
    }

    [[nodiscard]] static size_t get_batch_size(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("batch-size")};
        return static_cast<size_t>(std::clamp(value, MIN_BATCH_SIZE, MAX_BATCH_SIZE));
    }

    [[nodiscard]] static size_t get_record_cache_size(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("record-cache-size")};
        return static_cast<size_t>(std::clamp(value, MIN_RECORD_CACHE_SIZE, MAX_RECORD_CACHE_SIZE));
    }

    /**
     * @brief Session idle timeout
     * @return 0 when disabled, otherwise seconds (60-86400)
     */
    [[nodiscard]] static std::chrono::seconds get_session_timeout(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("session-timeout")};
        if (value == 0) {
            return std::chrono::seconds(0);
        }
        return std::chrono::seconds(std::clamp(value, MIN_SESSION_TIMEOUT, MAX_SESSION_TIMEOUT));
    }

    [[nodiscard]] static int get_pbkdf2_iterations(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("pbkdf2-iterations")};
        return std::clamp(value, MIN_PBKDF2_ITERATIONS, MAX_PBKDF2_ITERATIONS);
    }

    /**
     * @brief Configured log level; unknown names fall back to Info
     */
    [[nodiscard]] static Log::Level get_log_level(const Glib::RefPtr<Gio::Settings>& settings) {
        const Glib::ustring name{settings->get_string("log-level")};
        return Log::parse_level(name.raw()).value_or(Log::Level::Info);
    }

    // ========================================================================
    // Aggregate loaders
    // ========================================================================

    [[nodiscard]] static ValidationConfig load_validation_config(const Glib::RefPtr<Gio::Settings>& settings) {
        ValidationConfig config;
        config.format_cache_ttl = get_format_cache_ttl(settings);
        config.live_cache_ttl = get_live_cache_ttl(settings);
        config.max_cache_size = get_cache_size(settings);
        config.rate_limit_requests = get_rate_limit(settings);
        config.live_timeout = get_live_timeout(settings);
        config.batch_timeout = get_batch_timeout(settings);
        return config;
    }

    [[nodiscard]] static BatchOptions load_batch_options(const Glib::RefPtr<Gio::Settings>& settings) {
        BatchOptions options;
        options.concurrency = get_batch_concurrency(settings);
        options.batch_size = get_batch_size(settings);
        return options;
    }

    [[nodiscard]] static StorageConfig load_storage_config(const Glib::RefPtr<Gio::Settings>& settings) {
        StorageConfig config;
        config.record_cache_size = get_record_cache_size(settings);
        return config;
    }

    /**
     * @brief Crypto session settings; the salt is left empty for the caller
     */
    [[nodiscard]] static SessionCryptoService::Config load_session_config(const Glib::RefPtr<Gio::Settings>& settings) {
        SessionCryptoService::Config config;
        config.pbkdf2_iterations = get_pbkdf2_iterations(settings);
        config.session_timeout = get_session_timeout(settings);
        return config;
    }

private:
    SettingsValidator() = delete;
    ~SettingsValidator() = delete;
    SettingsValidator(const SettingsValidator&) = delete;
    SettingsValidator& operator=(const SettingsValidator&) = delete;
    SettingsValidator(SettingsValidator&&) = delete;
    SettingsValidator& operator=(SettingsValidator&&) = delete;
};

} // namespace KeyWarden

#endif // KEYWARDEN_SETTINGS_VALIDATOR_H
