// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KeyValidationService.h
 * @brief Provider-aware API key validation engine
 *
 * Responsibilities:
 * - Static format validation against the provider rule table (memoized)
 * - Entropy and weak/test key analysis
 * - Live probing of the provider's API (rate limited, successes memoized)
 * - Comprehensive validation combining the above
 * - Batched validation with bounded concurrency
 *
 * NOT responsible for:
 * - Storing keys (see CredentialStorageService)
 * - The HTTP transport (see IHttpProbe)
 *
 * The format cache, live cache and rate limiter are members of this
 * object. Construct one engine per process and share it by reference.
 */

#pragma once

#include "../ProviderRules.h"
#include "../validation/IHttpProbe.h"
#include "../validation/RateLimiter.h"
#include "../validation/ValidationCache.h"
#include "../validation/ValidationTypes.h"
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace KeyWarden {

/**
 * @class KeyValidationService
 *
 * Thread-safety: all public methods may be called concurrently; the caches
 * and the rate limiter are internally synchronized.
 */
class KeyValidationService {
public:
    // ========================================================================
    // Constants
    // ========================================================================

    static constexpr std::string_view USER_AGENT = "KeyWarden/1.0";
    static constexpr std::string_view ANTHROPIC_API_VERSION = "2023-06-01";

    struct CacheStats {
        size_t format_entries = 0;
        size_t live_entries = 0;
        size_t format_hits = 0;
        size_t live_hits = 0;
        size_t rate_limit_buckets = 0;
    };

    // ========================================================================
    // Construction
    // ========================================================================

    /**
     * @brief Construct the engine
     * @param probe Non-owning transport for live validation
     * @param config Cache, rate-limit and timeout settings
     * @throws std::invalid_argument if probe is null
     */
    explicit KeyValidationService(IHttpProbe* probe, ValidationConfig config = {});

    virtual ~KeyValidationService() = default;

    KeyValidationService(const KeyValidationService&) = delete;
    KeyValidationService& operator=(const KeyValidationService&) = delete;
    KeyValidationService(KeyValidationService&&) = delete;
    KeyValidationService& operator=(KeyValidationService&&) = delete;

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * @brief Check a key's shape against the provider rule
     *
     * The key is sanitized first. A warning (not an error) is emitted when
     * the key looks like it belongs to a different provider.
     *
     * @param raw_key Key as entered by the user
     * @param provider Declared provider
     */
    [[nodiscard]] ValidationResult validate_format(std::string_view raw_key,
                                                   keywarden::Provider provider);

    /**
     * @brief Probe the provider's API with the key
     *
     * custom providers return an UNSUPPORTED result without any request.
     * Only successful probes are cached; a failed probe is always retried.
     *
     * @param raw_key Key to test
     * @param provider Provider whose endpoint to probe
     * @param options Timeout, cache and rate-limit switches
     * @param stop Cancellation; yields an ABORTED result
     */
    [[nodiscard]] LiveValidationResult validate_live(std::string_view raw_key,
                                                     keywarden::Provider provider,
                                                     const LiveValidationOptions& options = {},
                                                     std::stop_token stop = {});

    /**
     * @brief Format, security, live and recommendation passes in one call
     *
     * An empty key or an unknown provider tag short-circuits to a failure
     * result without running any sub-validator.
     *
     * @param raw_key Key to validate
     * @param provider_tag Provider tag as supplied by the caller
     */
    [[nodiscard]] virtual ExtendedValidationResult validate_comprehensive(
        std::string_view raw_key,
        std::string_view provider_tag,
        const ComprehensiveOptions& options = {},
        std::stop_token stop = {});

    /**
     * @brief Validate many keys
     *
     * Entries are processed in chunks of batch_size; within a chunk at most
     * `concurrency` validations run at once. Results are returned in input
     * order. An exception while validating one entry becomes a failure
     * result for that entry only. With fail_fast, processing stops after the
     * first chunk containing an invalid result. If stop is requested, the
     * remaining entries are reported as aborted.
     */
    [[nodiscard]] std::vector<ExtendedValidationResult> batch_validate(
        const std::vector<BatchEntry>& entries,
        const BatchOptions& options = {},
        std::stop_token stop = {});

    // ========================================================================
    // Cache management
    // ========================================================================

    void clear_caches();
    [[nodiscard]] CacheStats cache_stats() const;

    [[nodiscard]] const ValidationConfig& config() const noexcept { return m_config; }

    /**
     * @brief Probe URL for a provider, empty when live validation is unsupported
     * @param base_url Optional API root (e.g. a proxy) used instead of the provider's own
     */
    [[nodiscard]] static std::string probe_endpoint(keywarden::Provider provider,
                                                    std::optional<std::string_view> base_url = std::nullopt);

    /** @brief Authentication and client headers for a probe */
    [[nodiscard]] static HttpHeaders build_headers(std::string_view key, keywarden::Provider provider);

    /** @brief Result used for every short-circuit and caught failure */
    [[nodiscard]] static ExtendedValidationResult make_failure_result(std::string error);

private:
    [[nodiscard]] ValidationResult check_format(const std::string& sanitized_key,
                                                keywarden::Provider provider) const;

    IHttpProbe* m_probe;
    ValidationConfig m_config;
    ValidationCache<ValidationResult> m_format_cache;
    ValidationCache<LiveValidationResult> m_live_cache;
    RateLimiter m_rate_limiter;
};

} // namespace KeyWarden
