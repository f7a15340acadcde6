// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KeyValidationService.h"
#include "../crypto/CredentialCrypto.h"
#include "../validation/KeyAnalysis.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <future>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <glibmm/ustring.h>

namespace KeyWarden {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::chrono::microseconds elapsed_since(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start);
}

/// Cache and bucket keys never carry the secret itself
std::string fingerprint(keywarden::Provider provider, std::string_view sanitized_key) {
    return std::format("{}:{}", to_string(provider), CredentialCrypto::sha256_hex(sanitized_key));
}

std::string describe_probe_failure(const ProbeResponse& response) {
    switch (response.failure) {
        case ProbeFailure::TIMEOUT:
            return response.error.empty() ? "Request timeout" : response.error;
        case ProbeFailure::ABORTED:
            return "Request aborted";
        case ProbeFailure::NETWORK:
            return response.error.empty() ? "Network error" : response.error;
        case ProbeFailure::NONE:
            break;
    }
    return std::format("HTTP {}: {}", response.status,
                       response.status_text.empty() ? "Request failed" : response.status_text);
}

LiveErrorCode to_live_error(ProbeFailure failure) noexcept {
    switch (failure) {
        case ProbeFailure::TIMEOUT: return LiveErrorCode::TIMEOUT;
        case ProbeFailure::NETWORK: return LiveErrorCode::NETWORK;
        case ProbeFailure::ABORTED: return LiveErrorCode::ABORTED;
        case ProbeFailure::NONE:    break;
    }
    return LiveErrorCode::HTTP;
}

} // anonymous namespace

KeyValidationService::KeyValidationService(IHttpProbe* probe, ValidationConfig config)
    : m_probe(probe)
    , m_config(config)
    , m_format_cache(config.format_cache_ttl, config.max_cache_size)
    , m_live_cache(config.live_cache_ttl, config.max_cache_size)
    , m_rate_limiter(RateLimiter::Config{
          .max_requests = config.rate_limit_requests,
          .window = config.rate_limit_window,
      }) {
    if (!m_probe) {
        throw std::invalid_argument("KeyValidationService: probe cannot be null");
    }
}

// ============================================================================
// Endpoints and headers
// ============================================================================

std::string KeyValidationService::probe_endpoint(keywarden::Provider provider,
                                                 std::optional<std::string_view> base_url) {
    std::string_view root;
    std::string_view path;
    switch (provider) {
        case keywarden::PROVIDER_OPENAI:
            root = "https://api.openai.com";
            path = "/v1/models";
            break;
        case keywarden::PROVIDER_ANTHROPIC:
            root = "https://api.anthropic.com";
            path = "/v1/models";
            break;
        case keywarden::PROVIDER_GOOGLE:
            root = "https://generativelanguage.googleapis.com";
            path = "/v1beta/models";
            break;
        default:
            // Custom providers are never probed, whatever endpoint they carry
            return {};
    }

    if (base_url && !base_url->empty()) {
        root = *base_url;
        while (root.ends_with('/')) {
            root.remove_suffix(1);
        }
    }
    return std::format("{}{}", root, path);
}

HttpHeaders KeyValidationService::build_headers(std::string_view key, keywarden::Provider provider) {
    HttpHeaders headers{
        {"User-Agent", std::string(USER_AGENT)},
        {"Content-Type", "application/json"},
    };

    switch (provider) {
        case keywarden::PROVIDER_ANTHROPIC:
            headers["x-api-key"] = std::string(key);
            headers["anthropic-version"] = std::string(ANTHROPIC_API_VERSION);
            break;
        case keywarden::PROVIDER_GOOGLE:
            headers["x-goog-api-key"] = std::string(key);
            break;
        default:
            // openai
            headers["Authorization"] = std::format("Bearer {}", key);
            break;
    }
    return headers;
}

ExtendedValidationResult KeyValidationService::make_failure_result(std::string error) {
    ExtendedValidationResult result;
    result.is_valid = false;
    result.errors.push_back(error);

    ValidationResult format;
    format.is_valid = false;
    format.errors.push_back(std::move(error));
    result.format = std::move(format);
    return result;
}

// ============================================================================
// Format validation
// ============================================================================

ValidationResult KeyValidationService::check_format(const std::string& sanitized_key,
                                                    keywarden::Provider provider) const {
    ValidationResult result;
    result.provider = provider;

    const Glib::ustring text(sanitized_key);
    if (!text.validate()) {
        result.errors.emplace_back("Key contains invalid UTF-8");
        return result;
    }

    const ProviderRule& rule = provider_rule(provider);
    const size_t length = text.length();

    if (length < rule.min_length) {
        result.errors.push_back(std::format(
            "Key too short. Expected at least {} characters, got {}", rule.min_length, length));
    }
    if (length > rule.max_length) {
        result.errors.push_back(std::format(
            "Key too long. Expected at most {} characters, got {}", rule.max_length, length));
    }
    if (rule.required_prefix && !sanitized_key.starts_with(*rule.required_prefix)) {
        result.errors.push_back(std::format("Key must start with \"{}\"", *rule.required_prefix));
    }
    // Every rule pattern is bounded by max_length, so oversized keys cannot match
    const bool oversized = length > rule.max_length;
    if (oversized || !std::regex_match(sanitized_key, rule.pattern)) {
        result.errors.push_back(std::format("Key format invalid. {}", rule.description));
    }

    std::optional<keywarden::Provider> detected;
    if (sanitized_key.size() <= MAX_PATTERN_SCAN_LENGTH) {
        detected = detect_provider(sanitized_key);
    }
    if (detected && *detected != provider) {
        result.warnings.push_back(std::format("Key appears to be for {}, not {}",
                                              to_string(*detected), to_string(provider)));
    }

    result.provider = detected.value_or(provider);
    result.key_type = keywarden::KEY_TYPE_STANDARD;
    result.estimated_tier = keywarden::KEY_TYPE_STANDARD;
    result.is_valid = result.errors.empty();
    return result;
}

ValidationResult KeyValidationService::validate_format(std::string_view raw_key,
                                                       keywarden::Provider provider) {
    const std::string sanitized = sanitize_key(raw_key);
    const std::string cache_key = fingerprint(provider, sanitized);

    if (auto cached = m_format_cache.get(cache_key)) {
        cached->from_cache = true;
        return *cached;
    }

    ValidationResult result = check_format(sanitized, provider);
    m_format_cache.put(cache_key, result);
    return result;
}

// ============================================================================
// Live validation
// ============================================================================

LiveValidationResult KeyValidationService::validate_live(std::string_view raw_key,
                                                         keywarden::Provider provider,
                                                         const LiveValidationOptions& options,
                                                         std::stop_token stop) {
    LiveValidationResult result;
    const std::string key = sanitize_key(raw_key);

    if (options.base_url) {
        result.endpoint = probe_endpoint(provider, *options.base_url);
    } else {
        result.endpoint = probe_endpoint(provider);
    }
    if (result.endpoint.empty()) {
        result.endpoint = "none";
        result.error = std::format("Live validation not supported for provider: {}", to_string(provider));
        result.error_code = LiveErrorCode::UNSUPPORTED;
        return result;
    }

    const std::string bucket = fingerprint(provider, key);
    const std::string cache_key = std::format("{}@{}", bucket, result.endpoint);

    // Every live call counts against the key's budget, cache hits included
    if (options.enable_rate_limit && !m_rate_limiter.try_acquire(bucket)) {
        Log::warning("Live validation for {} rate limited", to_string(provider));
        result.error = "Rate limit exceeded";
        result.error_code = LiveErrorCode::RATE_LIMITED;
        return result;
    }

    if (options.enable_cache) {
        if (auto cached = m_live_cache.get(cache_key)) {
            cached->from_cache = true;
            return *cached;
        }
    }

    if (stop.stop_requested()) {
        result.error = "Request aborted";
        result.error_code = LiveErrorCode::ABORTED;
        return result;
    }

    const auto timeout = options.timeout.value_or(m_config.live_timeout);
    const auto start = SteadyClock::now();

    ProbeResponse response;
    try {
        response = m_probe->get(result.endpoint, build_headers(key, provider), timeout, stop);
    } catch (const std::exception& e) {
        response.failure = ProbeFailure::NETWORK;
        response.error = e.what();
    }
    result.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - start);

    if (response.failure == ProbeFailure::NONE) {
        result.status_code = response.status;
    }

    if (response.failure == ProbeFailure::NONE && response.ok) {
        result.is_valid = true;
        result.is_active = true;
        Log::debug("Live validation for {} succeeded in {}ms", to_string(provider),
                   result.response_time.count());
        if (options.enable_cache) {
            m_live_cache.put(cache_key, result);
        }
        return result;
    }

    result.error = describe_probe_failure(response);
    result.error_code = to_live_error(response.failure);
    Log::info("Live validation for {} failed: {}", to_string(provider), *result.error);
    return result;
}

// ============================================================================
// Comprehensive validation
// ============================================================================

ExtendedValidationResult KeyValidationService::validate_comprehensive(
    std::string_view raw_key,
    std::string_view provider_tag,
    const ComprehensiveOptions& options,
    std::stop_token stop) {

    const auto start = SteadyClock::now();

    if (raw_key.empty()) {
        return make_failure_result("Invalid key input");
    }
    const auto provider = parse_provider(provider_tag);
    if (!provider) {
        return make_failure_result("Invalid provider");
    }

    try {
        const std::string sanitized = sanitize_key(raw_key);
        if (sanitized.empty()) {
            return make_failure_result("Key is empty after sanitization");
        }

        ExtendedValidationResult result;

        const auto format_start = SteadyClock::now();
        ValidationResult format = validate_format(sanitized, *provider);
        result.performance.format_validation_time = elapsed_since(format_start);

        result.is_valid = format.is_valid;
        result.errors = format.errors;
        result.warnings = format.warnings;
        result.provider = format.provider;
        result.key_type = format.key_type;
        result.estimated_tier = format.estimated_tier;
        result.format = std::move(format);

        if (options.check_entropy || options.check_exposed_keys) {
            SecurityAnalysis security = analyze_key_security(sanitized,
                                                             m_config.low_entropy_threshold,
                                                             options.check_entropy,
                                                             options.check_exposed_keys);
            result.security_warnings = security.warnings;
            result.security = std::move(security);
        }

        if (options.test_live && result.format->is_valid) {
            LiveValidationOptions live_options;
            live_options.timeout = options.timeout;
            live_options.enable_cache = options.enable_cache;
            live_options.enable_rate_limit = options.enable_rate_limit;

            const auto live_start = SteadyClock::now();
            LiveValidationResult live = validate_live(sanitized, *provider, live_options, stop);
            result.performance.live_validation_time = elapsed_since(live_start);

            if (!live.is_valid) {
                result.is_valid = false;
                result.errors.push_back(std::format("Live validation failed: {}",
                                                    live.error.value_or("Unknown error")));
            }
            result.live = std::move(live);
        }

        if (options.provide_recommendations) {
            result.recommendations = generate_recommendations(*provider,
                                                              !result.security_warnings.empty());
        }

        result.performance.total_time = elapsed_since(start);
        return result;
    } catch (const std::exception& e) {
        Log::error("Comprehensive validation threw: {}", e.what());
        auto failure = make_failure_result(std::format("Validation failed: {}", e.what()));
        failure.performance.total_time = elapsed_since(start);
        return failure;
    }
}

// ============================================================================
// Batch validation
// ============================================================================

std::vector<ExtendedValidationResult> KeyValidationService::batch_validate(
    const std::vector<BatchEntry>& entries,
    const BatchOptions& options,
    std::stop_token stop) {

    std::vector<ExtendedValidationResult> results;
    results.reserve(entries.size());

    const size_t batch_size = std::max<size_t>(options.batch_size, 1);
    const size_t concurrency = std::max<size_t>(options.concurrency, 1);

    ComprehensiveOptions per_key;
    per_key.test_live = options.include_live_validation;
    per_key.timeout = options.timeout.value_or(m_config.batch_timeout);

    Log::info("Batch validating {} keys (batch size {}, concurrency {})",
              entries.size(), batch_size, concurrency);

    for (size_t begin = 0; begin < entries.size(); begin += batch_size) {
        if (stop.stop_requested()) {
            break;
        }

        const size_t count = std::min(batch_size, entries.size() - begin);
        std::vector<ExtendedValidationResult> chunk(count);
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                const BatchEntry& entry = entries[begin + i];
                try {
                    chunk[i] = validate_comprehensive(entry.key, entry.provider, per_key, stop);
                } catch (const std::exception& e) {
                    Log::warning("Batch entry '{}' failed: {}", entry.id, e.what());
                    chunk[i] = make_failure_result(std::format("Validation failed: {}", e.what()));
                }
            }
        };

        std::vector<std::future<void>> workers;
        const size_t worker_count = std::min(concurrency, count);
        workers.reserve(worker_count);
        for (size_t w = 0; w < worker_count; ++w) {
            workers.push_back(std::async(std::launch::async, worker));
        }
        for (auto& f : workers) {
            f.get();
        }

        const bool chunk_failed = std::ranges::any_of(chunk, [](const auto& r) { return !r.is_valid; });
        std::ranges::move(chunk, std::back_inserter(results));

        if (options.fail_fast && chunk_failed) {
            Log::info("Batch validation stopped early after {} keys", results.size());
            return results;
        }

        const bool more = begin + batch_size < entries.size();
        if (more && options.inter_batch_delay.count() > 0) {
            std::mutex delay_mutex;
            std::condition_variable_any delay_cv;
            std::unique_lock lock(delay_mutex);
            delay_cv.wait_for(lock, stop, options.inter_batch_delay, [] { return false; });
        }
    }

    while (results.size() < entries.size()) {
        results.push_back(make_failure_result("Validation aborted"));
    }
    return results;
}

// ============================================================================
// Cache management
// ============================================================================

void KeyValidationService::clear_caches() {
    m_format_cache.clear();
    m_live_cache.clear();
    m_rate_limiter.reset();
    Log::debug("Validation caches cleared");
}

KeyValidationService::CacheStats KeyValidationService::cache_stats() const {
    CacheStats stats;
    stats.format_entries = m_format_cache.size();
    stats.live_entries = m_live_cache.size();
    stats.format_hits = m_format_cache.hits();
    stats.live_hits = m_live_cache.hits();
    stats.rate_limit_buckets = m_rate_limiter.bucket_count();
    return stats;
}

} // namespace KeyWarden
