// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file ValidationTypes.h
 * @brief Result and option types for API key validation
 *
 * Validators never throw; every failure path is reported through one of the
 * result structs below with is_valid == false and a populated errors list.
 */

#pragma once

#include "credential.pb.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace KeyWarden {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Engine-wide settings, fixed at construction
 *
 * Defaults match the values shipped in the GSettings schema; see
 * SettingsValidator for the clamped ranges.
 */
struct ValidationConfig {
    std::chrono::milliseconds format_cache_ttl{std::chrono::minutes(5)};
    std::chrono::milliseconds live_cache_ttl{std::chrono::minutes(15)};
    size_t max_cache_size = 1000;             ///< Per cache; trimmed to 80% when exceeded

    uint32_t rate_limit_requests = 30;        ///< Live probes per key per window
    std::chrono::milliseconds rate_limit_window{std::chrono::seconds(60)};

    std::chrono::milliseconds live_timeout{10000};
    std::chrono::milliseconds batch_timeout{30000};

    double low_entropy_threshold = 3.0;       ///< Bits per character
};

/**
 * @brief Per-call options for validate_live()
 */
struct LiveValidationOptions {
    std::optional<std::chrono::milliseconds> timeout;   ///< Defaults to ValidationConfig::live_timeout
    bool enable_cache = true;
    bool enable_rate_limit = true;
    std::optional<std::string> base_url;                 ///< Replaces the provider's API root; the probe path is kept
};

/**
 * @brief Per-call options for validate_comprehensive()
 */
struct ComprehensiveOptions {
    bool test_live = false;
    bool check_entropy = true;
    bool check_exposed_keys = true;
    bool provide_recommendations = false;
    bool enable_cache = true;
    bool enable_rate_limit = true;
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Options for batch_validate()
 */
struct BatchOptions {
    size_t concurrency = 5;
    size_t batch_size = 10;
    bool include_live_validation = false;
    bool fail_fast = false;
    std::chrono::milliseconds inter_batch_delay{100};
    std::optional<std::chrono::milliseconds> timeout;   ///< Per-key live timeout
};

/**
 * @brief One key submitted to batch_validate()
 */
struct BatchEntry {
    std::string key;
    std::string provider;     ///< Provider tag; unknown tags yield a failure result
    std::string id;           ///< Caller's correlation id, echoed nowhere but useful in logs
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Outcome of static format validation
 */
struct ValidationResult {
    bool is_valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    keywarden::Provider provider = keywarden::PROVIDER_CUSTOM;   ///< Detected, else declared
    keywarden::KeyType key_type = keywarden::KEY_TYPE_STANDARD;
    keywarden::KeyType estimated_tier = keywarden::KEY_TYPE_STANDARD;
    bool from_cache = false;
};

/**
 * @brief Why a live probe did not succeed
 */
enum class LiveErrorCode {
    NONE,
    HTTP,            ///< Provider answered with a non-2xx status
    TIMEOUT,
    NETWORK,
    ABORTED,         ///< Caller requested cancellation
    RATE_LIMITED,
    UNSUPPORTED      ///< Provider has no probe endpoint
};

/**
 * @brief Outcome of a live probe
 */
struct LiveValidationResult {
    bool is_valid = false;
    bool is_active = false;
    std::optional<int> status_code;
    std::optional<std::string> error;
    LiveErrorCode error_code = LiveErrorCode::NONE;
    std::chrono::milliseconds response_time{0};
    std::string endpoint;
    bool from_cache = false;
};

enum class EntropyLevel { LOW, MEDIUM, HIGH };

/**
 * @brief Entropy and weak-pattern findings
 */
struct SecurityAnalysis {
    double entropy = 0.0;
    EntropyLevel entropy_level = EntropyLevel::LOW;
    bool has_repeating_pattern = false;
    bool has_sequential_pattern = false;
    bool is_test_key = false;
    bool patterns_checked = true;   ///< False when the key was too long for the regex checks
    std::vector<std::string> warnings;
};

struct PerformanceMetrics {
    std::chrono::microseconds format_validation_time{0};
    std::optional<std::chrono::microseconds> live_validation_time;
    std::chrono::microseconds total_time{0};
};

/**
 * @brief Aggregate result of validate_comprehensive() and batch_validate()
 */
struct ExtendedValidationResult {
    bool is_valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    keywarden::Provider provider = keywarden::PROVIDER_CUSTOM;
    keywarden::KeyType key_type = keywarden::KEY_TYPE_STANDARD;
    keywarden::KeyType estimated_tier = keywarden::KEY_TYPE_STANDARD;

    std::optional<ValidationResult> format;
    std::optional<LiveValidationResult> live;
    std::optional<SecurityAnalysis> security;
    std::vector<std::string> security_warnings;
    std::vector<std::string> recommendations;
    PerformanceMetrics performance;
};

/**
 * @brief Character-set breakdown of a key
 */
struct CharacterSet {
    bool has_uppercase = false;
    bool has_lowercase = false;
    bool has_numbers = false;
    bool has_special = false;
    size_t unique_chars = 0;
};

/**
 * @brief Descriptive facts about a key, without judging validity
 */
struct KeyInfo {
    std::optional<keywarden::Provider> provider;
    keywarden::KeyType key_type = keywarden::KEY_TYPE_STANDARD;
    std::string prefix;
    std::string masked_key;
    double entropy = 0.0;
    EntropyLevel entropy_level = EntropyLevel::LOW;
    size_t length = 0;
    CharacterSet character_set;
};

[[nodiscard]] constexpr std::string_view to_string(LiveErrorCode code) noexcept {
    switch (code) {
        case LiveErrorCode::NONE:         return "none";
        case LiveErrorCode::HTTP:         return "http";
        case LiveErrorCode::TIMEOUT:      return "timeout";
        case LiveErrorCode::NETWORK:      return "network";
        case LiveErrorCode::ABORTED:      return "aborted";
        case LiveErrorCode::RATE_LIMITED: return "rate_limited";
        case LiveErrorCode::UNSUPPORTED:  return "unsupported";
    }
    return "none";
}

[[nodiscard]] constexpr std::string_view to_string(EntropyLevel level) noexcept {
    switch (level) {
        case EntropyLevel::LOW:    return "low";
        case EntropyLevel::MEDIUM: return "medium";
        case EntropyLevel::HIGH:   return "high";
    }
    return "low";
}

} // namespace KeyWarden
