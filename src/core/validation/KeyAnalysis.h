// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KeyAnalysis.h
 * @brief Offline analysis of raw API keys
 *
 * Pure functions used by KeyValidationService: whitespace sanitization,
 * provider-specific normalization, Shannon entropy, weak/test key
 * detection, security recommendations and key-info extraction.
 *
 * @section weak_keys Weak Key Patterns
 * Keys matching one of WEAK_KEY_PATTERNS (case-insensitive) are flagged as
 * known weak or sample keys. Independently, keys containing one of
 * TEST_KEY_MARKERS are flagged as probable test keys.
 */

#ifndef KEYWARDEN_KEY_ANALYSIS_H
#define KEYWARDEN_KEY_ANALYSIS_H

#include "ValidationTypes.h"
#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <glib.h>

namespace KeyWarden {

/// Regexes for placeholder keys that must never be accepted as real secrets
inline constexpr std::array<std::string_view, 6> WEAK_KEY_PATTERNS = {
    "^sk-0+$",
    "^sk-1+$",
    "^sk-test",
    "^sk-demo",
    "^sk-example",
    "^sk-1234567890abcdefghijklmnopqrstuvwxyzABCDEFGHIJKL$",
};

/// Substrings suggesting a key was copied from documentation or a test fixture
inline constexpr std::array<std::string_view, 4> TEST_KEY_MARKERS = {
    "test", "demo", "example", "sample",
};

/// Longest key (in bytes) the regex-based pattern checks are run on; matches the custom rule's max_length
inline constexpr size_t MAX_PATTERN_SCAN_LENGTH = 1000;

inline constexpr std::string_view LOW_ENTROPY_WARNING =
    "Key has low entropy and may be weak or predictable";
inline constexpr std::string_view REPEATING_PATTERN_WARNING =
    "Key contains repeating patterns which reduces security";
inline constexpr std::string_view SEQUENTIAL_PATTERN_WARNING =
    "Key contains sequential patterns which reduces security";
inline constexpr std::string_view WEAK_PATTERN_WARNING =
    "Key matches a known weak or test key pattern";

/**
 * @brief Whether a code point is stripped by sanitize_key()
 *
 * Covers ASCII whitespace, NEL, NBSP, OGHAM SPACE MARK, U+2000-U+200A,
 * LINE/PARAGRAPH SEPARATOR, NNBSP, MMSP, IDEOGRAPHIC SPACE and the BOM.
 */
[[nodiscard]] bool is_key_whitespace(gunichar c) noexcept;

/**
 * @brief Remove every whitespace code point from a key
 *
 * Keys pasted from web pages often carry non-breaking or zero-width
 * spaces. Invalid UTF-8 input is returned with only ASCII whitespace
 * removed; format validation then rejects it.
 */
[[nodiscard]] std::string sanitize_key(std::string_view raw_key);

/**
 * @brief Sanitize and repair common prefix mistakes
 *
 * openai: "SK_"/"Sk-" prefixes become "sk-" and underscores become hyphens;
 * anthropic: "SK-ANT-" becomes "sk-ant-"; google: "aiza" becomes "AIza".
 */
[[nodiscard]] std::string normalize_key(std::string_view raw_key, keywarden::Provider provider);

/** @brief Shannon entropy in bits per character (UTF-8 code points) */
[[nodiscard]] double calculate_entropy(std::string_view key);

[[nodiscard]] EntropyLevel classify_entropy(double entropy) noexcept;

/**
 * @brief Entropy, repetition, sequence and weak-pattern analysis
 * @param sanitized_key Key after sanitize_key()
 * @param low_entropy_threshold Entropy below which a warning is raised
 * @param check_entropy Include entropy/repetition/sequence warnings
 * @param check_exposed_keys Include weak-pattern and test-marker warnings
 *
 * Keys longer than MAX_PATTERN_SCAN_LENGTH bytes get entropy and
 * test-marker checks only; backtracking regex search is skipped for them.
 */
[[nodiscard]] SecurityAnalysis analyze_key_security(std::string_view sanitized_key,
                                                    double low_entropy_threshold,
                                                    bool check_entropy = true,
                                                    bool check_exposed_keys = true);

/** @brief General, provider-specific and warning-driven hygiene advice */
[[nodiscard]] std::vector<std::string> generate_recommendations(keywarden::Provider provider,
                                                                bool has_security_warnings);

/** @brief Provider, prefix, mask, entropy and character-set facts for a key */
[[nodiscard]] KeyInfo extract_key_info(std::string_view raw_key);

} // namespace KeyWarden

#endif // KEYWARDEN_KEY_ANALYSIS_H
