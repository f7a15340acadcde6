// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file ProviderRules.h
 * @brief Static key-format rules for each supported AI provider
 *
 * Each provider has exactly one immutable rule describing the shape of the
 * keys it issues. Rules are compiled once on first use and never change.
 *
 * | Provider  | Prefix    | Length  |
 * |-----------|-----------|---------|
 * | openai    | sk-       | 51      |
 * | anthropic | sk-ant-   | 47-59   |
 * | google    | AIza      | 39      |
 * | custom    | (none)    | 1-1000  |
 *
 * Unknown providers are treated as custom.
 */

#ifndef KEYWARDEN_PROVIDER_RULES_H
#define KEYWARDEN_PROVIDER_RULES_H

#include <array>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include "credential.pb.h"

namespace KeyWarden {

using keywarden::Provider;

/**
 * @brief Format rule for one provider's keys
 */
struct ProviderRule {
    Provider provider;
    std::regex pattern;                          ///< Full-match pattern (ECMAScript)
    size_t min_length;
    size_t max_length;
    std::optional<std::string> required_prefix;
    std::string description;                     ///< Human-readable shape, used in error text
};

/// Providers in detection order; custom is last and never detected
inline constexpr std::array<Provider, 4> ALL_PROVIDERS = {
    keywarden::PROVIDER_OPENAI,
    keywarden::PROVIDER_ANTHROPIC,
    keywarden::PROVIDER_GOOGLE,
    keywarden::PROVIDER_CUSTOM,
};

/**
 * @brief Look up the rule for a provider
 * @param provider Provider tag; values outside the enum resolve to custom
 * @return Reference to the process-wide immutable rule
 */
[[nodiscard]] const ProviderRule& provider_rule(Provider provider);

/**
 * @brief Infer the provider from the key's shape
 *
 * Scans openai, anthropic, google in that order and returns the first
 * whose pattern matches. The permissive custom rule is not considered.
 *
 * @param sanitized_key Key with whitespace already removed
 */
[[nodiscard]] std::optional<Provider> detect_provider(std::string_view sanitized_key);

/** @brief Lower-case provider tag ("openai", "anthropic", ...) */
[[nodiscard]] std::string_view to_string(Provider provider) noexcept;

/** @brief Parse a provider tag; std::nullopt when the tag is unknown */
[[nodiscard]] std::optional<Provider> parse_provider(std::string_view tag) noexcept;

} // namespace KeyWarden

#endif // KEYWARDEN_PROVIDER_RULES_H
