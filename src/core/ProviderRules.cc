// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "ProviderRules.h"

namespace KeyWarden {

namespace {

const std::array<ProviderRule, 4>& rule_table() {
    static const std::array<ProviderRule, 4> rules = {{
        {keywarden::PROVIDER_OPENAI,
         std::regex("^sk-[A-Za-z0-9]{48}$"),
         51, 51,
         "sk-",
         "OpenAI API keys start with \"sk-\" followed by 48 alphanumeric characters"},
        {keywarden::PROVIDER_ANTHROPIC,
         std::regex("^sk-ant-[A-Za-z0-9]{40,52}$"),
         47, 59,
         "sk-ant-",
         "Anthropic API keys start with \"sk-ant-\" followed by 40-52 alphanumeric characters"},
        {keywarden::PROVIDER_GOOGLE,
         std::regex("^AIza[A-Za-z0-9_-]{35}$"),
         39, 39,
         "AIza",
         "Google API keys start with \"AIza\" followed by 35 characters"},
        {keywarden::PROVIDER_CUSTOM,
         std::regex("^[\\s\\S]{1,1000}$"),
         1, 1000,
         std::nullopt,
         "Custom API keys can be any format between 1-1000 characters"},
    }};
    return rules;
}

} // anonymous namespace

const ProviderRule& provider_rule(Provider provider) {
    const auto& rules = rule_table();
    for (const auto& rule : rules) {
        if (rule.provider == provider) {
            return rule;
        }
    }
    return rules.back();
}

std::optional<Provider> detect_provider(std::string_view sanitized_key) {
    // Anthropic keys also start with "sk-" but never match the 48-char
    // openai pattern, so the scan order is unambiguous.
    for (const auto& rule : rule_table()) {
        if (rule.provider == keywarden::PROVIDER_CUSTOM) {
            continue;
        }
        if (std::regex_match(sanitized_key.begin(), sanitized_key.end(), rule.pattern)) {
            return rule.provider;
        }
    }
    return std::nullopt;
}

std::string_view to_string(Provider provider) noexcept {
    switch (provider) {
        case keywarden::PROVIDER_OPENAI:    return "openai";
        case keywarden::PROVIDER_ANTHROPIC: return "anthropic";
        case keywarden::PROVIDER_GOOGLE:    return "google";
        case keywarden::PROVIDER_CUSTOM:    return "custom";
        default:                            break;
    }
    return "custom";
}

std::optional<Provider> parse_provider(std::string_view tag) noexcept {
    for (const auto provider : ALL_PROVIDERS) {
        if (to_string(provider) == tag) {
            return provider;
        }
    }
    return std::nullopt;
}

} // namespace KeyWarden
