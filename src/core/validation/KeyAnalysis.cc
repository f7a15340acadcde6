// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KeyAnalysis.h"
#include "../CredentialTypes.h"
#include "../ProviderRules.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <iterator>
#include <map>
#include <regex>
#include <set>
#include <glibmm/ustring.h>

namespace KeyWarden {

namespace {

const std::vector<std::regex>& weak_key_regexes() {
    static const std::vector<std::regex> regexes = [] {
        std::vector<std::regex> compiled;
        compiled.reserve(WEAK_KEY_PATTERNS.size());
        for (const auto pattern : WEAK_KEY_PATTERNS) {
            compiled.emplace_back(std::string(pattern), std::regex::ECMAScript | std::regex::icase);
        }
        return compiled;
    }();
    return regexes;
}

const std::regex& repeating_regex() {
    static const std::regex re("(.{3,})\\1{2,}");
    return re;
}

const std::regex& sequential_regex() {
    static const std::regex re("(?:abc|123|xyz|789){3,}", std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::string to_lower_ascii(std::string_view s) {
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool starts_with_ci(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && to_lower_ascii(s.substr(0, prefix.size())) == prefix;
}

} // anonymous namespace

// ============================================================================
// Sanitization
// ============================================================================

bool is_key_whitespace(gunichar c) noexcept {
    switch (c) {
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            break;
    }
    if (c >= 0x2000 && c <= 0x200A) {
        return true;
    }
    return (c >= 0x09 && c <= 0x0D) || c == 0x20;
}

std::string sanitize_key(std::string_view raw_key) {
    const std::string raw(raw_key);
    const Glib::ustring text(raw);

    if (!text.validate()) {
        Log::debug("sanitize_key: input is not valid UTF-8, stripping ASCII whitespace only");
        std::string stripped;
        stripped.reserve(raw.size());
        std::ranges::copy_if(raw, std::back_inserter(stripped),
                             [](unsigned char c) { return c >= 0x80 || !is_key_whitespace(c); });
        return stripped;
    }

    Glib::ustring clean;
    for (const gunichar c : text) {
        if (!is_key_whitespace(c)) {
            clean.push_back(c);
        }
    }
    return clean.raw();
}

std::string normalize_key(std::string_view raw_key, keywarden::Provider provider) {
    std::string key = sanitize_key(raw_key);

    switch (provider) {
        case keywarden::PROVIDER_OPENAI: {
            std::ranges::replace(key, '_', '-');
            if (starts_with_ci(key, "sk-")) {
                return "sk-" + key.substr(3);
            }
            return key;
        }
        case keywarden::PROVIDER_ANTHROPIC:
            if (starts_with_ci(key, "sk-ant-")) {
                return "sk-ant-" + key.substr(7);
            }
            return key;
        case keywarden::PROVIDER_GOOGLE:
            if (starts_with_ci(key, "aiza")) {
                return "AIza" + key.substr(4);
            }
            return key;
        default:
            return key;
    }
}

// ============================================================================
// Entropy and patterns
// ============================================================================

double calculate_entropy(std::string_view key) {
    const Glib::ustring text{std::string(key)};

    std::map<gunichar, size_t> frequencies;
    size_t length = 0;
    if (text.validate()) {
        for (const gunichar c : text) {
            ++frequencies[c];
            ++length;
        }
    } else {
        for (const unsigned char c : key) {
            ++frequencies[c];
            ++length;
        }
    }

    if (length == 0) {
        return 0.0;
    }

    double entropy = 0.0;
    for (const auto& [symbol, count] : frequencies) {
        const double p = static_cast<double>(count) / static_cast<double>(length);
        entropy -= p * std::log2(p);
    }
    return entropy;
}

EntropyLevel classify_entropy(double entropy) noexcept {
    if (entropy < 3.0) {
        return EntropyLevel::LOW;
    }
    if (entropy < 4.0) {
        return EntropyLevel::MEDIUM;
    }
    return EntropyLevel::HIGH;
}

SecurityAnalysis analyze_key_security(std::string_view sanitized_key,
                                      double low_entropy_threshold,
                                      bool check_entropy,
                                      bool check_exposed_keys) {
    SecurityAnalysis analysis;
    const std::string key(sanitized_key);

    analysis.entropy = calculate_entropy(key);
    analysis.entropy_level = classify_entropy(analysis.entropy);
    analysis.patterns_checked = key.size() <= MAX_PATTERN_SCAN_LENGTH;
    if (analysis.patterns_checked) {
        analysis.has_repeating_pattern = std::regex_search(key, repeating_regex());
        analysis.has_sequential_pattern = std::regex_search(key, sequential_regex());
    }

    if (check_entropy) {
        if (analysis.entropy < low_entropy_threshold) {
            analysis.warnings.emplace_back(LOW_ENTROPY_WARNING);
        }
        if (analysis.has_repeating_pattern) {
            analysis.warnings.emplace_back(REPEATING_PATTERN_WARNING);
        }
        if (analysis.has_sequential_pattern) {
            analysis.warnings.emplace_back(SEQUENTIAL_PATTERN_WARNING);
        }
    }

    const bool weak = analysis.patterns_checked &&
        std::ranges::any_of(weak_key_regexes(),
                            [&key](const std::regex& re) { return std::regex_search(key, re); });

    const std::string lower = to_lower_ascii(key);
    std::vector<std::string_view> markers;
    for (const auto marker : TEST_KEY_MARKERS) {
        if (lower.find(marker) != std::string::npos) {
            markers.push_back(marker);
        }
    }
    analysis.is_test_key = weak || !markers.empty();

    if (check_exposed_keys) {
        if (weak) {
            analysis.warnings.emplace_back(WEAK_PATTERN_WARNING);
        }
        for (const auto marker : markers) {
            analysis.warnings.push_back(
                std::format("Key contains \"{}\" which suggests it may be a test key", marker));
        }
    }

    return analysis;
}

// ============================================================================
// Recommendations and key info
// ============================================================================

std::vector<std::string> generate_recommendations(keywarden::Provider provider,
                                                  bool has_security_warnings) {
    std::vector<std::string> recommendations = {
        "Store API keys securely using encryption",
        "Use environment variables or secure vaults for production",
        "Regularly rotate API keys",
        "Monitor API key usage for unusual activity",
    };

    switch (provider) {
        case keywarden::PROVIDER_OPENAI:
            recommendations.emplace_back("Consider using OpenAI organization-level keys for team access");
            recommendations.emplace_back("Set usage limits in your OpenAI dashboard");
            break;
        case keywarden::PROVIDER_ANTHROPIC:
            recommendations.emplace_back("Monitor token usage to avoid unexpected charges");
            break;
        case keywarden::PROVIDER_GOOGLE:
            recommendations.emplace_back("Restrict API key usage by IP address when possible");
            break;
        default:
            break;
    }

    if (has_security_warnings) {
        recommendations.emplace_back("Generate a new API key to address security concerns");
    }
    return recommendations;
}

KeyInfo extract_key_info(std::string_view raw_key) {
    const std::string key = sanitize_key(raw_key);

    KeyInfo info;
    info.provider = detect_provider(key);
    if (info.provider) {
        const auto& rule = provider_rule(*info.provider);
        info.prefix = rule.required_prefix.value_or("");
    }

    const Glib::ustring text(key);
    const bool valid_utf8 = text.validate();
    info.length = valid_utf8 ? text.length() : key.size();
    info.masked_key = valid_utf8 ? mask_key(text) : std::string("***");
    info.entropy = calculate_entropy(key);
    info.entropy_level = classify_entropy(info.entropy);

    std::set<char> unique;
    for (const char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        info.character_set.has_uppercase |= (uc >= 'A' && uc <= 'Z');
        info.character_set.has_lowercase |= (uc >= 'a' && uc <= 'z');
        info.character_set.has_numbers |= (uc >= '0' && uc <= '9');
        info.character_set.has_special |= !std::isalnum(uc);
        unique.insert(c);
    }
    info.character_set.unique_chars = unique.size();
    return info;
}

} // namespace KeyWarden
