// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

// keywarden - command line front end to the validation engine
//
//   keywarden validate <provider> <key> [--live] [--recommend]
//   keywarden info <key>
//   keywarden mask <key>

#include "core/CredentialTypes.h"
#include "core/ProviderRules.h"
#include "core/services/KeyValidationService.h"
#include "core/validation/HttplibProbe.h"
#include "core/validation/KeyAnalysis.h"
#include "utils/Log.h"
#include "utils/SecureMemory.h"
#include "utils/SettingsValidator.h"
#include <glibmm.h>
#include <giomm.h>
#include <iostream>
#include <optional>
#include <ostream>
#include <print>

using namespace KeyWarden;

namespace {

// Settings are optional for the CLI; defaults apply when the schema is not installed
std::optional<ValidationConfig> load_settings() {
    auto source = Gio::SettingsSchemaSource::get_default();
    if (!source || !source->lookup(Glib::ustring(SettingsValidator::SCHEMA_ID.data()), true)) {
        return std::nullopt;
    }
    auto settings = Gio::Settings::create(Glib::ustring(SettingsValidator::SCHEMA_ID.data()));
    // --verbose wins over the stored level
    if (Log::get_level() != Log::Level::Debug) {
        Log::set_level(SettingsValidator::get_log_level(settings));
    }
    return SettingsValidator::load_validation_config(settings);
}

void print_list(std::string_view heading, const std::vector<std::string>& items) {
    if (items.empty()) {
        return;
    }
    std::println("{}:", heading);
    for (const auto& item : items) {
        std::println("  - {}", item);
    }
}

int run_validate(const std::string& provider_tag, const std::string& raw_key,
                 bool live, bool recommend) {
    HttplibProbe probe;
    KeyValidationService validator(&probe, load_settings().value_or(ValidationConfig{}));

    ComprehensiveOptions options;
    options.test_live = live;
    options.provide_recommendations = recommend;

    const auto result = validator.validate_comprehensive(raw_key, provider_tag, options);

    std::println("Key:       {}", mask_key(Glib::ustring(raw_key)));
    std::println("Provider:  {}", to_string(result.provider));
    std::println("Tier:      {}", to_string(result.estimated_tier));
    std::println("Valid:     {}", result.is_valid ? "yes" : "no");
    if (result.security) {
        std::println("Entropy:   {:.2f} bits/char ({})", result.security->entropy,
                     to_string(result.security->entropy_level));
    }
    if (result.live) {
        std::println("Live:      {} ({} ms)", result.live->is_active ? "active" : "inactive",
                     result.live->response_time.count());
    }
    print_list("Errors", result.errors);
    print_list("Warnings", result.warnings);
    print_list("Security", result.security_warnings);
    print_list("Recommendations", result.recommendations);
    std::println("Took {} us", result.performance.total_time.count());

    return result.is_valid ? 0 : 1;
}

int run_info(const std::string& raw_key) {
    const KeyInfo info = extract_key_info(raw_key);
    std::println("Key:       {}", info.masked_key);
    std::println("Provider:  {}", info.provider ? to_string(*info.provider) : "unknown");
    std::println("Type:      {}", to_string(info.key_type));
    std::println("Prefix:    {}", info.prefix.empty() ? "(none)" : info.prefix);
    std::println("Length:    {}", info.length);
    std::println("Entropy:   {:.2f} bits/char ({})", info.entropy, to_string(info.entropy_level));
    std::println("Charset:   upper={} lower={} digits={} special={} unique={}",
                 info.character_set.has_uppercase, info.character_set.has_lowercase,
                 info.character_set.has_numbers, info.character_set.has_special,
                 info.character_set.unique_chars);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Glib::init();
    Gio::init();

    bool live = false;
    bool recommend = false;
    bool verbose = false;

    Glib::OptionContext context("COMMAND [ARGS] - validate AI provider API keys");
    context.set_summary("Commands:\n"
                        "  validate <provider> <key>   Check format and security of a key\n"
                        "  info <key>                  Describe a key without judging it\n"
                        "  mask <key>                  Print the masked form of a key");

    Glib::OptionGroup group("keywarden", "KeyWarden options");
    Glib::OptionEntry live_entry;
    live_entry.set_long_name("live");
    live_entry.set_short_name('l');
    live_entry.set_description("Also probe the provider's API");
    group.add_entry(live_entry, live);

    Glib::OptionEntry recommend_entry;
    recommend_entry.set_long_name("recommend");
    recommend_entry.set_short_name('r');
    recommend_entry.set_description("Print storage recommendations");
    group.add_entry(recommend_entry, recommend);

    Glib::OptionEntry verbose_entry;
    verbose_entry.set_long_name("verbose");
    verbose_entry.set_short_name('v');
    verbose_entry.set_description("Enable debug logging");
    group.add_entry(verbose_entry, verbose);

    context.set_main_group(group);

    try {
        context.parse(argc, argv);
    } catch (const Glib::Error& e) {
        std::println(std::cerr, "keywarden: {}", e.what());
        return 2;
    }

    if (verbose) {
        Log::set_level(Log::Level::Debug);
    }

    if (argc < 3) {
        std::println(std::cerr, "{}", context.get_help().raw());
        return 2;
    }

    const std::string command{argv[1]};
    try {
        if (command == "validate" && argc >= 4) {
            SecureString key{Glib::ustring(argv[3])};
            return run_validate(argv[2], key.raw(), live, recommend);
        }
        if (command == "info") {
            SecureString key{Glib::ustring(argv[2])};
            return run_info(key.raw());
        }
        if (command == "mask") {
            std::println("{}", mask_key(Glib::ustring(argv[2])));
            return 0;
        }
    } catch (const std::exception& e) {
        Log::error("keywarden: {}", e.what());
        return 1;
    }

    std::println(std::cerr, "{}", context.get_help().raw());
    return 2;
}
