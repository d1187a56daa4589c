#include "config/config_loader.hpp"
#include "currency/currency_formatter.hpp"
#include "currency/currency_table.hpp"
#include "currency/session_defaults.hpp"
#include "mask/phone_mask.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace reskfmt {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// ---- Section extraction ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

CurrencyConfig extract_currency(const toml::table& root) {
    CurrencyConfig cfg;
    const auto* currency = root["currency"].as_table();
    if (!currency) return cfg;
    const auto& c = *currency;

    cfg.code = c["code"].value_or(""s);
    cfg.symbol = toml_optional_string(c, "symbol");
    if (const auto* digits = c["decimal_digits"].as_integer()) {
        cfg.decimal_digits = digits->get();
    }
    cfg.thousand_separator = toml_optional_string(c, "thousand_separator");
    cfg.decimal_separator = toml_optional_string(c, "decimal_separator");
    cfg.format = toml_optional_string(c, "format");
    return cfg;
}

MaskConfig extract_mask(const toml::table& root) {
    MaskConfig cfg;
    const auto* mask = root["mask"].as_table();
    if (!mask) return cfg;
    const auto& m = *mask;

    cfg.obfuscation_character = m["obfuscation_character"].value_or("*"s);
    cfg.placeholder_character = m["placeholder_character"].value_or("_"s);
    cfg.auto_complete = m["auto_complete"].value_or(false);
    return cfg;
}

PhoneConfig extract_phone(const toml::table& root) {
    PhoneConfig cfg;
    const auto* phone = root["phone"].as_table();
    if (!phone) return cfg;

    cfg.default_country = (*phone)["default_country"].value_or(""s);
    return cfg;
}

ReskConfig extract_all_sections(const toml::table& tbl) {
    ReskConfig config;
    config.logging = extract_logging(tbl);
    config.currency = extract_currency(tbl);
    config.mask = extract_mask(tbl);
    config.phone = extract_phone(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(ReskConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }

    auto warnings = ConfigLoader::collect_warnings(config);
    for (const auto& warning : warnings) {
        utils::log::warn(std::format("Config: {}", warning));
    }
    return ConfigLoader::LoadResult::ok(std::move(config), std::move(warnings));
}

} // anonymous namespace

// ============================================================================
// Config Types
// ============================================================================

CurrencyOptions CurrencyConfig::resolve() const {
    CurrencyOptions options;
    if (!code.empty()) {
        if (const auto info = CurrencyTable::find(code)) {
            options.symbol = std::string(info->symbol);
            options.decimal_digits = info->decimal_digits;
        }
    }
    if (symbol) options.symbol = *symbol;
    if (decimal_digits) options.decimal_digits = static_cast<uint32_t>(*decimal_digits);
    if (thousand_separator) options.thousand_separator = *thousand_separator;
    if (decimal_separator) options.decimal_separator = *decimal_separator;
    if (format) options.format = utils::trim(*format);
    return options;
}

MaskOptions MaskConfig::mask_options() const {
    MaskOptions options;
    if (obfuscation_character.size() == 1) options.obfuscation_character = obfuscation_character[0];
    if (placeholder_character.size() == 1) options.placeholder_character = placeholder_character[0];
    options.auto_complete = auto_complete;
    return options;
}

void ReskConfig::apply(SessionDefaults& session) const {
    if (const auto level = utils::log::parse_level(logging.level)) {
        utils::log::set_level(*level);
    }
    session.set_currency(currency.resolve());
}

// ============================================================================
// Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ReskConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    const auto& currency = config.currency;
    if (!currency.code.empty() && !CurrencyTable::find(currency.code)) {
        errors.push_back(std::format("currency.code '{}' is not a known currency", currency.code));
    }
    if (currency.decimal_digits
        && (*currency.decimal_digits < 0 || *currency.decimal_digits > kMaxDecimalDigits)) {
        errors.push_back(std::format("currency.decimal_digits must be 0-{}, got {}",
            kMaxDecimalDigits, *currency.decimal_digits));
    }
    if (currency.format) {
        const auto parsed = CurrencyFormatter::parse_format(*currency.format);
        if (parsed.format.find("%v") == std::string::npos) {
            errors.push_back(std::format(
                "currency.format must contain %v, got '{}'", *currency.format));
        }
    }

    if (config.mask.obfuscation_character.size() != 1) {
        errors.push_back(std::format("mask.obfuscation_character must be one character, got '{}'",
            config.mask.obfuscation_character));
    }
    if (config.mask.placeholder_character.size() != 1) {
        errors.push_back(std::format("mask.placeholder_character must be one character, got '{}'",
            config.mask.placeholder_character));
    }

    if (!config.phone.default_country.empty()
        && !PhoneMaskCompiler::find_country(config.phone.default_country)) {
        errors.push_back(std::format("phone.default_country '{}' is not a known country",
            config.phone.default_country));
    }

    return errors;
}

std::vector<std::string> ConfigLoader::collect_warnings(const ReskConfig& config) {
    std::vector<std::string> warnings;
    const CurrencyOptions resolved = config.currency.resolve();
    if (resolved.decimal_separator == resolved.thousand_separator) {
        warnings.push_back(std::format(
            "currency.decimal_separator equals thousand_separator ('{}')", resolved.decimal_separator));
    }
    return warnings;
}

} // namespace reskfmt
