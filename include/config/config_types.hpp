#pragma once

#include "core/types.hpp"
#include "mask/mask_token.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace reskfmt {

class SessionDefaults;

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";     // debug | info | warn | error
};

/**
 * @brief [currency] section as written in the file
 *
 * Every key is optional. Resolution order: built-in defaults, then the
 * currency table entry for `code`, then explicit keys.
 */
struct CurrencyConfig {
    std::string code;               // ISO 4217, empty = not set
    std::optional<std::string> symbol;
    std::optional<int64_t> decimal_digits;
    std::optional<std::string> thousand_separator;
    std::optional<std::string> decimal_separator;
    std::optional<std::string> format;

    [[nodiscard]] CurrencyOptions resolve() const;
};

struct MaskConfig {
    std::string obfuscation_character = "*";
    std::string placeholder_character = "_";
    bool auto_complete = false;

    [[nodiscard]] MaskOptions mask_options() const;
};

struct PhoneConfig {
    std::string default_country;    // ISO 3166 alpha-2, empty = none
};

struct ReskConfig {
    LoggingConfig logging;
    CurrencyConfig currency;
    MaskConfig mask;
    PhoneConfig phone;

    // Install log level and currency section; the session keeps its format override
    void apply(SessionDefaults& session) const;
};

} // namespace reskfmt
