#pragma once

#include "core/types.hpp"
#include "currency/session_defaults.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace reskfmt {

struct FormatOptions;

// Custom formatter hook; receives the options as passed in
using ValueFormatFn = std::function<std::string(const FormatOptions&)>;

struct FormatOptions {
    NumericInput value;
    std::string type;           // "decimal", "numeric" and "number" are numeric types
    std::string format;         // Named format, empty for the default
    ValueFormatFn formatter;    // Takes precedence over `format` when set
};

/**
 * @brief Type-aware display formatting for a single field value
 *
 * Numeric types are parsed with NumericNormalizer::parse_decimal and rendered
 * through the named format:
 *   "money"            -> CurrencyFormatter::format_money
 *   "abbreviate"       -> CurrencyFormatter::abbreviate_number
 *   "abbreviate-money" -> CurrencyFormatter::abbreviate_money
 *   "money<CODE>"      -> format_money with the symbol and digits of CODE,
 *                         e.g. "moneyUSD"
 * Anything else renders with format_number. Other types pass the text
 * through unchanged.
 */
class ValueFormatter {
public:
    ValueFormatter();
    explicit ValueFormatter(const SessionDefaults& session);

    [[nodiscard]] FormatResult format_to_object(const FormatOptions& options) const;

    [[nodiscard]] std::string format(const FormatOptions& options) const;

    [[nodiscard]] static bool is_decimal_type(std::string_view type);

private:
    [[nodiscard]] std::string format_named(double value, std::string_view format) const;

    const SessionDefaults& session_;
};

} // namespace reskfmt
