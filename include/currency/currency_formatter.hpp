#pragma once

#include "core/types.hpp"
#include "currency/session_defaults.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reskfmt {

struct AbbreviatedNumber {
    std::string result;     // e.g. "1.5K"
    double value = 0.0;     // Scaled value, e.g. 1.5
    std::string suffix;     // "", "K", "M", "B" or "T"
};

/**
 * @brief Locale-templated number and money formatting
 *
 * Format templates use "%v" for the value and "%s" for the symbol, e.g.
 * "%v %s" -> "1,234.56 $". A trailing ".##" on a format sets the decimal
 * digits and takes precedence over an explicit decimal_digits option.
 *
 * Every call reads the SessionDefaults snapshot once; nothing is written
 * while formatting, so a formatter may be shared across threads.
 */
class CurrencyFormatter {
public:
    // Formats against SessionDefaults::global()
    CurrencyFormatter();
    explicit CurrencyFormatter(const SessionDefaults& session);

    /**
     * @brief Split a trailing ".###" decimal-digit suffix off a format
     *
     * "%s%v .###" -> { "%s%v", 3 }, "%v %s." -> { "%v %s", 0 },
     * "%v %s" -> { "%v %s", nullopt }
     */
    [[nodiscard]] static ParsedFormat parse_format(std::string_view format);

    /**
     * @brief Session defaults overlaid with every set field of `options`
     *
     * A decimal-digit suffix in the resulting format overrides
     * decimal_digits, including an explicitly supplied one.
     */
    [[nodiscard]] CurrencyOptions prepare_options(const CurrencyOptionsOverride& options = {}) const;

    /**
     * @brief Positive/negative/zero templates for a format
     *
     * The format is lower-cased; one without "%v" is replaced by the
     * session format. The negative template drops literal '-' signs and
     * prefixes the value placeholder with '-'.
     */
    [[nodiscard]] CurrencyFormatTemplates check_currency_format(std::string_view format) const;

    /**
     * @brief Recover a number from formatted text
     *
     * Falsy input -> 0, numbers pass through. "(" directly followed by a
     * digit marks a negative ("(1,234.56)" -> -1234.56); "($1,234.56)" is
     * not negated. All characters except digits, '-' and the decimal
     * separator are dropped before parsing (failure -> 0).
     */
    [[nodiscard]] double unformat(
        const NumericInput& value,
        std::optional<std::string> decimal_separator = std::nullopt) const;

    /**
     * @brief Group and render a number
     *
     * Decimal digits resolve as: explicit argument, then options, then the
     * fractional digits already present in the value, then the session.
     */
    [[nodiscard]] std::string format_number(const NumericInput& value) const;

    [[nodiscard]] std::string format_number(
        const NumericInput& value,
        uint32_t decimal_digits,
        std::optional<std::string> thousand_separator = std::nullopt,
        std::optional<std::string> decimal_separator = std::nullopt) const;

    [[nodiscard]] std::string format_number(
        const NumericInput& value,
        const CurrencyOptionsOverride& options) const;

    [[nodiscard]] FormatMoneyObject format_money_as_object(
        const NumericInput& value,
        const CurrencyOptionsOverride& options) const;

    [[nodiscard]] FormatMoneyObject format_money_as_object(
        const NumericInput& value,
        std::optional<std::string> symbol = std::nullopt,
        std::optional<uint32_t> decimal_digits = std::nullopt,
        std::optional<std::string> thousand_separator = std::nullopt,
        std::optional<std::string> decimal_separator = std::nullopt,
        std::optional<std::string> format = std::nullopt) const;

    [[nodiscard]] std::string format_money(
        const NumericInput& value,
        const CurrencyOptionsOverride& options) const;

    [[nodiscard]] std::string format_money(
        const NumericInput& value,
        std::optional<std::string> symbol = std::nullopt,
        std::optional<uint32_t> decimal_digits = std::nullopt,
        std::optional<std::string> thousand_separator = std::nullopt,
        std::optional<std::string> decimal_separator = std::nullopt,
        std::optional<std::string> format = std::nullopt) const;

    // 1500 -> "1.5K"; a whole scaled value takes the session digits (1000 -> "1.00K")
    [[nodiscard]] AbbreviatedNumber abbreviate_number(const NumericInput& value) const;

    // Money template around an abbreviated magnitude: 1500 -> "1.5K $".
    // The magnitude follows the format_number digit order for `options`.
    [[nodiscard]] std::string abbreviate_money(
        const NumericInput& value,
        const CurrencyOptionsOverride& options = {}) const;

private:
    [[nodiscard]] static std::string render_number(
        double number,
        uint32_t decimal_digits,
        const std::string& thousand_separator,
        const std::string& decimal_separator);

    const SessionDefaults& session_;
};

} // namespace reskfmt
