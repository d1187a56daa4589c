#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace reskfmt {

// ============================================================================
// NumericInput - a value that may be absent, a number, or user-typed text
// ============================================================================

/**
 * @brief Loosely-typed input accepted by the numeric and currency layers.
 *
 * Form fields hand the engine whatever the user (or the model) holds: nothing,
 * a number, or a string such as "1 234,56". Every numeric operation accepts
 * this type and degrades to a documented sentinel instead of failing.
 */
class NumericInput {
public:
    NumericInput() = default;
    NumericInput(std::nullptr_t) {}

    template<typename T>
        requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>)
    NumericInput(T number) : value_(static_cast<double>(number)) {}

    NumericInput(const char* text) {
        if (text) value_ = std::string(text);
    }
    NumericInput(std::string text) : value_(std::move(text)) {}
    NumericInput(std::string_view text) : value_(std::string(text)) {}

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(value_); }
    [[nodiscard]] bool is_number() const { return std::holds_alternative<double>(value_); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(value_); }

    [[nodiscard]] double number() const { return std::get<double>(value_); }
    [[nodiscard]] const std::string& text() const { return std::get<std::string>(value_); }

    // JavaScript-style truthiness: null, 0, NaN and "" are falsy
    [[nodiscard]] bool is_falsy() const {
        if (is_null()) return true;
        if (is_number()) return number() == 0.0 || std::isnan(number());
        return text().empty();
    }

private:
    std::variant<std::monostate, double, std::string> value_;
};

// ============================================================================
// Currency Types
// ============================================================================

/**
 * @brief Fully-resolved currency formatting options.
 *
 * Invariant: decimal_digits >= 0 (unsigned). decimal_separator is expected to
 * differ from thousand_separator but this is not enforced.
 */
struct CurrencyOptions {
    std::string symbol = "FCFA";
    uint32_t decimal_digits = 0;
    std::string thousand_separator = " ";
    std::string decimal_separator = ".";
    std::string format = "%v %s";
};

/**
 * @brief Partial options overlaid on the session defaults.
 * Unset fields keep the session value.
 */
struct CurrencyOptionsOverride {
    std::optional<std::string> symbol;
    std::optional<uint32_t> decimal_digits;
    std::optional<std::string> thousand_separator;
    std::optional<std::string> decimal_separator;
    std::optional<std::string> format;
};

// Result of splitting a ".###" decimal-digit suffix off a currency format
struct ParsedFormat {
    std::string format;
    std::optional<uint32_t> decimal_digits;
};

// Templates selected by the sign of the value being formatted
struct CurrencyFormatTemplates {
    std::string pos;
    std::string neg;
    std::string zero;
};

struct FormatMoneyObject {
    std::string result;             // Final string, e.g. "1,234.56 $"
    std::string formatted_value;    // Template with symbol substituted, %v still present
    std::string formatted_number;   // Magnitude with separators, e.g. "1,234.56"
    std::string used_format;        // pos/neg/zero template that was selected
    double value = 0.0;             // Normalized numeric value
    CurrencyOptions options;        // Options after session merge + suffix parsing
};

// ============================================================================
// Value Formatting Result
// ============================================================================

struct FormatResult {
    std::string formatted_value;
    std::variant<double, std::string> parsed_value;
    double decimal_value = 0.0;
    bool is_decimal_type = false;
};

} // namespace reskfmt
