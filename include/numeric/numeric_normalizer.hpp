#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace reskfmt {

/**
 * @brief Decimal parsing, precision checks and artifact-free fixed rendering
 *
 * All functions are pure and never throw. Unusable input resolves to 0,
 * to the supplied fallback, or to the "NaN" sentinel string (to_fixed).
 */
class NumericNormalizer {
public:
    static constexpr std::string_view kNaN = "NaN";

    // Cleaned integer strings longer than this are not routed through double
    static constexpr size_t kMaxSafeIntegerDigits = 15;

    /**
     * @brief Parse a decimal from loosely-typed input
     *
     * Numbers are returned unchanged; null/empty input returns 0. Strings are
     * trimmed; when they contain no '.', the first ',' becomes the decimal
     * point, otherwise ',' is a group separator and dropped. Spaces are
     * removed, then the longest numeric prefix is parsed (failure -> 0).
     *
     * "1,234.56" -> 1234.56, "1 234,5" -> 1234.5, "abc" -> 0
     */
    [[nodiscard]] static double parse_decimal(const NumericInput& value);

    /**
     * @brief Rounded absolute value of `value`, or `base` when not numeric
     */
    [[nodiscard]] static uint32_t check_precision(const NumericInput& value, uint32_t base);

    /**
     * @brief Render with exactly `decimal_digits` fractional digits
     *
     * The input is reduced to digits, '-' and '.'. Dot-less results longer
     * than kMaxSafeIntegerDigits are returned verbatim with zero padding.
     * Otherwise the value is rounded by shifting the decimal exponent
     * ("1.235e2" -> 124 -> "124e-2") so 1.235 renders as "1.24", not "1.23".
     * Returns kNaN when nothing numeric remains.
     */
    [[nodiscard]] static std::string to_fixed(const NumericInput& value, uint32_t decimal_digits);

    // Shortest round-trip representation in plain (non-exponent) notation
    [[nodiscard]] static std::string to_plain_string(double value);

    // Fractional digits of to_plain_string(value): 1.25 -> 2, 3 -> 0
    [[nodiscard]] static uint32_t count_decimals(double value);

    // Math.round semantics: halves round toward +infinity
    [[nodiscard]] static double round_half_up(double value);
};

} // namespace reskfmt
