#pragma once

#include "mask/mask_token.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace reskfmt {

/**
 * @brief Number mask settings
 *
 * delimiter: thousands group literal ('\0' disables grouping)
 * separator: decimal literal placed before the last `precision` digits
 *            ('\0' disables it)
 * prefix:    literal characters prepended to every generated mask
 */
struct NumberMaskOptions {
    char delimiter = '.';
    uint32_t precision = 2;
    char separator = ',';
    std::string prefix;
};

/**
 * @brief Mask generators
 *
 * Number and date masks depend on what the user already typed, so they are
 * returned as MaskFn and re-evaluated on every keystroke. Format masks are
 * static and carry their own validation rule.
 */
class MaskCompiler {
public:
    /**
     * @brief Grouping mask sized to the digits of the current value
     *
     * "12345678" with defaults -> 1 2 3 . 4 5 6 , 7 8
     */
    [[nodiscard]] static MaskFn compile_number_mask(const NumberMaskOptions& options = {});

    /**
     * @brief DD<sep>MM<sep>YYYY mask with positional digit narrowing
     *
     * The allowed class of each day/month digit depends on digits already
     * typed: a leading day digit '3' restricts the second to {0,1}, a leading
     * month digit '1' restricts the second to {0,1,2}.
     */
    [[nodiscard]] static MaskFn compile_date_mask(char separator = '/');

    // True when `unmasked` is 8 digits DDMMYYYY naming a real calendar date
    [[nodiscard]] static bool is_valid_date_digits(std::string_view unmasked);

    /**
     * @brief Static mask from a moment-style format string ("YYYY-MM-DD")
     *
     * Pattern tokens carry the format letter as placeholder, so the mask's
     * placeholder mirrors the format ("YYYY-MM-DD"). Validation checks field
     * ranges (month 1-12, day within month, hour/minute/second bounds).
     */
    [[nodiscard]] static MaskWithValidation compile_date_format_mask(std::string_view format);

    // Presets
    [[nodiscard]] static MaskWithValidation date();        // DD/MM/YYYY
    [[nodiscard]] static MaskWithValidation time();        // HH:mm:ss
    [[nodiscard]] static MaskWithValidation date_time();   // DD/MM/YYYY HH:mm:ss
    [[nodiscard]] static MaskWithValidation credit_card(); // 4x4 digits, middle groups obfuscated

    [[nodiscard]] static int days_in_month(int month, int year);
};

} // namespace reskfmt
