#pragma once

#include "mask/mask_token.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reskfmt {

/**
 * @brief National numbering convention of one country
 *
 * `national_format` uses '#' for a digit; every other character is a literal,
 * e.g. "(###) ###-####" for the North American plan.
 */
struct PhoneCountry {
    std::string_view iso_code;
    std::string_view dial_code;
    std::string_view national_format;
};

struct PhoneMask {
    Mask mask;
    std::string placeholder;
    Validator validate;
    std::string country_code;   // ISO 3166 alpha-2, empty when unknown
    std::string dial_code;      // Without '+', empty when unknown

    /**
     * @brief Sanitize then match `value` against this mask
     */
    [[nodiscard]] MaskResult format(std::string_view value, MaskOptions options = {}) const;
};

/**
 * @brief Phone mask generation from a country template or an example number
 *
 * Unknown countries produce an empty mask whose validator always fails, so
 * matching degrades to identity passthrough.
 */
class PhoneMaskCompiler {
public:
    // "+..." is treated as an example number, anything else as an ISO code
    [[nodiscard]] static PhoneMask compile(std::string_view country_or_example);

    [[nodiscard]] static PhoneMask compile_for_country(std::string_view iso_code);

    /**
     * @brief Mask from an international example such as "+23769965076"
     *
     * Produces '+', the dial code digits as literals, a space, then the
     * country's national template when its digit count equals the example's
     * remaining digits, otherwise one digit pattern per remaining digit.
     */
    [[nodiscard]] static PhoneMask compile_from_example(std::string_view example);

    // Ensure exactly one space between ')' and a following digit
    [[nodiscard]] static std::string sanitize_phone_number(std::string_view phone_number);

    // Drop all whitespace: "+1 (555) 123-4567" -> "+1(555)123-4567"
    [[nodiscard]] static std::string clean_phone_number(std::string_view phone_number);

    // Longest known dial code following a leading '+', or empty
    [[nodiscard]] static std::string extract_dial_code(std::string_view phone_number);

    [[nodiscard]] static std::optional<PhoneCountry> find_country(std::string_view iso_code);
    [[nodiscard]] static std::optional<PhoneCountry> find_country_by_dial_code(std::string_view dial_code);

    [[nodiscard]] static const std::vector<PhoneCountry>& countries();
};

} // namespace reskfmt
