#include "mask/phone_mask.hpp"
#include "mask/mask_matcher.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace reskfmt {

namespace {

// Countries sharing a dial code are listed with the primary one first
const std::vector<PhoneCountry> kCountries = {
    {"US", "1",   "(###) ###-####"},
    {"CA", "1",   "(###) ###-####"},
    {"GB", "44",  "#### ######"},
    {"FR", "33",  "# ## ## ## ##"},
    {"DE", "49",  "### ########"},
    {"ES", "34",  "### ## ## ##"},
    {"IT", "39",  "### ### ####"},
    {"BE", "32",  "### ## ## ##"},
    {"CH", "41",  "## ### ## ##"},
    {"NL", "31",  "# ########"},
    {"BR", "55",  "(##) #####-####"},
    {"MX", "52",  "## #### ####"},
    {"IN", "91",  "#####-#####"},
    {"CN", "86",  "### #### ####"},
    {"JP", "81",  "##-####-####"},
    {"AU", "61",  "### ### ###"},
    {"NG", "234", "### ### ####"},
    {"CM", "237", "# ## ## ## ##"},
    {"CI", "225", "## ## ## ## ##"},
    {"SN", "221", "## ### ## ##"},
    {"GA", "241", "## ## ## ##"},
    {"CD", "243", "### ### ###"},
    {"MA", "212", "###-######"},
    {"ZA", "27",  "## ### ####"},
    {"KE", "254", "### ######"},
};

size_t count_template_digits(std::string_view national_format) {
    return static_cast<size_t>(std::count(national_format.begin(), national_format.end(), '#'));
}

Mask mask_from_template(std::string_view national_format) {
    Mask mask;
    mask.reserve(national_format.size());
    for (const char c : national_format) {
        mask.push_back(c == '#' ? digit_token() : MaskToken::lit(c));
    }
    return mask;
}

Validator digit_count_validator(size_t expected) {
    return [expected](const std::string& unmasked) {
        return unmasked.size() == expected
            && std::all_of(unmasked.begin(), unmasked.end(), utils::is_digit);
    };
}

PhoneMask unknown_phone_mask() {
    PhoneMask result;
    result.validate = [](const std::string&) { return false; };
    return result;
}

} // anonymous namespace

const std::vector<PhoneCountry>& PhoneMaskCompiler::countries() {
    return kCountries;
}

std::optional<PhoneCountry> PhoneMaskCompiler::find_country(std::string_view iso_code) {
    const std::string code = utils::to_upper(utils::trim(iso_code));
    for (const auto& country : kCountries) {
        if (country.iso_code == code) return country;
    }
    return std::nullopt;
}

std::optional<PhoneCountry> PhoneMaskCompiler::find_country_by_dial_code(std::string_view dial_code) {
    for (const auto& country : kCountries) {
        if (country.dial_code == dial_code) return country;
    }
    return std::nullopt;
}

PhoneMask PhoneMaskCompiler::compile(std::string_view country_or_example) {
    const std::string input = utils::trim(country_or_example);
    if (!input.empty() && input.front() == '+') {
        return compile_from_example(input);
    }
    return compile_for_country(input);
}

PhoneMask PhoneMaskCompiler::compile_for_country(std::string_view iso_code) {
    const auto country = find_country(iso_code);
    if (!country) {
        utils::log::debug(std::format("No phone template for country '{}'", iso_code));
        return unknown_phone_mask();
    }

    PhoneMask result;
    result.mask = mask_from_template(country->national_format);
    result.placeholder = MaskMatcher::placeholder(result.mask);
    result.validate = digit_count_validator(count_template_digits(country->national_format));
    result.country_code = std::string(country->iso_code);
    result.dial_code = std::string(country->dial_code);
    return result;
}

PhoneMask PhoneMaskCompiler::compile_from_example(std::string_view example) {
    const std::string dial_code = extract_dial_code(example);
    if (dial_code.empty()) {
        return unknown_phone_mask();
    }
    const auto country = find_country_by_dial_code(dial_code);

    const std::string all_digits = utils::digits_only(example);
    const size_t national_digits = all_digits.size() - dial_code.size();

    PhoneMask result;
    result.mask.push_back(MaskToken::lit('+'));
    append_literals(result.mask, dial_code);
    result.mask.push_back(MaskToken::lit(' '));

    if (country && count_template_digits(country->national_format) == national_digits) {
        const Mask national = mask_from_template(country->national_format);
        result.mask.insert(result.mask.end(), national.begin(), national.end());
    } else {
        for (size_t i = 0; i < national_digits; ++i) {
            result.mask.push_back(digit_token());
        }
    }

    result.placeholder = MaskMatcher::placeholder(result.mask);
    result.validate = digit_count_validator(national_digits);
    result.dial_code = dial_code;
    if (country) result.country_code = std::string(country->iso_code);
    return result;
}

std::string PhoneMaskCompiler::sanitize_phone_number(std::string_view phone_number) {
    std::string result(phone_number);
    const auto close = result.find(')');
    if (close == std::string::npos) return result;

    size_t next = close + 1;
    while (next < result.size() && utils::is_space(result[next])) ++next;
    if (next < result.size() && utils::is_digit(result[next])) {
        result.replace(close + 1, next - close - 1, " ");
    }
    return result;
}

std::string PhoneMaskCompiler::clean_phone_number(std::string_view phone_number) {
    std::string result;
    result.reserve(phone_number.size());
    for (const char c : phone_number) {
        if (!utils::is_space(c)) result += c;
    }
    return result;
}

std::string PhoneMaskCompiler::extract_dial_code(std::string_view phone_number) {
    const std::string cleaned = clean_phone_number(phone_number);
    if (cleaned.empty() || cleaned.front() != '+') return "";

    size_t end = 1;
    while (end < cleaned.size() && utils::is_digit(cleaned[end])) ++end;
    const std::string_view digits = std::string_view(cleaned).substr(1, end - 1);

    // Longest matching dial code wins
    std::string best;
    for (const auto& country : kCountries) {
        if (country.dial_code.size() > best.size() && digits.starts_with(country.dial_code)) {
            best = std::string(country.dial_code);
        }
    }
    return best;
}

MaskResult PhoneMask::format(std::string_view value, MaskOptions options) const {
    if (!options.validate) options.validate = validate;
    return MaskMatcher::match(PhoneMaskCompiler::sanitize_phone_number(value), mask, options);
}

} // namespace reskfmt
