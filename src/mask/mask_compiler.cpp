#include "mask/mask_compiler.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <vector>

namespace reskfmt {

namespace {

// Insert `token` so that it ends up `from_end` positions before the end
// (clamped to the front, like a negative splice index)
void insert_from_end(Mask& mask, size_t from_end, MaskToken token) {
    const size_t offset = std::min(from_end, mask.size());
    mask.insert(mask.end() - static_cast<std::ptrdiff_t>(offset), std::move(token));
}

// ============================================================================
// Moment-style format tokens
// ============================================================================

// One validated field of a date/time format mask
struct DateField {
    char unit;      // Y M N(month name) D H h m s S Z
    size_t width;
};

struct FormatToken {
    std::string_view key;
    char unit;
    size_t width;
    bool letters;
    char placeholder;
};

// Ordered longest-first so tokenization is greedy
constexpr std::array<FormatToken, 19> kFormatTokens = {{
    {"YYYY", 'Y', 4, false, 'Y'},
    {"MMMM", 'N', 9, true,  'M'},
    {"SSS",  'S', 3, false, 'S'},
    {"MMM",  'N', 3, true,  'M'},
    {"YY",   'Y', 2, false, 'Y'},
    {"MM",   'M', 2, false, 'M'},
    {"DD",   'D', 2, false, 'D'},
    {"HH",   'H', 2, false, 'H'},
    {"hh",   'h', 2, false, 'h'},
    {"mm",   'm', 2, false, 'm'},
    {"ss",   's', 2, false, 's'},
    {"ZZ",   'Z', 5, false, '\0'},
    {"M",    'M', 1, false, 'M'},
    {"D",    'D', 1, false, 'D'},
    {"H",    'H', 1, false, 'H'},
    {"h",    'h', 1, false, 'h'},
    {"m",    'm', 1, false, 'm'},
    {"s",    's', 1, false, 's'},
    {"Z",    'Z', 5, false, '\0'},
}};

constexpr std::string_view kFormatSeparators = "/-. :T";

bool in_range(int value, int lo, int hi) {
    return value >= lo && value <= hi;
}

bool validate_fields(const std::vector<DateField>& fields, std::string_view unmasked) {
    size_t expected = 0;
    for (const auto& f : fields) expected += f.width;
    if (fields.empty() || unmasked.size() != expected) return false;

    int year = 2000;
    int month = 0;
    int day = 0;
    size_t pos = 0;

    for (const auto& f : fields) {
        const std::string_view part = unmasked.substr(pos, f.width);
        pos += f.width;

        if (f.unit == 'N') continue;  // month names are constrained by the letter class
        if (f.unit == 'Z') {
            const int hours = utils::parse_int<int>(part.substr(1, 2), -1);
            const int minutes = utils::parse_int<int>(part.substr(3, 2), -1);
            if (!in_range(hours, 0, 14) || !in_range(minutes, 0, 59)) return false;
            continue;
        }

        const int v = utils::parse_int<int>(part, -1);
        if (v < 0) return false;

        switch (f.unit) {
            case 'Y': year = f.width == 2 ? 2000 + v : v; break;
            case 'M': if (!in_range(v, 1, 12)) return false; month = v; break;
            case 'D': if (!in_range(v, 1, 31)) return false; day = v; break;
            case 'H': if (!in_range(v, 0, 23)) return false; break;
            case 'h': if (!in_range(v, 1, 12)) return false; break;
            case 'm':
            case 's': if (!in_range(v, 0, 59)) return false; break;
            default: break;
        }
    }

    if (day > 0 && month > 0) {
        return day <= MaskCompiler::days_in_month(month, year);
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Number mask
// ============================================================================

MaskFn MaskCompiler::compile_number_mask(const NumberMaskOptions& options) {
    return [options](std::string_view raw_value) {
        const std::string digits = utils::digits_only(raw_value);

        Mask mask(digits.size(), digit_token());

        const size_t precision = options.precision;
        const bool add_separator = precision > 0 && options.separator != '\0';
        if (add_separator && mask.size() > precision) {
            insert_from_end(mask, precision, MaskToken::lit(options.separator));
        }

        if (options.delimiter != '\0' && digits.size() > precision) {
            const size_t integer_digits = digits.size() - precision;
            const size_t delimiters = (integer_digits + 2) / 3 - 1;
            const size_t separator_offset = add_separator ? 1 : 0;
            for (size_t i = 0; i < delimiters; ++i) {
                const size_t from_end = precision + separator_offset + i * 4 + 3;
                insert_from_end(mask, from_end, MaskToken::lit(options.delimiter));
            }
        }

        Mask result;
        result.reserve(options.prefix.size() + mask.size());
        append_literals(result, options.prefix);
        result.insert(result.end(), mask.begin(), mask.end());
        return result;
    };
}

// ============================================================================
// Date mask (DD/MM/YYYY with positional narrowing)
// ============================================================================

MaskFn MaskCompiler::compile_date_mask(char separator) {
    return [separator](std::string_view raw_value) {
        // Classes of the day and month positions; the second digit of each
        // narrows on the first digit the mask actually accepted
        std::array<CharClass, 4> classes = {
            CharClass::range('0', '3'), CharClass::digit(),
            CharClass::any_of("01"), CharClass::digit(),
        };
        const auto narrow = [&classes](size_t pos, char accepted) {
            if (pos == 0) {
                if (accepted == '3') classes[1] = CharClass::any_of("01");
                else if (accepted == '0') classes[1] = CharClass::range('1', '9');
            } else if (pos == 2) {
                if (accepted == '1') classes[3] = CharClass::any_of("012");
                else if (accepted == '0') classes[3] = CharClass::range('1', '9');
            }
        };

        // Rejected digits are skipped by the matcher without advancing the mask
        size_t pos = 0;
        for (const char c : raw_value) {
            if (pos == classes.size()) break;
            if (!utils::is_digit(c) || !classes[pos].matches(c)) continue;
            narrow(pos, c);
            ++pos;
        }

        Mask mask;
        mask.reserve(10);
        mask.push_back(MaskToken::pattern(classes[0]));
        mask.push_back(MaskToken::pattern(classes[1]));
        mask.push_back(MaskToken::lit(separator));
        mask.push_back(MaskToken::pattern(classes[2]));
        mask.push_back(MaskToken::pattern(classes[3]));
        mask.push_back(MaskToken::lit(separator));
        for (int i = 0; i < 4; ++i) mask.push_back(digit_token());
        return mask;
    };
}

int MaskCompiler::days_in_month(int month, int year) {
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[static_cast<size_t>(month - 1)];
}

bool MaskCompiler::is_valid_date_digits(std::string_view unmasked) {
    static const std::vector<DateField> kFields = {{'D', 2}, {'M', 2}, {'Y', 4}};
    return validate_fields(kFields, unmasked);
}

// ============================================================================
// Format masks
// ============================================================================

MaskWithValidation MaskCompiler::compile_date_format_mask(std::string_view format) {
    Mask mask;
    auto fields = std::make_shared<std::vector<DateField>>();

    size_t i = 0;
    while (i < format.size()) {
        const char c = format[i];
        if (kFormatSeparators.find(c) != std::string_view::npos) {
            mask.push_back(MaskToken::lit(c));
            ++i;
            continue;
        }

        // AM/PM markers render as fixed text
        if (c == 'A' || c == 'a') {
            append_literals(mask, c == 'A' ? "AM" : "am");
            ++i;
            continue;
        }

        const FormatToken* matched = nullptr;
        for (const auto& token : kFormatTokens) {
            if (format.substr(i, token.key.size()) == token.key) {
                matched = &token;
                break;
            }
        }

        if (!matched) {
            mask.push_back(MaskToken::lit(c));
            ++i;
            continue;
        }

        if (matched->unit == 'Z') {
            mask.push_back(MaskToken::pattern(CharClass::any_of("+-")));
            for (int d = 0; d < 4; ++d) mask.push_back(digit_token());
        } else {
            const CharClass cls = matched->letters ? CharClass::letter() : CharClass::digit();
            for (size_t w = 0; w < matched->width; ++w) {
                mask.push_back(MaskToken::pattern(cls, matched->placeholder));
            }
        }
        fields->push_back({matched->unit, matched->width});
        i += matched->key.size();
    }

    return {std::move(mask), [fields](const std::string& unmasked) {
        return validate_fields(*fields, unmasked);
    }};
}

MaskWithValidation MaskCompiler::date() {
    return compile_date_format_mask("DD/MM/YYYY");
}

MaskWithValidation MaskCompiler::time() {
    return compile_date_format_mask("HH:mm:ss");
}

MaskWithValidation MaskCompiler::date_time() {
    return compile_date_format_mask("DD/MM/YYYY HH:mm:ss");
}

MaskWithValidation MaskCompiler::credit_card() {
    Mask mask;
    for (int group = 0; group < 4; ++group) {
        if (group > 0) mask.push_back(MaskToken::lit(' '));
        const bool hidden = group == 1 || group == 2;
        for (int d = 0; d < 4; ++d) {
            mask.push_back(hidden ? MaskToken::obfuscated(CharClass::digit()) : digit_token());
        }
    }

    return {std::move(mask), [](const std::string& unmasked) {
        if (unmasked.size() != 16) return false;

        // Luhn check, processed right to left
        int sum = 0;
        bool double_digit = false;
        for (auto it = unmasked.rbegin(); it != unmasked.rend(); ++it) {
            int digit = *it - '0';
            if (double_digit) {
                digit *= 2;
                if (digit > 9) digit -= 9;
            }
            sum += digit;
            double_digit = !double_digit;
        }
        return sum % 10 == 0;
    }};
}

} // namespace reskfmt
