#include "currency/currency_formatter.hpp"
#include "numeric/numeric_normalizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace reskfmt {

static constexpr std::string_view kValueToken = "%v";
static constexpr std::string_view kSymbolToken = "%s";
static constexpr size_t kMaxFormatDigits = 9;

CurrencyFormatter::CurrencyFormatter()
    : session_(SessionDefaults::global()) {}

CurrencyFormatter::CurrencyFormatter(const SessionDefaults& session)
    : session_(session) {}

// ============================================================================
// Option resolution
// ============================================================================

ParsedFormat CurrencyFormatter::parse_format(std::string_view format) {
    ParsedFormat parsed;
    parsed.format = utils::trim(format);

    const std::string& text = parsed.format;
    size_t hashes = 0;
    while (hashes < text.size() && text[text.size() - 1 - hashes] == '#') ++hashes;

    if (hashes > kMaxFormatDigits || hashes == text.size()) return parsed;
    const size_t dot = text.size() - 1 - hashes;
    if (text[dot] != '.') return parsed;

    parsed.decimal_digits = static_cast<uint32_t>(hashes);
    parsed.format = utils::trim(std::string_view(text).substr(0, dot));
    return parsed;
}

CurrencyOptions CurrencyFormatter::prepare_options(const CurrencyOptionsOverride& options) const {
    CurrencyOptions result = session_.get_currency();

    if (options.symbol) result.symbol = *options.symbol;
    if (options.decimal_digits) result.decimal_digits = *options.decimal_digits;
    if (options.thousand_separator) result.thousand_separator = *options.thousand_separator;
    if (options.decimal_separator) result.decimal_separator = *options.decimal_separator;
    if (options.format) result.format = *options.format;

    if (!result.format.empty()) {
        auto parsed = parse_format(result.format);
        result.format = std::move(parsed.format);
        if (parsed.decimal_digits) {
            result.decimal_digits = *parsed.decimal_digits;
        }
    }
    return result;
}

CurrencyFormatTemplates CurrencyFormatter::check_currency_format(std::string_view format) const {
    std::string pos = utils::to_lower(format);
    if (pos.find(kValueToken) == std::string::npos) {
        pos = utils::to_lower(parse_format(session_.get_currency().format).format);
        if (pos.find(kValueToken) == std::string::npos) {
            pos = std::string(SessionDefaults::kDefaultFormat);
        }
    }

    std::string neg = pos;
    neg.erase(std::remove(neg.begin(), neg.end(), '-'), neg.end());
    neg = utils::replace_first(std::move(neg), kValueToken, "-%v");

    return {pos, std::move(neg), pos};
}

// ============================================================================
// Parsing
// ============================================================================

double CurrencyFormatter::unformat(
    const NumericInput& value,
    std::optional<std::string> decimal_separator) const {

    if (value.is_falsy()) return 0.0;
    if (value.is_number()) return value.number();

    const std::string decimal = decimal_separator
        ? std::move(*decimal_separator)
        : session_.get_currency().decimal_separator;

    std::string text = value.text();

    // "(123...)" accounting negatives; the digit must follow '(' directly
    for (size_t open = text.find('('); open != std::string::npos; open = text.find('(', open + 1)) {
        if (open + 1 >= text.size() || !utils::is_digit(text[open + 1])) continue;
        const size_t close = text.rfind(')');
        if (close == std::string::npos || close < open) continue;
        text = text.substr(0, open) + "-" + text.substr(open + 1, close - open - 1) + text.substr(close + 1);
        break;
    }

    std::string cleaned;
    cleaned.reserve(text.size());
    for (const char c : text) {
        if (utils::is_digit(c) || c == '-' || decimal.find(c) != std::string::npos) {
            cleaned += c;
        }
    }
    cleaned = utils::replace_first(std::move(cleaned), decimal, ".");

    const auto parsed = utils::parse_double_prefix(cleaned);
    if (!parsed || !std::isfinite(*parsed)) return 0.0;
    return *parsed;
}

// ============================================================================
// Number formatting
// ============================================================================

std::string CurrencyFormatter::render_number(
    double number,
    uint32_t decimal_digits,
    const std::string& thousand_separator,
    const std::string& decimal_separator) {

    const std::string fixed = NumericNormalizer::to_fixed(std::fabs(number), decimal_digits);
    if (fixed == NumericNormalizer::kNaN) return fixed;

    const auto dot = fixed.find('.');
    const std::string integer = fixed.substr(0, dot);
    const std::string fraction = dot == std::string::npos ? "" : fixed.substr(dot + 1);

    std::string grouped;
    grouped.reserve(integer.size() + integer.size() / 3 * thousand_separator.size());
    const size_t lead = integer.size() % 3 == 0 ? 3 : integer.size() % 3;
    for (size_t i = 0; i < integer.size(); ++i) {
        if (i > 0 && i >= lead && (i - lead) % 3 == 0) grouped += thousand_separator;
        grouped += integer[i];
    }

    std::string result;
    const bool all_zero = std::all_of(fixed.begin(), fixed.end(),
        [](char c) { return c == '0' || c == '.'; });
    if (number < 0 && !all_zero) result += '-';
    result += grouped;
    if (decimal_digits > 0 && !fraction.empty()) {
        result += decimal_separator;
        result += fraction;
    }
    return result;
}

std::string CurrencyFormatter::format_number(const NumericInput& value) const {
    const double number = unformat(value);
    const CurrencyOptions opts = prepare_options();
    const uint32_t present = NumericNormalizer::count_decimals(number);
    const uint32_t digits = present > 0 ? present : opts.decimal_digits;
    return render_number(number, digits, opts.thousand_separator, opts.decimal_separator);
}

std::string CurrencyFormatter::format_number(
    const NumericInput& value,
    uint32_t decimal_digits,
    std::optional<std::string> thousand_separator,
    std::optional<std::string> decimal_separator) const {

    const double number = unformat(value);
    CurrencyOptionsOverride overrides;
    overrides.thousand_separator = std::move(thousand_separator);
    overrides.decimal_separator = std::move(decimal_separator);
    const CurrencyOptions opts = prepare_options(overrides);
    return render_number(number, decimal_digits, opts.thousand_separator, opts.decimal_separator);
}

std::string CurrencyFormatter::format_number(
    const NumericInput& value,
    const CurrencyOptionsOverride& options) const {

    const double number = unformat(value);
    const CurrencyOptions opts = prepare_options(options);

    uint32_t digits = opts.decimal_digits;
    const bool digits_from_options = options.decimal_digits.has_value()
        || (options.format && parse_format(*options.format).decimal_digits.has_value());
    if (!digits_from_options) {
        const uint32_t present = NumericNormalizer::count_decimals(number);
        if (present > 0) digits = present;
    }
    return render_number(number, digits, opts.thousand_separator, opts.decimal_separator);
}

// ============================================================================
// Money formatting
// ============================================================================

FormatMoneyObject CurrencyFormatter::format_money_as_object(
    const NumericInput& value,
    const CurrencyOptionsOverride& options) const {

    FormatMoneyObject out;
    out.value = unformat(value);
    out.options = prepare_options(options);

    const auto templates = check_currency_format(out.options.format);
    out.used_format = out.value > 0 ? templates.pos
                    : out.value < 0 ? templates.neg
                    : templates.zero;

    out.formatted_number = render_number(
        std::fabs(out.value),
        out.options.decimal_digits,
        out.options.thousand_separator,
        out.options.decimal_separator);

    if (!out.options.symbol.empty()) {
        out.formatted_value = utils::replace_first(out.used_format, kSymbolToken, out.options.symbol);
    } else {
        out.formatted_value = utils::trim(utils::replace_first(out.used_format, kSymbolToken, ""));
    }
    out.result = utils::replace_first(out.formatted_value, kValueToken, out.formatted_number);
    return out;
}

FormatMoneyObject CurrencyFormatter::format_money_as_object(
    const NumericInput& value,
    std::optional<std::string> symbol,
    std::optional<uint32_t> decimal_digits,
    std::optional<std::string> thousand_separator,
    std::optional<std::string> decimal_separator,
    std::optional<std::string> format) const {

    CurrencyOptionsOverride overrides;
    overrides.symbol = std::move(symbol);
    overrides.decimal_digits = decimal_digits;
    overrides.thousand_separator = std::move(thousand_separator);
    overrides.decimal_separator = std::move(decimal_separator);
    overrides.format = std::move(format);
    return format_money_as_object(value, overrides);
}

std::string CurrencyFormatter::format_money(
    const NumericInput& value,
    const CurrencyOptionsOverride& options) const {
    return format_money_as_object(value, options).result;
}

std::string CurrencyFormatter::format_money(
    const NumericInput& value,
    std::optional<std::string> symbol,
    std::optional<uint32_t> decimal_digits,
    std::optional<std::string> thousand_separator,
    std::optional<std::string> decimal_separator,
    std::optional<std::string> format) const {
    return format_money_as_object(value, std::move(symbol), decimal_digits,
        std::move(thousand_separator), std::move(decimal_separator), std::move(format)).result;
}

// ============================================================================
// Abbreviation
// ============================================================================

AbbreviatedNumber CurrencyFormatter::abbreviate_number(const NumericInput& value) const {
    static constexpr std::array<std::string_view, 5> kSuffixes = {"", "K", "M", "B", "T"};

    AbbreviatedNumber out;
    const double number = unformat(value);
    if (number == 0.0 || !std::isfinite(number)) {
        out.result = "0";
        return out;
    }

    const uint32_t fixed = std::min<uint32_t>(NumericNormalizer::count_decimals(number), 5);

    // Exponent of the value rounded to two significant digits
    const std::string sci = std::format("{:.1e}", number);
    std::string_view exp_text = std::string_view(sci).substr(sci.find('e') + 1);
    if (!exp_text.empty() && exp_text.front() == '+') exp_text.remove_prefix(1);
    const int exponent = utils::parse_int<int>(exp_text, 0);
    const int group = exponent >= 2 ? std::min(exponent, 14) / 3 : 0;

    const std::string scaled = group < 1
        ? NumericNormalizer::to_fixed(number, fixed)
        : NumericNormalizer::to_fixed(number / std::pow(10.0, group * 3), 1 + fixed);
    out.value = utils::parse_double_strict(scaled).value_or(0.0);
    out.suffix = std::string(kSuffixes[static_cast<size_t>(group)]);
    out.result = format_number(out.value) + out.suffix;
    return out;
}

std::string CurrencyFormatter::abbreviate_money(
    const NumericInput& value,
    const CurrencyOptionsOverride& options) const {

    const AbbreviatedNumber abbreviated = abbreviate_number(value);
    const FormatMoneyObject money = format_money_as_object(abbreviated.value, options);
    const std::string magnitude = format_number(std::fabs(abbreviated.value), options);
    return utils::replace_first(money.formatted_value, kValueToken, magnitude + abbreviated.suffix);
}

} // namespace reskfmt
