#include "format/value_formatter.hpp"
#include "currency/currency_formatter.hpp"
#include "currency/currency_table.hpp"
#include "numeric/numeric_normalizer.hpp"
#include "core/utils.hpp"

#include <format>

namespace reskfmt {

namespace {

constexpr std::string_view kMoneyFormat = "money";
constexpr std::string_view kAbbreviateFormat = "abbreviate";
constexpr std::string_view kAbbreviateMoneyFormat = "abbreviate-money";

std::string input_text(const NumericInput& value) {
    if (value.is_null()) return "";
    if (value.is_number()) return NumericNormalizer::to_plain_string(value.number());
    return value.text();
}

} // anonymous namespace

ValueFormatter::ValueFormatter()
    : session_(SessionDefaults::global()) {}

ValueFormatter::ValueFormatter(const SessionDefaults& session)
    : session_(session) {}

bool ValueFormatter::is_decimal_type(std::string_view type) {
    const std::string lowered = utils::to_lower(type);
    return lowered == "decimal" || lowered == "numeric" || lowered == "number";
}

std::string ValueFormatter::format_named(double value, std::string_view format) const {
    const CurrencyFormatter currency(session_);
    const std::string name = utils::to_lower(utils::trim(format));

    if (name == kMoneyFormat) {
        return currency.format_money(value);
    }
    if (name == kAbbreviateFormat) {
        return currency.abbreviate_number(value).result;
    }
    if (name == kAbbreviateMoneyFormat) {
        return currency.abbreviate_money(value);
    }
    if (name.size() > kMoneyFormat.size() && name.starts_with(kMoneyFormat)) {
        const auto info = CurrencyTable::find(std::string_view(name).substr(kMoneyFormat.size()));
        if (info) {
            CurrencyOptionsOverride overrides;
            overrides.symbol = std::string(info->symbol);
            overrides.decimal_digits = info->decimal_digits;
            return currency.format_money(value, overrides);
        }
        utils::log::debug(std::format("Unknown currency in format '{}', using number format", format));
    }
    return currency.format_number(value);
}

FormatResult ValueFormatter::format_to_object(const FormatOptions& options) const {
    FormatResult result;
    result.is_decimal_type = is_decimal_type(options.type);

    if (result.is_decimal_type) {
        const double parsed = NumericNormalizer::parse_decimal(options.value);
        result.parsed_value = parsed;
        result.decimal_value = parsed;
    } else {
        result.parsed_value = input_text(options.value);
    }

    if (options.formatter) {
        result.formatted_value = options.formatter(options);
    } else if (result.is_decimal_type) {
        result.formatted_value = format_named(result.decimal_value, options.format);
    } else {
        result.formatted_value = std::get<std::string>(result.parsed_value);
    }
    return result;
}

std::string ValueFormatter::format(const FormatOptions& options) const {
    return format_to_object(options).formatted_value;
}

} // namespace reskfmt
