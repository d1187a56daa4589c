#include "format/json_output.hpp"

namespace reskfmt {

void to_json(nlohmann::json& j, const CurrencyOptions& options) {
    j = nlohmann::json{
        {"symbol", options.symbol},
        {"decimal_digits", options.decimal_digits},
        {"thousand_separator", options.thousand_separator},
        {"decimal_separator", options.decimal_separator},
        {"format", options.format},
    };
}

void to_json(nlohmann::json& j, const FormatMoneyObject& money) {
    j = nlohmann::json{
        {"result", money.result},
        {"formatted_value", money.formatted_value},
        {"formatted_number", money.formatted_number},
        {"used_format", money.used_format},
        {"value", money.value},
        {"options", money.options},
    };
}

void to_json(nlohmann::json& j, const FormatResult& result) {
    j = nlohmann::json{
        {"formatted_value", result.formatted_value},
        {"decimal_value", result.decimal_value},
        {"is_decimal_type", result.is_decimal_type},
    };
    std::visit([&j](const auto& parsed) { j["parsed_value"] = parsed; }, result.parsed_value);
}

void to_json(nlohmann::json& j, const AbbreviatedNumber& abbreviated) {
    j = nlohmann::json{
        {"result", abbreviated.result},
        {"value", abbreviated.value},
        {"suffix", abbreviated.suffix},
    };
}

namespace {

const char* token_kind_name(MaskTokenKind kind) {
    switch (kind) {
        case MaskTokenKind::LITERAL:            return "literal";
        case MaskTokenKind::PATTERN:            return "pattern";
        case MaskTokenKind::OBFUSCATED_PATTERN: return "obfuscated_pattern";
    }
    return "unknown";
}

} // anonymous namespace

void to_json(nlohmann::json& j, const MaskToken& token) {
    j = nlohmann::json{{"kind", token_kind_name(token.kind)}};
    if (token.is_literal()) {
        j["literal"] = std::string(1, token.literal);
        return;
    }
    if (token.placeholder != '\0') j["placeholder"] = std::string(1, token.placeholder);
    if (token.marker != '\0') j["marker"] = std::string(1, token.marker);
}

void to_json(nlohmann::json& j, const MaskResult& result) {
    j = nlohmann::json{
        {"masked", result.masked},
        {"unmasked", result.unmasked},
        {"obfuscated", result.obfuscated},
        {"placeholder", result.placeholder},
        {"has_obfuscation", result.has_obfuscation},
        {"is_valid", result.is_valid},
        {"mask", result.mask},
    };
}

} // namespace reskfmt
