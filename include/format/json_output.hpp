#pragma once

#include "core/types.hpp"
#include "currency/currency_formatter.hpp"
#include "mask/mask_token.hpp"

#include <nlohmann/json.hpp>

namespace reskfmt {

// nlohmann ADL hooks; field names follow the CLI output schema

void to_json(nlohmann::json& j, const CurrencyOptions& options);
void to_json(nlohmann::json& j, const FormatMoneyObject& money);
void to_json(nlohmann::json& j, const FormatResult& result);
void to_json(nlohmann::json& j, const AbbreviatedNumber& abbreviated);

// Character classes are not serialized; a pattern token reports its kind and
// the characters it renders with
void to_json(nlohmann::json& j, const MaskToken& token);
void to_json(nlohmann::json& j, const MaskResult& result);

} // namespace reskfmt
