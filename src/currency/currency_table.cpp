#include "currency/currency_table.hpp"
#include "core/utils.hpp"

namespace reskfmt {

namespace {

const std::vector<CurrencyInfo> kCurrencies = {
    {"USD", "$",    "$",    "US Dollar",                    2},
    {"EUR", "€",    "€",    "Euro",                         2},
    {"GBP", "£",    "£",    "British Pound Sterling",       2},
    {"CAD", "CA$",  "$",    "Canadian Dollar",              2},
    {"CHF", "CHF",  "CHF",  "Swiss Franc",                  2},
    {"JPY", "¥",    "￥",   "Japanese Yen",                 0},
    {"CNY", "CN¥",  "CN¥",  "Chinese Yuan",                 2},
    {"INR", "Rs",   "₹",    "Indian Rupee",                 2},
    {"BRL", "R$",   "R$",   "Brazilian Real",               2},
    {"MXN", "MX$",  "$",    "Mexican Peso",                 2},
    {"AUD", "AU$",  "$",    "Australian Dollar",            2},
    {"ZAR", "R",    "R",    "South African Rand",           2},
    {"NGN", "₦",    "₦",    "Nigerian Naira",               2},
    {"KES", "Ksh",  "Ksh",  "Kenyan Shilling",              2},
    {"MAD", "MAD",  "د.م.‏", "Moroccan Dirham",              2},
    {"XAF", "FCFA", "FCFA", "CFA Franc BEAC",               0},
    {"XOF", "CFA",  "CFA",  "CFA Franc BCEAO",              0},
};

} // anonymous namespace

const std::vector<CurrencyInfo>& CurrencyTable::all() {
    return kCurrencies;
}

std::optional<CurrencyInfo> CurrencyTable::find(std::string_view code) {
    const std::string key = utils::to_upper(utils::trim(code));
    for (const auto& currency : kCurrencies) {
        if (currency.code == key) return currency;
    }
    return std::nullopt;
}

} // namespace reskfmt
