#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace reskfmt {

/**
 * @brief Static description of an ISO-4217 currency
 */
struct CurrencyInfo {
    std::string_view code;
    std::string_view symbol;
    std::string_view symbol_native;
    std::string_view name;
    uint32_t decimal_digits;
};

class CurrencyTable {
public:
    // Case-insensitive, surrounding whitespace ignored
    [[nodiscard]] static std::optional<CurrencyInfo> find(std::string_view code);

    [[nodiscard]] static const std::vector<CurrencyInfo>& all();
};

} // namespace reskfmt
