#include "numeric/numeric_normalizer.hpp"
#include "core/utils.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace reskfmt {

double NumericNormalizer::parse_decimal(const NumericInput& value) {
    if (value.is_number()) return value.number();
    if (value.is_null() || value.text().empty()) return 0.0;

    std::string text = utils::trim(value.text());
    if (text.find('.') == std::string::npos) {
        text = utils::replace_first(std::move(text), ",", ".");
    } else {
        text = utils::replace_all(std::move(text), ",", "");
    }
    text = utils::replace_all(std::move(text), " ", "");

    const auto parsed = utils::parse_double_prefix(text);
    if (!parsed || !std::isfinite(*parsed)) return 0.0;
    return *parsed;
}

uint32_t NumericNormalizer::check_precision(const NumericInput& value, uint32_t base) {
    std::optional<double> number;
    if (value.is_number()) {
        number = value.number();
    } else if (value.is_string()) {
        number = utils::parse_double_strict(utils::trim(value.text()));
    }
    if (!number || !std::isfinite(*number)) return base;

    const double rounded = std::round(std::fabs(*number));
    if (rounded > static_cast<double>(std::numeric_limits<uint32_t>::max())) return base;
    return static_cast<uint32_t>(rounded);
}

std::string NumericNormalizer::to_plain_string(double value) {
    if (std::isnan(value)) return std::string(kNaN);
    if (std::isinf(value)) return value < 0 ? "-Infinity" : "Infinity";
    if (value == 0.0) return "0";

    // Largest fixed rendering of a double is ~310 digits before the point
    std::array<char, 512> buf{};
    const auto [ptr, ec] = std::to_chars(
        buf.data(), buf.data() + buf.size(), value, std::chars_format::fixed);
    if (ec != std::errc{}) return std::string(kNaN);
    return std::string(buf.data(), ptr);
}

uint32_t NumericNormalizer::count_decimals(double value) {
    const std::string text = to_plain_string(value);
    const auto dot = text.find('.');
    if (dot == std::string::npos) return 0;
    return static_cast<uint32_t>(text.size() - dot - 1);
}

double NumericNormalizer::round_half_up(double value) {
    const double floor = std::floor(value);
    return (value - floor >= 0.5) ? floor + 1.0 : floor;
}

std::string NumericNormalizer::to_fixed(const NumericInput& value, uint32_t decimal_digits) {
    std::string source;
    if (value.is_number()) {
        if (!std::isfinite(value.number())) return std::string(kNaN);
        source = to_plain_string(value.number());
    } else if (value.is_string()) {
        source = value.text();
    } else {
        return std::string(kNaN);
    }

    std::string cleaned;
    cleaned.reserve(source.size());
    for (const char c : source) {
        if (utils::is_digit(c) || c == '-' || c == '.') cleaned += c;
    }

    // Too long to survive a round trip through double: pad, don't round
    if (cleaned.find('.') == std::string::npos && cleaned.size() > kMaxSafeIntegerDigits) {
        if (decimal_digits == 0) return cleaned;
        return cleaned + "." + std::string(decimal_digits, '0');
    }

    if (!utils::parse_double_strict(cleaned)) return std::string(kNaN);

    // Shift the decimal point in text, round, then shift back in text
    const auto shifted = utils::parse_double_strict(std::format("{}e{}", cleaned, decimal_digits));
    if (!shifted || !std::isfinite(*shifted)) return std::string(kNaN);

    double rounded = round_half_up(*shifted);
    if (rounded == 0.0) rounded = 0.0;  // drop the sign of -0

    const auto restored = utils::parse_double_strict(
        std::format("{:.0f}e-{}", rounded, decimal_digits));
    if (!restored) return std::string(kNaN);

    return std::format("{:.{}f}", *restored, decimal_digits);
}

} // namespace reskfmt
