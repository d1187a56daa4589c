#include "mask/mask_matcher.hpp"

#include <algorithm>

namespace reskfmt {

std::string MaskMatcher::placeholder(const Mask& mask, char blank) {
    std::string result;
    result.reserve(mask.size());
    for (const auto& token : mask) {
        switch (token.kind) {
            case MaskTokenKind::LITERAL:
                result += token.literal;
                break;
            case MaskTokenKind::PATTERN:
            case MaskTokenKind::OBFUSCATED_PATTERN:
                result += token.placeholder != '\0' ? token.placeholder : blank;
                break;
        }
    }
    return result;
}

bool MaskMatcher::has_obfuscation(const Mask& mask) {
    return std::any_of(mask.begin(), mask.end(), [](const MaskToken& t) {
        return t.kind == MaskTokenKind::OBFUSCATED_PATTERN;
    });
}

MaskResult MaskMatcher::match(
    std::string_view value,
    const Mask& mask,
    const MaskOptions& options) {

    MaskResult result;
    result.mask = mask;
    result.has_obfuscation = has_obfuscation(mask);
    result.placeholder = placeholder(mask, options.placeholder_character);

    if (mask.empty() || value.empty()) {
        result.masked = std::string(value);
        result.unmasked = std::string(value);
        result.obfuscated = std::string(value);
        result.is_valid = true;
        return result;
    }

    result.masked.reserve(mask.size());
    result.obfuscated.reserve(mask.size());
    result.unmasked.reserve(value.size());

    size_t mask_idx = 0;
    size_t value_idx = 0;

    while (mask_idx < mask.size()) {
        const MaskToken& token = mask[mask_idx];

        // Input exhausted: only trailing literals may still be emitted
        if (value_idx == value.size()) {
            if (token.is_literal() && options.auto_complete) {
                result.masked += token.literal;
                result.obfuscated += token.literal;
                ++mask_idx;
                continue;
            }
            break;
        }

        const char value_char = value[value_idx];

        switch (token.kind) {
            case MaskTokenKind::LITERAL:
                result.masked += token.literal;
                result.obfuscated += token.literal;
                if (token.literal == value_char) {
                    ++value_idx;
                }
                ++mask_idx;
                break;

            case MaskTokenKind::PATTERN:
            case MaskTokenKind::OBFUSCATED_PATTERN:
                // Pattern positions always consume input, matched or not
                ++value_idx;
                if (token.char_class.matches(value_char)) {
                    result.masked += value_char;
                    result.unmasked += value_char;
                    if (token.kind == MaskTokenKind::OBFUSCATED_PATTERN) {
                        result.obfuscated += token.marker != '\0'
                            ? token.marker : options.obfuscation_character;
                    } else {
                        result.obfuscated += value_char;
                    }
                    ++mask_idx;
                }
                break;
        }
    }

    result.is_valid = options.validate
        ? options.validate(result.unmasked)
        : mask_idx == mask.size();
    return result;
}

MaskResult MaskMatcher::match(
    std::string_view value,
    const MaskFn& mask_fn,
    const MaskOptions& options) {

    const Mask mask = mask_fn ? mask_fn(value) : Mask{};
    return match(value, mask, options);
}

} // namespace reskfmt
