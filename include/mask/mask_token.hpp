#pragma once

#include <bitset>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace reskfmt {

// ============================================================================
// CharClass - closed set of accepted characters for a pattern token
// ============================================================================

class CharClass {
public:
    CharClass() = default;

    [[nodiscard]] static CharClass digit() { return range('0', '9'); }

    [[nodiscard]] static CharClass letter() {
        CharClass c = range('a', 'z');
        c.add_range('A', 'Z');
        return c;
    }

    [[nodiscard]] static CharClass range(char lo, char hi) {
        CharClass c;
        c.add_range(lo, hi);
        return c;
    }

    [[nodiscard]] static CharClass any_of(std::string_view chars) {
        CharClass c;
        for (const char ch : chars) c.add(ch);
        return c;
    }

    void add(char c) { bits_.set(static_cast<unsigned char>(c)); }

    void add_range(char lo, char hi) {
        for (unsigned v = static_cast<unsigned char>(lo); v <= static_cast<unsigned char>(hi); ++v) {
            bits_.set(v);
        }
    }

    [[nodiscard]] bool matches(char c) const { return bits_.test(static_cast<unsigned char>(c)); }
    [[nodiscard]] bool empty() const { return bits_.none(); }

    bool operator==(const CharClass&) const = default;

private:
    std::bitset<256> bits_;
};

// ============================================================================
// MaskToken - Literal | Pattern | ObfuscatedPattern
// ============================================================================

enum class MaskTokenKind {
    LITERAL,
    PATTERN,
    OBFUSCATED_PATTERN
};

/**
 * @brief One atomic unit of a mask.
 *
 * - LITERAL:            fixed character, inserted into masked/obfuscated output
 * - PATTERN:            one input character accepted by `char_class`
 * - OBFUSCATED_PATTERN: like PATTERN, rendered as `marker` (or the call-level
 *                       obfuscation character when marker is 0) in the
 *                       obfuscated view
 *
 * `placeholder` overrides the blank marker for this position when non-zero
 * (e.g. 'Y' for a year digit).
 */
struct MaskToken {
    MaskTokenKind kind = MaskTokenKind::LITERAL;
    char literal = '\0';
    CharClass char_class;
    char placeholder = '\0';
    char marker = '\0';

    [[nodiscard]] static MaskToken lit(char c) {
        MaskToken t;
        t.kind = MaskTokenKind::LITERAL;
        t.literal = c;
        return t;
    }

    [[nodiscard]] static MaskToken pattern(CharClass cls, char placeholder = '\0') {
        MaskToken t;
        t.kind = MaskTokenKind::PATTERN;
        t.char_class = std::move(cls);
        t.placeholder = placeholder;
        return t;
    }

    [[nodiscard]] static MaskToken obfuscated(CharClass cls, char marker = '\0', char placeholder = '\0') {
        MaskToken t;
        t.kind = MaskTokenKind::OBFUSCATED_PATTERN;
        t.char_class = std::move(cls);
        t.marker = marker;
        t.placeholder = placeholder;
        return t;
    }

    [[nodiscard]] bool is_literal() const { return kind == MaskTokenKind::LITERAL; }

    bool operator==(const MaskToken&) const = default;
};

using Mask = std::vector<MaskToken>;

// Append one literal token per character of `text`
inline void append_literals(Mask& mask, std::string_view text) {
    for (const char c : text) mask.push_back(MaskToken::lit(c));
}

// Shorthand for the common "one digit" token
[[nodiscard]] inline MaskToken digit_token(char placeholder = '\0') {
    return MaskToken::pattern(CharClass::digit(), placeholder);
}

// ============================================================================
// Match Options & Result
// ============================================================================

using Validator = std::function<bool(const std::string& unmasked)>;

// Produces a mask from the current raw value (numeric grouping, date narrowing, ...)
using MaskFn = std::function<Mask(std::string_view raw_value)>;

struct MaskOptions {
    char obfuscation_character = '*';
    char placeholder_character = '_';
    bool auto_complete = false;
    Validator validate;         // Optional; replaces the "mask fully consumed" rule
};

struct MaskResult {
    std::string masked;
    std::string unmasked;
    std::string obfuscated;
    Mask mask;
    bool has_obfuscation = false;
    std::string placeholder;
    bool is_valid = false;
};

// A mask paired with the validation rule of the format it encodes
struct MaskWithValidation {
    Mask mask;
    Validator validate;
};

} // namespace reskfmt
