#pragma once

#include "mask/mask_token.hpp"
#include <string>
#include <string_view>

namespace reskfmt {

/**
 * @brief Masked-text matching engine
 *
 * Consumes a raw input string against a mask in a single forward pass with two
 * independent cursors (mask index, value index). Produces:
 * - masked:     display string with literals inserted
 * - unmasked:   only the characters accepted by pattern tokens
 * - obfuscated: masked, with obfuscated pattern positions replaced
 * - placeholder and validity
 *
 * Pattern tokens always consume one input character; characters that do not
 * satisfy the class are skipped. Literals that do not match the current input
 * character are inserted without consuming input.
 *
 * Never throws: empty mask or empty value yields identity passthrough.
 */
class MaskMatcher {
public:
    /**
     * @brief Match a value against a static mask
     */
    [[nodiscard]] static MaskResult match(
        std::string_view value,
        const Mask& mask,
        const MaskOptions& options = {});

    /**
     * @brief Match a value against a mask generated from the value itself
     */
    [[nodiscard]] static MaskResult match(
        std::string_view value,
        const MaskFn& mask_fn,
        const MaskOptions& options = {});

    /**
     * @brief Literal positions keep their character, pattern positions become
     * the token placeholder (or `blank` when the token has none)
     */
    [[nodiscard]] static std::string placeholder(const Mask& mask, char blank = '_');

    [[nodiscard]] static bool has_obfuscation(const Mask& mask);
};

} // namespace reskfmt
