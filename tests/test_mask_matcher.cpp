#include <catch2/catch_test_macros.hpp>
#include "mask/mask_matcher.hpp"

using namespace reskfmt;

namespace {

// "(###) ###-####"
Mask us_phone_mask() {
    Mask mask;
    append_literals(mask, "(");
    for (int i = 0; i < 3; ++i) mask.push_back(digit_token());
    append_literals(mask, ") ");
    for (int i = 0; i < 3; ++i) mask.push_back(digit_token());
    append_literals(mask, "-");
    for (int i = 0; i < 4; ++i) mask.push_back(digit_token());
    return mask;
}

} // anonymous namespace

TEST_CASE("MaskMatcher passthrough", "[mask][matcher]") {

    SECTION("Empty mask returns the value unchanged") {
        auto r = MaskMatcher::match("abc123", Mask{});
        CHECK(r.masked == "abc123");
        CHECK(r.unmasked == "abc123");
        CHECK(r.obfuscated == "abc123");
        CHECK(r.is_valid);
    }

    SECTION("Empty value is valid and keeps the placeholder") {
        auto r = MaskMatcher::match("", us_phone_mask());
        CHECK(r.masked.empty());
        CHECK(r.unmasked.empty());
        CHECK(r.is_valid);
        CHECK(r.placeholder == "(___) ___-____");
    }
}

TEST_CASE("MaskMatcher literal and pattern handling", "[mask][matcher]") {

    SECTION("Literals are inserted without consuming digits") {
        auto r = MaskMatcher::match("2124567890", us_phone_mask());
        CHECK(r.masked == "(212) 456-7890");
        CHECK(r.unmasked == "2124567890");
        CHECK(r.obfuscated == "(212) 456-7890");
        CHECK(r.placeholder == "(___) ___-____");
        CHECK(r.is_valid);
    }

    SECTION("Typed literals are consumed") {
        auto r = MaskMatcher::match("(212) 456-7890", us_phone_mask());
        CHECK(r.masked == "(212) 456-7890");
        CHECK(r.unmasked == "2124567890");
        CHECK(r.is_valid);
    }

    SECTION("Two-digit area code mask shifts the remaining digits") {
        Mask mask;
        append_literals(mask, "(");
        mask.push_back(digit_token());
        mask.push_back(digit_token());
        append_literals(mask, ") ");
        for (int i = 0; i < 3; ++i) mask.push_back(digit_token());
        append_literals(mask, "-");
        for (int i = 0; i < 4; ++i) mask.push_back(digit_token());

        auto r = MaskMatcher::match("2124567890", mask);
        CHECK(r.masked == "(21) 245-6789");
        CHECK(r.unmasked == "212456789");
        CHECK(r.placeholder == "(__) ___-____");
        CHECK(r.is_valid);
    }

    SECTION("Rejected characters are consumed and dropped") {
        auto r = MaskMatcher::match("1a2b3", Mask(3, digit_token()));
        CHECK(r.masked == "123");
        CHECK(r.unmasked == "123");
        CHECK(r.is_valid);
    }

    SECTION("Partial input is not valid") {
        auto r = MaskMatcher::match("212", us_phone_mask());
        CHECK(r.masked == "(212");
        CHECK(r.unmasked == "212");
        CHECK_FALSE(r.is_valid);
    }

    SECTION("Letter classes") {
        Mask mask = {MaskToken::pattern(CharClass::letter()), MaskToken::pattern(CharClass::letter()),
                     MaskToken::lit('-'), digit_token()};
        auto r = MaskMatcher::match("ab7", mask);
        CHECK(r.masked == "ab-7");
        CHECK(r.unmasked == "ab7");
        CHECK(r.is_valid);
    }
}

TEST_CASE("MaskMatcher auto complete", "[mask][matcher]") {

    SECTION("Trailing literals are appended when enabled") {
        MaskOptions options;
        options.auto_complete = true;
        auto r = MaskMatcher::match("212", us_phone_mask(), options);
        CHECK(r.masked == "(212) ");
        CHECK(r.obfuscated == "(212) ");
        CHECK(r.unmasked == "212");
    }

    SECTION("Trailing literals never reach the unmasked value") {
        Mask mask = {digit_token(), digit_token(), MaskToken::lit('%')};
        MaskOptions options;
        options.auto_complete = true;
        auto r = MaskMatcher::match("12", mask, options);
        CHECK(r.masked == "12%");
        CHECK(r.unmasked == "12");
        CHECK(r.is_valid);
    }

    SECTION("Disabled by default") {
        Mask mask = {digit_token(), digit_token(), MaskToken::lit('%')};
        auto r = MaskMatcher::match("12", mask);
        CHECK(r.masked == "12");
        CHECK_FALSE(r.is_valid);
    }
}

TEST_CASE("MaskMatcher obfuscation", "[mask][matcher]") {

    Mask mask = {digit_token(), MaskToken::obfuscated(CharClass::digit()),
                 MaskToken::obfuscated(CharClass::digit(), '#'), digit_token()};

    SECTION("Obfuscated positions use the marker or the option character") {
        auto r = MaskMatcher::match("1234", mask);
        CHECK(r.masked == "1234");
        CHECK(r.unmasked == "1234");
        CHECK(r.obfuscated == "1*#4");
        CHECK(r.has_obfuscation);
    }

    SECTION("Custom obfuscation character") {
        MaskOptions options;
        options.obfuscation_character = 'x';
        auto r = MaskMatcher::match("1234", mask, options);
        CHECK(r.obfuscated == "1x#4");
    }

    SECTION("Plain masks report no obfuscation") {
        CHECK_FALSE(MaskMatcher::has_obfuscation(us_phone_mask()));
    }
}

TEST_CASE("MaskMatcher validation and placeholders", "[mask][matcher]") {

    SECTION("A validator replaces the completion rule") {
        MaskOptions options;
        options.validate = [](const std::string& unmasked) { return unmasked.size() >= 3; };
        auto r = MaskMatcher::match("212", us_phone_mask(), options);
        CHECK(r.is_valid);

        auto short_input = MaskMatcher::match("21", us_phone_mask(), options);
        CHECK_FALSE(short_input.is_valid);
    }

    SECTION("Token placeholders take precedence over the blank character") {
        Mask mask = {digit_token('D'), digit_token('D'), MaskToken::lit('/'), digit_token()};
        CHECK(MaskMatcher::placeholder(mask) == "DD/_");
        CHECK(MaskMatcher::placeholder(mask, '#') == "DD/#");
    }

    SECTION("Mask functions are evaluated against the raw value") {
        MaskFn fn = [](std::string_view raw) { return Mask(raw.size(), digit_token()); };
        auto r = MaskMatcher::match("4567", fn);
        CHECK(r.masked == "4567");
        CHECK(r.mask.size() == 4);
        CHECK(r.is_valid);
    }
}
