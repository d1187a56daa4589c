#include <catch2/catch_test_macros.hpp>
#include "mask/phone_mask.hpp"

using namespace reskfmt;

TEST_CASE("PhoneMaskCompiler country templates", "[mask][phone]") {

    SECTION("US template") {
        auto phone = PhoneMaskCompiler::compile("US");
        CHECK(phone.country_code == "US");
        CHECK(phone.dial_code == "1");
        CHECK(phone.placeholder == "(___) ___-____");

        auto r = phone.format("2124567890");
        CHECK(r.masked == "(212) 456-7890");
        CHECK(r.unmasked == "2124567890");
        CHECK(r.is_valid);
    }

    SECTION("Country codes are case-insensitive") {
        CHECK(PhoneMaskCompiler::compile_for_country("fr").country_code == "FR");
    }

    SECTION("Digits glued to a closing parenthesis are separated") {
        auto r = PhoneMaskCompiler::compile("US").format("(212)4567890");
        CHECK(r.masked == "(212) 456-7890");
        CHECK(r.is_valid);
    }

    SECTION("Incomplete numbers are not valid") {
        auto r = PhoneMaskCompiler::compile("US").format("212456");
        CHECK(r.masked == "(212) 456");
        CHECK_FALSE(r.is_valid);
    }

    SECTION("Unknown country yields an empty mask that never validates") {
        auto phone = PhoneMaskCompiler::compile("ZZ");
        CHECK(phone.mask.empty());
        CHECK(phone.country_code.empty());
        CHECK_FALSE(phone.validate("2124567890"));
    }
}

TEST_CASE("PhoneMaskCompiler example numbers", "[mask][phone]") {

    SECTION("Dial code prefix with flat digits when the template does not fit") {
        auto phone = PhoneMaskCompiler::compile("+23769965076");
        CHECK(phone.country_code == "CM");
        CHECK(phone.dial_code == "237");
        CHECK(phone.placeholder == "+237 ________");

        auto r = phone.format("+23769965076");
        CHECK(r.masked == "+237 69965076");
        CHECK(r.unmasked == "69965076");
        CHECK(r.is_valid);
    }

    SECTION("Country template reused when the digit count matches") {
        auto phone = PhoneMaskCompiler::compile("+33612345678");
        CHECK(phone.country_code == "FR");
        CHECK(phone.placeholder == "+33 _ __ __ __ __");

        auto r = phone.format("+33612345678");
        CHECK(r.masked == "+33 6 12 34 56 78");
        CHECK(r.unmasked == "612345678");
        CHECK(r.is_valid);
    }

    SECTION("Example without a known dial code") {
        auto phone = PhoneMaskCompiler::compile("+999123");
        CHECK(phone.mask.empty());
        CHECK(phone.dial_code.empty());
    }
}

TEST_CASE("PhoneMaskCompiler helpers", "[mask][phone]") {

    SECTION("Longest dial code wins") {
        CHECK(PhoneMaskCompiler::extract_dial_code("+2348012345678") == "234");
        CHECK(PhoneMaskCompiler::extract_dial_code("+27 82 123 4567") == "27");
        CHECK(PhoneMaskCompiler::extract_dial_code("+1 212 456 7890") == "1");
    }

    SECTION("Numbers without '+' have no dial code") {
        CHECK(PhoneMaskCompiler::extract_dial_code("2124567890").empty());
    }

    SECTION("Cleaning removes whitespace only") {
        CHECK(PhoneMaskCompiler::clean_phone_number(" +1 (212) 456 ") == "+1(212)456");
    }

    SECTION("Sanitizing normalizes the gap after ')'") {
        CHECK(PhoneMaskCompiler::sanitize_phone_number("(212)456") == "(212) 456");
        CHECK(PhoneMaskCompiler::sanitize_phone_number("(212)   456") == "(212) 456");
        CHECK(PhoneMaskCompiler::sanitize_phone_number("212-456") == "212-456");
    }

    SECTION("Country lookups") {
        auto by_dial = PhoneMaskCompiler::find_country_by_dial_code("237");
        REQUIRE(by_dial.has_value());
        CHECK(by_dial->iso_code == "CM");
        CHECK_FALSE(PhoneMaskCompiler::find_country("XX").has_value());
        CHECK_FALSE(PhoneMaskCompiler::countries().empty());
    }
}
