#include <catch2/catch_test_macros.hpp>
#include "format/json_output.hpp"
#include "mask/mask_compiler.hpp"
#include "mask/mask_matcher.hpp"

using namespace reskfmt;

TEST_CASE("JsonOutput mask results", "[format][json]") {

    SECTION("Token sequence is serialized in mask order") {
        const auto card = MaskCompiler::credit_card();
        const nlohmann::json j = MaskMatcher::match("4111111111111111", card.mask);

        REQUIRE(j["mask"].is_array());
        REQUIRE(j["mask"].size() == card.mask.size());
        CHECK(j["mask"][0]["kind"] == "pattern");
        CHECK(j["mask"][4]["kind"] == "literal");
        CHECK(j["mask"][4]["literal"] == " ");
        CHECK(j["mask"][5]["kind"] == "obfuscated_pattern");
        CHECK(j["has_obfuscation"] == true);
        CHECK(j["obfuscated"] == "4111 **** **** 1111");
    }

    SECTION("Token placeholders and markers appear only when set") {
        Mask mask;
        mask.push_back(digit_token('Y'));
        mask.push_back(MaskToken::obfuscated(CharClass::digit(), '#'));
        const nlohmann::json j = MaskMatcher::match("12", mask);

        CHECK(j["mask"][0]["placeholder"] == "Y");
        CHECK_FALSE(j["mask"][0].contains("marker"));
        CHECK(j["mask"][1]["marker"] == "#");
        CHECK_FALSE(j["mask"][1].contains("placeholder"));
        CHECK(j["obfuscated"] == "1#");
    }

    SECTION("Empty mask serializes as an empty array") {
        const nlohmann::json j = MaskMatcher::match("abc", Mask{});
        CHECK(j["mask"].empty());
        CHECK(j["masked"] == "abc");
    }
}

TEST_CASE("JsonOutput money and abbreviation", "[format][json]") {
    SessionDefaults session(CurrencyOptions{"$", 2, ",", ".", "%v %s"});
    CurrencyFormatter fmt(session);

    const nlohmann::json money = fmt.format_money_as_object(1234.5);
    CHECK(money["result"] == "1,234.50 $");
    CHECK(money["options"]["decimal_digits"] == 2);

    const nlohmann::json abbr = fmt.abbreviate_number(1500);
    CHECK(abbr["result"] == "1.5K");
    CHECK(abbr["suffix"] == "K");
}
