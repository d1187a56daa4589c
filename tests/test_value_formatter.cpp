#include <catch2/catch_test_macros.hpp>
#include "format/value_formatter.hpp"

using namespace reskfmt;

TEST_CASE("ValueFormatter numeric types", "[format][value]") {
    SessionDefaults session;
    ValueFormatter formatter(session);

    SECTION("Decimal text") {
        auto result = formatter.format_to_object({"123.45", "decimal", "", nullptr});
        CHECK(result.formatted_value == "123.45");
        CHECK(result.is_decimal_type);
        CHECK(result.decimal_value == 123.45);
        REQUIRE(std::holds_alternative<double>(result.parsed_value));
        CHECK(std::get<double>(result.parsed_value) == 123.45);
    }

    SECTION("Type names are case-insensitive") {
        CHECK(formatter.format({"123", "NUMBER", "", nullptr}) == "123");
        CHECK(formatter.format({"123", "Numeric", "", nullptr}) == "123");
    }

    SECTION("Empty values parse to zero") {
        auto result = formatter.format_to_object({"", "decimal", "", nullptr});
        CHECK(result.decimal_value == 0.0);
        CHECK(result.formatted_value == "0");
    }

    SECTION("Named formats") {
        CHECK(formatter.format({1234567, "number", "money", nullptr}) == "1 234 567 FCFA");
        CHECK(formatter.format({1234567, "number", "moneyUSD", nullptr}) == "1 234 567.00 $");
        CHECK(formatter.format({1500, "number", "abbreviate", nullptr}) == "1.5K");
        CHECK(formatter.format({1500, "number", "abbreviate-money", nullptr}) == "1.5K FCFA");
    }

    SECTION("Unknown named formats fall back to number formatting") {
        CHECK(formatter.format({1234567, "number", "moneyXYZ", nullptr}) == "1 234 567");
        CHECK(formatter.format({1234567, "number", "fancy", nullptr}) == "1 234 567");
    }
}

TEST_CASE("ValueFormatter other types", "[format][value]") {
    SessionDefaults session;
    ValueFormatter formatter(session);

    SECTION("Text passes through") {
        auto result = formatter.format_to_object({"hello", "text", "", nullptr});
        CHECK(result.formatted_value == "hello");
        CHECK_FALSE(result.is_decimal_type);
        CHECK(result.decimal_value == 0.0);
        REQUIRE(std::holds_alternative<std::string>(result.parsed_value));
        CHECK(std::get<std::string>(result.parsed_value) == "hello");
    }

    SECTION("Numbers are rendered as plain text") {
        CHECK(formatter.format({12.5, "text", "", nullptr}) == "12.5");
        CHECK(formatter.format({nullptr, "text", "", nullptr}).empty());
    }

    SECTION("Custom formatter takes precedence") {
        FormatOptions options;
        options.value = "123";
        options.type = "custom";
        options.format = "money";
        options.formatter = [](const FormatOptions& opts) { return opts.value.text() + " formatted"; };
        CHECK(formatter.format(options) == "123 formatted");
    }
}
