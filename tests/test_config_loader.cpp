#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "currency/session_defaults.hpp"
#include "core/utils.hpp"

#include <cstdlib>

using namespace reskfmt;

TEST_CASE("ConfigLoader: full config", "[config]") {
    const std::string toml = R"(
[logging]
level = "warn"

[currency]
symbol = "$"
decimal_digits = 2
thousand_separator = ","
decimal_separator = "."
format = "%s%v"

[mask]
obfuscation_character = "#"
placeholder_character = "-"
auto_complete = true

[phone]
default_country = "CM"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.warnings.empty());

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "warn");
    CHECK(cfg.phone.default_country == "CM");

    const auto currency = cfg.currency.resolve();
    CHECK(currency.symbol == "$");
    CHECK(currency.decimal_digits == 2);
    CHECK(currency.thousand_separator == ",");
    CHECK(currency.format == "%s%v");

    const auto mask = cfg.mask.mask_options();
    CHECK(mask.obfuscation_character == '#');
    CHECK(mask.placeholder_character == '-');
    CHECK(mask.auto_complete);
}

TEST_CASE("ConfigLoader: defaults for missing sections", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.currency.resolve().symbol == "FCFA");
    CHECK(result.config.mask.mask_options().obfuscation_character == '*');
    CHECK(result.config.phone.default_country.empty());
}

TEST_CASE("ConfigLoader: currency code seeds symbol and digits", "[config]") {

    SECTION("Code only") {
        auto result = ConfigLoader::load_from_string("[currency]\ncode = \"EUR\"\n");
        REQUIRE(result.success);
        const auto currency = result.config.currency.resolve();
        CHECK(currency.symbol == "€");
        CHECK(currency.decimal_digits == 2);
    }

    SECTION("Explicit keys win over the code") {
        auto result = ConfigLoader::load_from_string(
            "[currency]\ncode = \"EUR\"\nsymbol = \"EUR\"\ndecimal_digits = 3\n");
        REQUIRE(result.success);
        const auto currency = result.config.currency.resolve();
        CHECK(currency.symbol == "EUR");
        CHECK(currency.decimal_digits == 3);
    }
}

TEST_CASE("ConfigLoader: apply installs the currency", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "error"

[currency]
code = "USD"
thousand_separator = ","
)");
    REQUIRE(result.success);

    SessionDefaults session;
    result.config.apply(session);
    CHECK(session.get_currency().symbol == "$");
    CHECK(session.get_currency().thousand_separator == ",");
    CHECK(utils::log::level() == utils::log::Level::ERROR);

    utils::log::set_level(utils::log::Level::INFO);
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("RESKFMT_TEST_SYMBOL", "CHF", 1);
    auto result = ConfigLoader::load_from_string("[currency]\nsymbol = \"${RESKFMT_TEST_SYMBOL}\"\n");
    ::unsetenv("RESKFMT_TEST_SYMBOL");

    REQUIRE(result.success);
    CHECK(result.config.currency.resolve().symbol == "CHF");
}

TEST_CASE("ConfigValidation: invalid values fail", "[config][validation]") {

    SECTION("Unknown log level") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
    }

    SECTION("Decimal digits out of range") {
        auto result = ConfigLoader::load_from_string("[currency]\ndecimal_digits = 25\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("decimal_digits") != std::string::npos);

        auto negative = ConfigLoader::load_from_string("[currency]\ndecimal_digits = -1\n");
        CHECK_FALSE(negative.success);
    }

    SECTION("Format without a value placeholder") {
        auto result = ConfigLoader::load_from_string("[currency]\nformat = \"%s .##\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("currency.format") != std::string::npos);
    }

    SECTION("Unknown currency code") {
        auto result = ConfigLoader::load_from_string("[currency]\ncode = \"XYZ\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("currency.code") != std::string::npos);
    }

    SECTION("Mask characters must be single characters") {
        auto result = ConfigLoader::load_from_string("[mask]\nobfuscation_character = \"**\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("obfuscation_character") != std::string::npos);

        auto empty = ConfigLoader::load_from_string("[mask]\nplaceholder_character = \"\"\n");
        CHECK_FALSE(empty.success);
        CHECK(empty.error_message.find("placeholder_character") != std::string::npos);
    }

    SECTION("Unknown phone country") {
        auto result = ConfigLoader::load_from_string("[phone]\ndefault_country = \"ZZ\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("phone.default_country") != std::string::npos);
    }

    SECTION("Several errors are reported together") {
        auto result = ConfigLoader::load_from_string(
            "[logging]\nlevel = \"loud\"\n[phone]\ndefault_country = \"ZZ\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
        CHECK(result.error_message.find("phone.default_country") != std::string::npos);
    }
}

TEST_CASE("ConfigValidation: suspicious values warn", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(
        "[currency]\nthousand_separator = \".\"\ndecimal_separator = \".\"\n");
    REQUIRE(result.success);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].find("decimal_separator") != std::string::npos);
}

TEST_CASE("ConfigLoader: parse and file errors", "[config]") {

    SECTION("Malformed TOML") {
        auto result = ConfigLoader::load_from_string("[currency\nsymbol = \"$\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
    }

    SECTION("Missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/reskfmt.toml");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Failed to load config") != std::string::npos);
    }
}
