#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "currency/currency_formatter.hpp"
#include "currency/session_defaults.hpp"
#include "format/json_output.hpp"
#include "format/value_formatter.hpp"
#include "mask/mask_compiler.hpp"
#include "mask/mask_matcher.hpp"
#include "mask/phone_mask.hpp"
#include "numeric/numeric_normalizer.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace reskfmt;

namespace {

constexpr const char* kUsage =
    "Usage: reskfmt [--config FILE] [--log-level LEVEL] <command> [args...]\n"
    "\n"
    "Commands:\n"
    "  number VALUE [DIGITS]            Group and render a number\n"
    "  money VALUE [SYMBOL]             Render a currency amount\n"
    "  unformat VALUE                   Recover a number from formatted text\n"
    "  fixed VALUE DIGITS               Round to a fixed number of digits\n"
    "  abbreviate VALUE                 Abbreviate with K/M/B/T\n"
    "  format VALUE TYPE [FORMAT]       Type-aware field formatting\n"
    "  mask-number VALUE                Apply the grouped number mask\n"
    "  mask-date VALUE [SEP]            Apply the DD/MM/YYYY mask\n"
    "  mask-format VALUE FORMAT         Apply a date/time format mask (e.g. YYYY-MM-DD)\n"
    "  mask-card VALUE                  Apply the credit card mask\n"
    "  mask-phone VALUE [COUNTRY|+EXAMPLE]  Apply a phone mask\n";

int usage_error(const std::string& message) {
    if (!message.empty()) std::cerr << "reskfmt: " << message << "\n\n";
    std::cerr << kUsage;
    return 2;
}

std::optional<uint32_t> parse_digits(const std::string& text) {
    const int64_t digits = utils::parse_int<int64_t>(text, -1);
    if (digits < 0 || digits > ConfigLoader::kMaxDecimalDigits) return std::nullopt;
    return static_cast<uint32_t>(digits);
}

struct CliContext {
    ReskConfig config;
    SessionDefaults& session;
    std::vector<std::string> args;     // Command arguments, command name excluded
};

int run_command(const std::string& command, const CliContext& ctx) {
    const auto& args = ctx.args;
    const CurrencyFormatter currency(ctx.session);
    const MaskOptions mask_options = ctx.config.mask.mask_options();
    nlohmann::json out;

    if (command == "number") {
        if (args.empty()) return usage_error("number requires VALUE");
        if (args.size() > 1) {
            const auto digits = parse_digits(args[1]);
            if (!digits) return usage_error(std::format("invalid DIGITS '{}'", args[1]));
            out["result"] = currency.format_number(args[0], *digits);
        } else {
            out["result"] = currency.format_number(args[0]);
        }
    } else if (command == "money") {
        if (args.empty()) return usage_error("money requires VALUE");
        CurrencyOptionsOverride overrides;
        if (args.size() > 1) overrides.symbol = args[1];
        out = currency.format_money_as_object(args[0], overrides);
    } else if (command == "unformat") {
        if (args.empty()) return usage_error("unformat requires VALUE");
        out["value"] = currency.unformat(args[0]);
    } else if (command == "fixed") {
        if (args.size() < 2) return usage_error("fixed requires VALUE and DIGITS");
        const auto digits = parse_digits(args[1]);
        if (!digits) return usage_error(std::format("invalid DIGITS '{}'", args[1]));
        out["result"] = NumericNormalizer::to_fixed(args[0], *digits);
    } else if (command == "abbreviate") {
        if (args.empty()) return usage_error("abbreviate requires VALUE");
        out = currency.abbreviate_number(args[0]);
    } else if (command == "format") {
        if (args.size() < 2) return usage_error("format requires VALUE and TYPE");
        FormatOptions options;
        options.value = args[0];
        options.type = args[1];
        if (args.size() > 2) options.format = args[2];
        out = ValueFormatter(ctx.session).format_to_object(options);
    } else if (command == "mask-number") {
        if (args.empty()) return usage_error("mask-number requires VALUE");
        out = MaskMatcher::match(args[0], MaskCompiler::compile_number_mask(), mask_options);
    } else if (command == "mask-date") {
        if (args.empty()) return usage_error("mask-date requires VALUE");
        const char separator = args.size() > 1 && args[1].size() == 1 ? args[1][0] : '/';
        auto options = mask_options;
        options.validate = [](const std::string& unmasked) {
            return MaskCompiler::is_valid_date_digits(unmasked);
        };
        out = MaskMatcher::match(args[0], MaskCompiler::compile_date_mask(separator), options);
    } else if (command == "mask-format") {
        if (args.size() < 2) return usage_error("mask-format requires VALUE and FORMAT");
        const auto compiled = MaskCompiler::compile_date_format_mask(args[1]);
        auto options = mask_options;
        options.validate = compiled.validate;
        out = MaskMatcher::match(args[0], compiled.mask, options);
    } else if (command == "mask-card") {
        if (args.empty()) return usage_error("mask-card requires VALUE");
        const auto compiled = MaskCompiler::credit_card();
        auto options = mask_options;
        options.validate = compiled.validate;
        out = MaskMatcher::match(args[0], compiled.mask, options);
    } else if (command == "mask-phone") {
        if (args.empty()) return usage_error("mask-phone requires VALUE");
        const std::string country = args.size() > 1 ? args[1] : ctx.config.phone.default_country;
        if (country.empty()) return usage_error("mask-phone requires COUNTRY or phone.default_country");
        const auto phone = PhoneMaskCompiler::compile(country);
        out = phone.format(args[0], mask_options);
        out["country_code"] = phone.country_code;
        out["dial_code"] = phone.dial_code;
    } else {
        return usage_error(std::format("unknown command '{}'", command));
    }

    std::cout << out.dump(2) << '\n';
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file;
        std::string log_level;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" || arg == "--log-level") {
                if (i + 1 >= argc) return usage_error(std::format("{} requires a value", arg));
                (arg == "--config" ? config_file : log_level) = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                std::cout << kUsage;
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
        if (positional.empty()) return usage_error("");

        CliContext ctx{ReskConfig{}, SessionDefaults::global(), {}};

        if (!config_file.empty()) {
            auto result = ConfigLoader::load_from_file(config_file);
            if (!result.success) {
                utils::log::error(result.error_message);
                return 1;
            }
            ctx.config = std::move(result.config);
            utils::log::debug(std::format("Config loaded from {}", config_file));
        }
        ctx.config.apply(ctx.session);

        if (!log_level.empty()) {
            const auto level = utils::log::parse_level(log_level);
            if (!level) return usage_error(std::format("unknown log level '{}'", log_level));
            utils::log::set_level(*level);
        }

        ctx.args.assign(positional.begin() + 1, positional.end());
        return run_command(positional.front(), ctx);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
