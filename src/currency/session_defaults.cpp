#include "currency/session_defaults.hpp"
#include "currency/currency_table.hpp"
#include "core/utils.hpp"

#include <format>

namespace reskfmt {

SessionDefaults::SessionDefaults()
    : SessionDefaults(CurrencyOptions{}) {}

SessionDefaults::SessionDefaults(CurrencyOptions currency)
    : state_(std::make_shared<const Snapshot>(Snapshot{std::move(currency), ""})) {}

SessionDefaults& SessionDefaults::global() {
    static SessionDefaults instance;
    return instance;
}

void SessionDefaults::store(Snapshot snapshot) {
    state_.store(std::make_shared<const Snapshot>(std::move(snapshot)));
}

CurrencyOptions SessionDefaults::get_currency() const {
    const auto snapshot = state_.load();
    CurrencyOptions currency = snapshot->currency;
    if (snapshot->format_override.find("%v") != std::string::npos) {
        currency.format = snapshot->format_override;
    }
    return currency;
}

void SessionDefaults::set_currency(CurrencyOptions currency) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    const auto current = state_.load();
    utils::log::debug(std::format("Session currency: symbol='{}' digits={} format='{}'",
        currency.symbol, currency.decimal_digits, currency.format));
    store({std::move(currency), current->format_override});
}

bool SessionDefaults::set_currency_code(std::string_view code) {
    const auto info = CurrencyTable::find(code);
    if (!info) {
        utils::log::warn(std::format("Unknown currency code '{}', session unchanged", code));
        return false;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    const auto current = state_.load();
    Snapshot next = *current;
    next.currency.symbol = std::string(info->symbol);
    next.currency.decimal_digits = info->decimal_digits;
    utils::log::debug(std::format("Session currency set to {}", info->code));
    store(std::move(next));
    return true;
}

void SessionDefaults::set_format(std::string_view format) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    const auto current = state_.load();
    Snapshot next = *current;
    next.format_override = utils::trim(format);
    store(std::move(next));
}

std::string SessionDefaults::get_format(bool force) const {
    const auto snapshot = state_.load();
    if (snapshot->format_override.find("%v") != std::string::npos) {
        return snapshot->format_override;
    }
    return force ? std::string(kDefaultFormat) : std::string();
}

void SessionDefaults::reset() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    store({CurrencyOptions{}, ""});
}

} // namespace reskfmt
