#pragma once

#include "core/types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace reskfmt {

/**
 * @brief Fallback currency/number configuration consulted by the formatters
 *
 * Holds an immutable snapshot swapped atomically on every update, so
 * formatting threads read it without locking while a configuration call
 * replaces it (last write wins). Writers are serialized so a
 * read-modify-write such as set_format() cannot drop a concurrent update.
 *
 * A process-wide instance is available through global(); formatters can
 * also be built over an explicit instance.
 */
class SessionDefaults {
public:
    static constexpr std::string_view kDefaultFormat = "%v %s";

    SessionDefaults();
    explicit SessionDefaults(CurrencyOptions currency);

    SessionDefaults(const SessionDefaults&) = delete;
    SessionDefaults& operator=(const SessionDefaults&) = delete;

    [[nodiscard]] static SessionDefaults& global();

    /**
     * @brief Current currency options
     *
     * A persisted format (set_format) containing "%v" replaces the
     * currency's own format.
     */
    [[nodiscard]] CurrencyOptions get_currency() const;

    void set_currency(CurrencyOptions currency);

    /**
     * @brief Seed symbol and decimal digits from the built-in currency table
     * @return false (session unchanged) when the code is unknown
     */
    bool set_currency_code(std::string_view code);

    // Persist a format override; input is trimmed, empty clears the override
    void set_format(std::string_view format);

    /**
     * @brief Persisted format if it contains "%v"
     * @param force Fall back to kDefaultFormat instead of returning ""
     */
    [[nodiscard]] std::string get_format(bool force = true) const;

    // Restore built-in defaults and clear the format override
    void reset();

private:
    struct Snapshot {
        CurrencyOptions currency;
        std::string format_override;
    };

    void store(Snapshot snapshot);

    std::atomic<std::shared_ptr<const Snapshot>> state_;
    std::mutex write_mutex_;
};

} // namespace reskfmt
