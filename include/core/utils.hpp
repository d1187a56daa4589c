#pragma once

#include <string>
#include <string_view>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <system_error>
#include <type_traits>

namespace reskfmt::utils {

// ============================================================================
// Character Classification (locale-independent, ASCII only)
// ============================================================================

[[nodiscard]] inline constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] inline constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// ============================================================================
// Numeric Parsing (std::from_chars: no exceptions or locale)
// ============================================================================

// Parse integer from string_view, returns default_val on failure
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline T parse_int(std::string_view sv, T default_val = T{}) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    return (ec == std::errc{}) ? result : default_val;
}

/**
 * @brief Parse the longest leading floating-point prefix of a string.
 *
 * Mirrors the lenient "parse what you can" behaviour expected from user-typed
 * numbers: "12.5abc" yields 12.5, "abc" yields nullopt. A single leading '+'
 * is accepted. Out-of-range values are treated as failures.
 */
[[nodiscard]] inline std::optional<double> parse_double_prefix(std::string_view sv) {
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    double result{};
    const auto [ptr, ec] = std::from_chars(
        sv.data(), sv.data() + sv.size(), result, std::chars_format::general);
    if (ec != std::errc{}) return std::nullopt;
    return result;
}

// Parse a complete floating-point string (no trailing garbage)
[[nodiscard]] inline std::optional<double> parse_double_strict(std::string_view sv) {
    if (sv.empty()) return std::nullopt;
    if (sv.front() == '+') sv.remove_prefix(1);
    double result{};
    const auto [ptr, ec] = std::from_chars(
        sv.data(), sv.data() + sv.size(), result, std::chars_format::general);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return result;
}

inline std::string to_upper(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return result;
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r\f\v");
    return std::string(str.substr(start, end - start + 1));
}

// Replace the first occurrence of `from` (no-op when absent or empty)
inline std::string replace_first(std::string str, std::string_view from, std::string_view to) {
    if (from.empty()) return str;
    const auto pos = str.find(from);
    if (pos != std::string::npos) {
        str.replace(pos, from.size(), to);
    }
    return str;
}

inline std::string replace_all(std::string str, std::string_view from, std::string_view to) {
    if (from.empty()) return str;
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
    return str;
}

inline std::string digits_only(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (const char c : str) {
        if (is_digit(c)) result += c;
    }
    return result;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return detail::min_level().load(std::memory_order_relaxed);
}

// "debug" | "info" | "warn" | "warning" | "error" (case-insensitive)
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace reskfmt::utils
