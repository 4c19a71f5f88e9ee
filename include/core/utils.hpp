#pragma once

#include <string>
#include <string_view>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <sstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace tpccgw::utils {

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Render a time point as ISO-8601 in UTC with millisecond precision
 *
 * Output shape: "2024-05-01T12:30:00.123+00:00". This is the single
 * timestamp shape that leaves the core.
 */
inline std::string format_iso8601_utc(const std::chrono::system_clock::time_point& tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds(1000);

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}+00:00", time_buf, static_cast<int>(ms.count()));
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/// Milliseconds since the Unix epoch (used for session identifiers)
inline int64_t epoch_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// Numeric Parsing (std::from_chars)
// ============================================================================

// Parse integer from string_view, returns default_val on failure
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline T parse_int(std::string_view sv, T default_val = T{}) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    return (ec == std::errc{}) ? result : default_val;
}

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// Parse floating point (NUMERIC text from the backend included)
[[nodiscard]] inline std::optional<double> try_parse_double(std::string_view sv) {
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    double result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return std::string(str.substr(start, end - start + 1));
}

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::microseconds elapsed_us() const {
        return elapsed<std::chrono::microseconds>();
    }

    /// Elapsed wall time in fractional milliseconds (report fields)
    double elapsed_ms_f() const {
        return static_cast<double>(elapsed_us().count()) / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (stderr, serialized writes)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline Level& min_level() {
        static Level level = Level::INFO;
        return level;
    }

    inline const char* level_tag(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::WARN:  return "WARN ";
            case Level::ERROR: return "ERROR";
            default:           return "INFO ";
        }
    }

    /// One line per message: UTC timestamp, level tag, text
    inline void write(Level level, const std::string& msg) {
        if (level < min_level()) return;
        const auto line = std::format("{} [{}] {}\n", format_iso8601_utc(now()), level_tag(level), msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << line;
    }
} // namespace detail

inline void set_level(Level level) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    detail::min_level() = level;
}

/// Parse "debug" / "info" / "warn" / "error"; unknown names map to INFO
[[nodiscard]] inline Level parse_level(std::string_view name) {
    if (iequals(name, "debug")) return Level::DEBUG;
    if (iequals(name, "warn") || iequals(name, "warning")) return Level::WARN;
    if (iequals(name, "error")) return Level::ERROR;
    return Level::INFO;
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

} // namespace tpccgw::utils
