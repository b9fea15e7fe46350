#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace querywatch::utils {

// ============================================================================
// UUID Generation
// ============================================================================

inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    // RFC 4122 version 4 / variant 1 bits
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a time point as "YYYY-MM-DD<sep>HH:MM:SS.fff" (UTC)
 */
inline std::string format_datetime(const std::chrono::system_clock::time_point& tp, char separator) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs);
    const auto time = std::chrono::system_clock::to_time_t(secs);

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    return std::format("{:04d}-{:02d}-{:02d}{}{:02d}:{:02d}:{:02d}.{:03d}",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday, separator,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));
}

/**
 * @brief Format a time point as UTC ISO-8601 with milliseconds
 * e.g. 2024-05-01T12:30:45.123Z
 */
inline std::string format_iso8601_utc(const std::chrono::system_clock::time_point& tp) {
    return format_datetime(tp, 'T') + 'Z';
}

/// UTC offset as "+HH:MM" / "-HH:MM"
inline std::string format_utc_offset(std::chrono::minutes offset) {
    const auto total = offset.count();
    const auto abs_total = total < 0 ? -total : total;
    return std::format("{}{:02d}:{:02d}", total < 0 ? '-' : '+',
                       static_cast<int>(abs_total / 60), static_cast<int>(abs_total % 60));
}

/// Duration as "[-]HH:MM:SS.fff" with days folded into hours
inline std::string format_time_span(std::chrono::microseconds span) {
    const bool negative = span.count() < 0;
    const auto abs_us = negative ? -span.count() : span.count();
    const auto total_ms = abs_us / 1000;
    const auto hours = total_ms / 3'600'000;
    const auto minutes = (total_ms / 60'000) % 60;
    const auto seconds = (total_ms / 1000) % 60;
    const auto millis = total_ms % 1000;
    return std::format("{}{:02d}:{:02d}:{:02d}.{:03d}", negative ? "-" : "",
                       hours, minutes, seconds, millis);
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
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

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
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

/// Truncate for log output, appending "..." when cut
[[nodiscard]] inline std::string truncate_for_log(std::string_view text, size_t max_length) {
    if (text.size() <= max_length) return std::string(text);
    std::string out(text.substr(0, max_length));
    out += "...";
    return out;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::microseconds elapsed_us() const {
        return elapsed<std::chrono::microseconds>();
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

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
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return static_cast<Level>(detail::min_level().load(std::memory_order_relaxed));
}

[[nodiscard]] inline bool enabled(Level lvl) {
    return static_cast<int>(lvl) >= detail::min_level().load(std::memory_order_relaxed);
}

/// Parse "debug" / "info" / "warn" / "error" (case-insensitive)
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
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

} // namespace querywatch::utils
