#pragma once

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sysmlsql::utils {

// ============================================================================
// Numeric Parsing (std::from_chars)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
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

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// ============================================================================
// SQL Quoting
// ============================================================================

/**
 * @brief Wrap a string in the given delimiter, doubling embedded delimiters.
 */
[[nodiscard]] inline std::string quote_sql(std::string_view s, char delim) {
    std::string out;
    out.reserve(s.size() + 2);
    out += delim;
    for (const char c : s) {
        if (c == delim) out += delim;
        out += c;
    }
    out += delim;
    return out;
}

[[nodiscard]] inline std::string escape_sql_ident(std::string_view s) {
    return quote_sql(s, '"');
}

[[nodiscard]] inline std::string escape_sql_str_lit(std::string_view s) {
    return quote_sql(s, '\'');
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

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

[[nodiscard]] inline std::string format_duration(std::chrono::microseconds d) {
    const auto us = d.count();
    if (us < 1000) return std::format("{}µs", us);
    if (us < 1000 * 1000) return std::format("{:.2f}ms", static_cast<double>(us) / 1000.0);
    return std::format("{:.2f}s", static_cast<double>(us) / 1e6);
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

    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < threshold().load(std::memory_order_relaxed)) return;

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
    detail::threshold().store(level, std::memory_order_relaxed);
}

// "debug" | "info" | "warn" | "error"
[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const auto lower = to_lower(name);
    if (lower == "debug" || lower == "trace") return Level::DEBUG;
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

// ============================================================================
// Progress Reporting
// ============================================================================

/**
 * @brief Rate-limited progress line for long bulk passes.
 *
 * tick() logs at most once per interval; finish() always logs when rows > 0.
 */
class ProgressReporter {
public:
    explicit ProgressReporter(std::string row_kind,
                              std::chrono::seconds interval = std::chrono::seconds(5))
        : row_kind_(std::move(row_kind)), interval_(interval), next_report_(interval) {}

    void tick(uint64_t rows) {
        if (rows == 0 || timer_.elapsed<std::chrono::milliseconds>() < next_report_) return;
        report(rows);
        next_report_ += interval_;
    }

    void finish(uint64_t rows) const {
        if (rows != 0) report(rows);
    }

private:
    void report(uint64_t rows) const {
        const auto elapsed = timer_.elapsed<std::chrono::microseconds>();
        const double secs = static_cast<double>(elapsed.count()) / 1e6;
        const auto per_row = std::chrono::microseconds(
            elapsed.count() / static_cast<int64_t>(rows));
        log::info(std::format("processed {} {}s over {}, averaging {}/{} ({:.0f} {}s/s)",
            rows, row_kind_, format_duration(elapsed), format_duration(per_row), row_kind_,
            secs > 0 ? static_cast<double>(rows) / secs : 0.0, row_kind_));
    }

    std::string row_kind_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds next_report_;
    Timer timer_;
};

} // namespace sysmlsql::utils
