#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Sessionizer {

using Duration = std::chrono::microseconds;
using Days = std::chrono::duration<int32_t, std::ratio<86400>>;

// Event time: UTC wall clock, microsecond precision (same as PostgreSQL timestamp)
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Duration>;

// Calendar date (UTC), used for pdate and the business process date
using Date = std::chrono::time_point<std::chrono::system_clock, Days>;

/**
 * @brief Civil calendar conversions and canonical text forms.
 *
 * Parsers return std::nullopt on malformed input and never throw.
 */
namespace TimeUtil {

Date make_date(int year, unsigned month, unsigned day);

/**
 * @brief Calendar date a timestamp falls on (floor, also for pre-epoch values).
 */
Date to_date(Timestamp ts);

Timestamp start_of(Date d);

/**
 * @brief Parse YYYY-MM-DD.
 */
std::optional<Date> parse_date(std::string_view text);

/**
 * @brief Parse YYYY-MM-DD[ T]HH:MM:SS[.f{1,6}][Z].
 */
std::optional<Timestamp> parse_timestamp(std::string_view text);

/**
 * @brief Parse a duration: bare integer seconds, or integer with s/m/h/d suffix.
 */
std::optional<Duration> parse_duration(std::string_view text);

std::string format_date(Date d);

/**
 * @brief YYYY-MM-DD HH:MM:SS, plus .ffffff when the fraction is non-zero.
 */
std::string format_timestamp(Timestamp ts);

std::string format_duration(Duration d);

} // namespace TimeUtil

/**
 * @brief High-resolution timer and high-level timing utilities.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Elapsed milliseconds since construction, with sub-millisecond fraction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    TimePoint start_;
};

} // namespace Sessionizer
