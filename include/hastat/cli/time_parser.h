#pragma once

#include <hastat/core/types.h>
#include <chrono>
#include <optional>
#include <string>

namespace hastat::cli {

/**
 * @brief Parse and format the time arguments of list/export
 *
 * The recorder stores seconds since the epoch in UTC; every calendar form here is read and
 * written as UTC.
 */
class TimeParser {
public:
    /**
     * @brief Parse a time string into a time_point
     *
     * Supported formats:
     * - ISO 8601: "2024-01-01T00:00:00Z", "2024-01-01 10:00:00", "2024-01-01"
     * - Relative: "7d" (7 days ago), "1w", "1m" (30 days), "1y" (365 days), "24h"
     * - Unix timestamp: "1704067200", or milliseconds when longer than 11 digits
     * - Natural: "now", "today", "yesterday", "last-week", "last-month"
     */
    static Result<std::chrono::system_clock::time_point> parse(const std::string& timeStr);

    /**
     * @brief parse() as seconds since the epoch, the unit of start_ts
     */
    static Result<double> parseEpochSeconds(const std::string& timeStr);

    static std::optional<std::chrono::system_clock::time_point>
    parseRelative(const std::string& relativeStr);

    static std::optional<std::chrono::system_clock::time_point>
    parseISO8601(const std::string& isoStr);

    static std::optional<std::chrono::system_clock::time_point>
    parseUnixTimestamp(const std::string& timestampStr);

    static std::optional<std::chrono::system_clock::time_point>
    parseNatural(const std::string& naturalStr);

    /**
     * @brief "YYYY-MM-DD HH:MM:SS" in UTC, fractional seconds dropped
     */
    static std::string formatTimestamp(double epochSeconds);

    static std::string formatISO8601(const std::chrono::system_clock::time_point& tp);

    /// 00:00:00 UTC of the same day
    static std::chrono::system_clock::time_point
    startOfDay(const std::chrono::system_clock::time_point& tp);
};

} // namespace hastat::cli
