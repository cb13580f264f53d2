#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hastat::common {

/**
 * @brief Parse a finite floating point value; the whole string must be consumed
 *
 * Accepts the forms std::from_chars understands plus a leading '+'. "nan", "inf" and
 * trailing garbage are rejected.
 */
std::optional<double> parseReal(std::string_view text);

/**
 * @brief Parse a base-10 signed integer; the whole string must be consumed
 */
std::optional<int64_t> parseInteger(std::string_view text);

/**
 * @brief Shortest round-trip rendering that always reads back as a REAL literal
 *
 * 1704279600.0 -> "1704279600.0", 3198.37 -> "3198.37", 1e-07 -> "1e-07".
 */
std::string formatReal(double value);

/**
 * @brief Single-quoted SQL string literal with embedded quotes doubled
 */
std::string sqlQuote(std::string_view text);

/**
 * @brief "YYYY-MM-DD HH:MM:SS" in UTC, fractional seconds dropped
 */
std::string formatUtcTimestamp(double epochSeconds);

/**
 * @brief Thousands-separated integer ("1,234,567")
 */
std::string formatThousands(int64_t value);

} // namespace hastat::common
