#include <hastat/common/number_format.h>

#include <charconv>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <format>

namespace hastat::common {

std::optional<double> parseReal(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        // "+-1" is not a number
        if (!text.empty() && text.front() == '-')
            return std::nullopt;
    }
    if (text.empty())
        return std::nullopt;

    double value = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    if (!std::isfinite(value))
        return std::nullopt;
    return value;
}

std::optional<int64_t> parseInteger(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-')
            return std::nullopt;
    }
    if (text.empty())
        return std::nullopt;

    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return value;
}

std::string formatReal(double value) {
    std::string out = std::format("{}", value);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string sqlQuote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('\'');
    for (char c : text) {
        if (c == '\'')
            out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string formatUtcTimestamp(double epochSeconds) {
    std::time_t seconds = static_cast<std::time_t>(std::floor(epochSeconds));
    std::tm tm = {};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string formatThousands(int64_t value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3 + 1);

    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0)
            result.insert(0, 1, ',');
        result.insert(0, 1, *it);
        ++count;
    }
    if (value < 0)
        result.insert(0, 1, '-');
    return result;
}

} // namespace hastat::common
