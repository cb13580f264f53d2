#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <hastat/cli/time_parser.h>
#include <hastat/common/number_format.h>

namespace hastat::cli {

namespace {

std::chrono::system_clock::time_point fromUtc(std::tm& tm) {
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

bool atEnd(std::istringstream& ss) {
    return ss.peek() == std::char_traits<char>::eof();
}

} // namespace

Result<std::chrono::system_clock::time_point> TimeParser::parse(const std::string& timeStr) {
    if (timeStr.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty time string"};
    }

    // Relative first; "1m" must not be mistaken for anything else
    if (auto tp = parseRelative(timeStr)) {
        return tp.value();
    }
    if (auto tp = parseNatural(timeStr)) {
        return tp.value();
    }
    if (auto tp = parseISO8601(timeStr)) {
        return tp.value();
    }
    if (auto tp = parseUnixTimestamp(timeStr)) {
        return tp.value();
    }

    return Error{ErrorCode::InvalidArgument,
                 "Invalid time '" + timeStr +
                     "'. Supported formats: ISO 8601 (2024-01-01, 2024-01-01T10:00:00), "
                     "relative (7d, 24h), Unix timestamp, or natural (today, yesterday)"};
}

Result<double> TimeParser::parseEpochSeconds(const std::string& timeStr) {
    auto tp = parse(timeStr);
    if (!tp) {
        return tp.error();
    }
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.value().time_since_epoch());
    return static_cast<double>(ms.count()) / 1000.0;
}

std::optional<std::chrono::system_clock::time_point>
TimeParser::parseRelative(const std::string& relativeStr) {
    static const std::regex relativeRegex(R"(^(\d+)([hdwmy])$)", std::regex_constants::icase);

    std::smatch match;
    if (!std::regex_match(relativeStr, match, relativeRegex)) {
        return std::nullopt;
    }

    auto value = common::parseInteger(match[1].str());
    if (!value) {
        return std::nullopt;
    }
    char unit = static_cast<char>(std::tolower(match[2].str()[0]));
    auto now = std::chrono::system_clock::now();

    switch (unit) {
        case 'h':
            return now - std::chrono::hours(*value);
        case 'd':
            return now - std::chrono::hours(*value * 24);
        case 'w':
            return now - std::chrono::hours(*value * 24 * 7);
        case 'm': // 30 days
            return now - std::chrono::hours(*value * 24 * 30);
        case 'y': // 365 days
            return now - std::chrono::hours(*value * 24 * 365);
        default:
            return std::nullopt;
    }
}

std::optional<std::chrono::system_clock::time_point>
TimeParser::parseISO8601(const std::string& isoStr) {
    for (const char* format : {"%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S"}) {
        std::tm tm = {};
        std::istringstream ss(isoStr);
        ss >> std::get_time(&tm, format);
        if (ss.fail()) {
            continue;
        }

        std::string tz;
        ss >> tz;
        auto tp = fromUtc(tm);
        if (tz.empty() || tz == "Z") {
            return tp;
        }
        if (tz.size() >= 3 && (tz[0] == '+' || tz[0] == '-')) {
            int sign = (tz[0] == '+') ? 1 : -1;
            auto hours = common::parseInteger(tz.substr(1, 2));
            std::optional<int64_t> minutes = int64_t{0};
            if (tz.size() >= 6 && tz[3] == ':') {
                minutes = common::parseInteger(tz.substr(4, 2));
            }
            if (!hours || !minutes) {
                return std::nullopt;
            }
            auto offset = std::chrono::hours(*hours) + std::chrono::minutes(*minutes);
            return tp - sign * offset;
        }
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream ss(isoStr);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (!ss.fail() && atEnd(ss)) {
        return fromUtc(tm);
    }
    return std::nullopt;
}

std::optional<std::chrono::system_clock::time_point>
TimeParser::parseUnixTimestamp(const std::string& timestampStr) {
    if (timestampStr.empty() ||
        !std::all_of(timestampStr.begin(), timestampStr.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    auto timestamp = common::parseInteger(timestampStr);
    if (!timestamp) {
        return std::nullopt;
    }

    // Seconds are 10 digits until 2286; longer values are milliseconds
    if (timestampStr.length() > 11) {
        return std::chrono::system_clock::time_point(std::chrono::milliseconds(*timestamp));
    }
    return std::chrono::system_clock::time_point(std::chrono::seconds(*timestamp));
}

std::optional<std::chrono::system_clock::time_point>
TimeParser::parseNatural(const std::string& naturalStr) {
    std::string lower = naturalStr;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto now = std::chrono::system_clock::now();
    auto today = startOfDay(now);

    if (lower == "now") {
        return now;
    } else if (lower == "today") {
        return today;
    } else if (lower == "yesterday") {
        return today - std::chrono::hours(24);
    } else if (lower == "last-week" || lower == "last_week" || lower == "lastweek") {
        return now - std::chrono::hours(24 * 7);
    } else if (lower == "last-month" || lower == "last_month" || lower == "lastmonth") {
        return now - std::chrono::hours(24 * 30);
    }
    return std::nullopt;
}

std::string TimeParser::formatTimestamp(double epochSeconds) {
    return common::formatUtcTimestamp(epochSeconds);
}

std::string TimeParser::formatISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::chrono::system_clock::time_point
TimeParser::startOfDay(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&time_t, &tm);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return fromUtc(tm);
}

} // namespace hastat::cli
