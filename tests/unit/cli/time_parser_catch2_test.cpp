#include <chrono>

#include <catch2/catch_test_macros.hpp>

#include <hastat/cli/time_parser.h>

using namespace hastat;
using namespace hastat::cli;
using namespace std::chrono;

namespace {
int64_t epochSeconds(const system_clock::time_point& tp) {
    return duration_cast<seconds>(tp.time_since_epoch()).count();
}
} // namespace

TEST_CASE("TimeParser: ISO 8601 is read as UTC", "[unit][cli][time]") {
    SECTION("Date only") {
        auto tp = TimeParser::parseISO8601("2024-01-01");
        REQUIRE(tp.has_value());
        CHECK(epochSeconds(*tp) == 1704067200);
    }

    SECTION("T separator with Z") {
        auto tp = TimeParser::parseISO8601("2024-01-03T11:00:00Z");
        REQUIRE(tp.has_value());
        CHECK(epochSeconds(*tp) == 1704279600);
    }

    SECTION("Space separator") {
        auto tp = TimeParser::parseISO8601("2024-01-03 11:00:00");
        REQUIRE(tp.has_value());
        CHECK(epochSeconds(*tp) == 1704279600);
    }

    SECTION("Explicit offset") {
        auto tp = TimeParser::parseISO8601("2024-01-03T13:00:00+02:00");
        REQUIRE(tp.has_value());
        CHECK(epochSeconds(*tp) == 1704279600);
    }

    SECTION("Garbage") {
        CHECK_FALSE(TimeParser::parseISO8601("yesterday-ish").has_value());
        CHECK_FALSE(TimeParser::parseISO8601("2024-01-01 junk").has_value());
    }
}

TEST_CASE("TimeParser: Unix timestamps", "[unit][cli][time]") {
    auto seconds = TimeParser::parseUnixTimestamp("1704067200");
    REQUIRE(seconds.has_value());
    CHECK(epochSeconds(*seconds) == 1704067200);

    auto millis = TimeParser::parseUnixTimestamp("1704067200500");
    REQUIRE(millis.has_value());
    CHECK(duration_cast<milliseconds>(millis->time_since_epoch()).count() == 1704067200500);

    CHECK_FALSE(TimeParser::parseUnixTimestamp("-5").has_value());
    CHECK_FALSE(TimeParser::parseUnixTimestamp("12.5").has_value());
}

TEST_CASE("TimeParser: relative and natural forms", "[unit][cli][time]") {
    auto now = system_clock::now();

    auto week = TimeParser::parseRelative("7d");
    REQUIRE(week.has_value());
    auto diff = duration_cast<hours>(now - *week).count();
    CHECK(diff >= 167);
    CHECK(diff <= 168);

    auto month = TimeParser::parseRelative("1M");
    REQUIRE(month.has_value());
    CHECK(duration_cast<hours>(now - *month).count() >= 24 * 30 - 1);

    CHECK_FALSE(TimeParser::parseRelative("7x").has_value());
    CHECK_FALSE(TimeParser::parseRelative("d7").has_value());

    auto today = TimeParser::parseNatural("Today");
    REQUIRE(today.has_value());
    CHECK(epochSeconds(*today) % 86400 == 0);

    auto yesterday = TimeParser::parseNatural("yesterday");
    REQUIRE(yesterday.has_value());
    CHECK(epochSeconds(*today) - epochSeconds(*yesterday) == 86400);

    CHECK_FALSE(TimeParser::parseNatural("someday").has_value());
}

TEST_CASE("TimeParser: parse dispatches and reports errors", "[unit][cli][time]") {
    auto iso = TimeParser::parseEpochSeconds("2024-01-01");
    REQUIRE(iso.has_value());
    CHECK(iso.value() == 1704067200.0);

    auto fromEpoch = TimeParser::parseEpochSeconds("1704279600");
    REQUIRE(fromEpoch.has_value());
    CHECK(fromEpoch.value() == 1704279600.0);

    auto bad = TimeParser::parse("not a time");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);

    auto empty = TimeParser::parse("");
    REQUIRE_FALSE(empty.has_value());
}

TEST_CASE("TimeParser: formatting", "[unit][cli][time]") {
    CHECK(TimeParser::formatTimestamp(1704279600.0) == "2024-01-03 11:00:00");
    CHECK(TimeParser::formatISO8601(system_clock::time_point(seconds(1704279600))) ==
          "2024-01-03T11:00:00Z");
    CHECK(epochSeconds(TimeParser::startOfDay(system_clock::time_point(seconds(1704279600)))) ==
          1704240000);
}
