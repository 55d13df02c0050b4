//
// Unit tests for timestamp parsing and formatting
//

#include <catch2/catch_test_macros.hpp>
#include <epoch_frame/datetime.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/core/timestamp.h>

using namespace epoch_monitor;
using namespace std::chrono;

TEST_CASE("Timestamp - Parsing", "[timestamp]") {
    const Timestamp midnight{sys_days{2024y / January / 15}};

    SECTION("Date only") {
        REQUIRE(ParseTimestamp("2024-01-15") == midnight);
    }

    SECTION("Date and time with T or space") {
        const auto expected = midnight + hours{13} + minutes{5} + seconds{9};
        REQUIRE(ParseTimestamp("2024-01-15T13:05:09") == expected);
        REQUIRE(ParseTimestamp("2024-01-15 13:05:09") == expected);
        REQUIRE(ParseTimestamp("2024-01-15T13:05:09Z") == expected);
        REQUIRE(ParseTimestamp("2024-01-15T13:05:09+00:00") == expected);
    }

    SECTION("Agrees with epoch_frame UTC date times") {
        const auto expected = epoch_frame::DateTime::from_str("2021-03-15 14:30:00", "UTC");
        const auto parsed = TimestampFromString("2021-03-15T14:30:00");
        REQUIRE(duration_cast<nanoseconds>(parsed.time_since_epoch()).count() ==
                expected.m_nanoseconds.count());
    }

    SECTION("Fractional seconds are truncated to microseconds") {
        REQUIRE(ParseTimestamp("2024-01-15T00:00:00.5") == midnight + microseconds{500000});
        REQUIRE(ParseTimestamp("2024-01-15T00:00:00.123456789") == midnight + microseconds{123456});
    }

    SECTION("Invalid input") {
        REQUIRE_FALSE(ParseTimestamp("").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-13-01").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-02-30").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-01-15T25:00:00").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-01-15T10:00").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-01-15T10:00:00.").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-01-15T10:00:00+02:00").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-01-15T10:00:00.12x").has_value());
        REQUIRE_FALSE(ParseTimestamp("2024-01-15X10:00:00").has_value());
        REQUIRE_THROWS_AS(TimestampFromString("yesterday"), ConfigurationError);
    }
}

TEST_CASE("Timestamp - ISO formatting", "[timestamp]") {
    const Timestamp ts = sys_days{2023y / March / 7} + hours{8} + minutes{30} + microseconds{42};
    REQUIRE(ToIsoString(ts) == "2023-03-07T08:30:00.000042");
    REQUIRE(TimestampFromString(ToIsoString(ts)) == ts);
}
