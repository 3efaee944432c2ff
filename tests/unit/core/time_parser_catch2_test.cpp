// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <catch2/catch_test_macros.hpp>

#include <recall/core/time_parser.h>

#include "../../common/test_helpers_catch2.h"

using namespace recall;
using namespace recall::core;

TEST_CASE("TimeParser parses ISO dates and date-times", "[unit][core][time]") {
    auto d = TimeParser::parseDate("2026-02-01");
    REQUIRE(d.has_value());
    CHECK(d->year == 2026);
    CHECK(d->month == 2u);
    CHECK(d->day == 1u);

    auto dt = TimeParser::parseDate("2026-02-01T09:30:00");
    REQUIRE(dt.has_value());
    CHECK(*dt == *d);

    CHECK(TimeParser::parseDate("2026-02-01 09:30").has_value());
}

TEST_CASE("TimeParser rejects malformed dates", "[unit][core][time]") {
    CHECK_FALSE(TimeParser::parseDate("").has_value());
    CHECK_FALSE(TimeParser::parseDate("not-a-date").has_value());
    CHECK_FALSE(TimeParser::parseDate("2026-13-01").has_value());
    CHECK_FALSE(TimeParser::parseDate("2025-02-29").has_value());
    CHECK_FALSE(TimeParser::parseDate("2026-02-01X").has_value());
    CHECK(TimeParser::parseDate("2024-02-29").has_value());
}

TEST_CASE("TimeParser resolves natural words against a clock", "[unit][core][time]") {
    const auto now = test::local_time_point(2026, 3, 1);

    auto today = TimeParser::parseDateOrNatural("today", now);
    REQUIRE(today);
    CHECK(TimeParser::formatDate(today.value()) == "2026-03-01");

    auto yesterday = TimeParser::parseDateOrNatural("Yesterday", now);
    REQUIRE(yesterday);
    CHECK(TimeParser::formatDate(yesterday.value()) == "2026-02-28");

    auto bad = TimeParser::parseDateOrNatural("someday", now);
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("TimeParser counts calendar days", "[unit][core][time]") {
    const auto now = test::local_time_point(2026, 1, 10, 0);
    CHECK(TimeParser::daysSince(CivilDate{2026, 1, 10}, now) == 0);
    CHECK(TimeParser::daysSince(CivilDate{2026, 1, 1}, now) == 9);
    CHECK(TimeParser::daysSince(CivilDate{2025, 1, 10}, now) == 365);
    CHECK(TimeParser::daysSince(CivilDate{2026, 1, 12}, now) == -2);
    CHECK(TimeParser::daysFromCivil(CivilDate{1970, 1, 1}) == 0);
}

TEST_CASE("TimeParser formats local date-times without zone", "[unit][core][time]") {
    const auto tp = test::local_time_point(2026, 2, 1, 9);
    CHECK(TimeParser::formatLocalDateTime(tp) == "2026-02-01T09:00:00");
    CHECK(TimeParser::formatDate(tp) == "2026-02-01");
}
