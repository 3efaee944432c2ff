// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace recall::core {

// Injectable wall clock
using ClockFn = std::function<TimePoint()>;

inline TimePoint systemNow() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Calendar date without a time zone, as stored in fact and note records.
 */
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    auto operator<=>(const CivilDate&) const = default;
};

/**
 * @brief Date helpers for the record formats used in the workspace.
 *
 * Dates are written as local calendar dates ("2026-02-01") or local ISO 8601
 * date-times ("2026-02-01T09:30:00"). Only the date part is significant when
 * computing ages.
 */
class TimeParser {
public:
    /**
     * @brief Parse the leading "YYYY-MM-DD" of a date or date-time string.
     *
     * Accepts a bare date, or a date followed by 'T' or ' ' and a time part
     * (which is ignored). Returns nullopt for anything else, including
     * out-of-range months and days.
     */
    static std::optional<CivilDate> parseDate(std::string_view text);

    /**
     * @brief Resolve "today", "now" and "yesterday" relative to @p now, or parse an ISO date.
     */
    static Result<CivilDate> parseDateOrNatural(const std::string& text, TimePoint now);

    // Local calendar date of a time point
    static CivilDate localDate(TimePoint tp);

    // Days since 1970-01-01 for a proleptic Gregorian date
    static std::int64_t daysFromCivil(const CivilDate& date) noexcept;

    // Whole calendar days from @p date to the local date of @p now (negative for future dates)
    static std::int64_t daysSince(const CivilDate& date, TimePoint now);

    static std::string formatDate(const CivilDate& date);
    static std::string formatDate(TimePoint tp);

    // Local date-time without zone suffix, e.g. 2026-02-01T09:30:00
    static std::string formatLocalDateTime(TimePoint tp);
};

} // namespace recall::core
