// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/core/time_parser.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace recall::core {

namespace {

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int y, unsigned m) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) {
        return 29;
    }
    return kDays[m - 1];
}

std::tm toLocalTm(TimePoint tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

bool allDigits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::optional<CivilDate> TimeParser::parseDate(std::string_view text) {
    if (text.size() < 10) {
        return std::nullopt;
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }
    auto y = text.substr(0, 4);
    auto m = text.substr(5, 2);
    auto d = text.substr(8, 2);
    if (text[4] != '-' || text[7] != '-' || !allDigits(y) || !allDigits(m) || !allDigits(d)) {
        return std::nullopt;
    }

    CivilDate date;
    date.year = std::stoi(std::string(y));
    date.month = static_cast<unsigned>(std::stoi(std::string(m)));
    date.day = static_cast<unsigned>(std::stoi(std::string(d)));
    if (date.month < 1 || date.month > 12) {
        return std::nullopt;
    }
    if (date.day < 1 || date.day > daysInMonth(date.year, date.month)) {
        return std::nullopt;
    }
    return date;
}

Result<CivilDate> TimeParser::parseDateOrNatural(const std::string& text, TimePoint now) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "today" || lower == "now") {
        return localDate(now);
    }
    if (lower == "yesterday") {
        return localDate(now - std::chrono::hours(24));
    }
    if (auto d = parseDate(text)) {
        return *d;
    }
    return Error{ErrorCode::InvalidArgument,
                 "Invalid date '" + text + "'. Use YYYY-MM-DD, today or yesterday"};
}

CivilDate TimeParser::localDate(TimePoint tp) {
    auto tm = toLocalTm(tp);
    return CivilDate{tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                     static_cast<unsigned>(tm.tm_mday)};
}

// Howard Hinnant's days_from_civil
std::int64_t TimeParser::daysFromCivil(const CivilDate& date) noexcept {
    int y = date.year - (date.month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = (date.month + 9) % 12;
    const unsigned doy = (153 * mp + 2) / 5 + date.day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::int64_t TimeParser::daysSince(const CivilDate& date, TimePoint now) {
    return daysFromCivil(localDate(now)) - daysFromCivil(date);
}

std::string TimeParser::formatDate(const CivilDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month
        << '-' << std::setw(2) << date.day;
    return oss.str();
}

std::string TimeParser::formatDate(TimePoint tp) {
    return formatDate(localDate(tp));
}

std::string TimeParser::formatLocalDateTime(TimePoint tp) {
    auto tm = toLocalTm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace recall::core
