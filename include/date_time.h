// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace sportslog {

/**
 * @brief Calendar date (proleptic Gregorian)
 */
struct Date {
    int year = 1970;
    int month = 1; ///< 1-12
    int day = 1;   ///< 1-31

    /**
     * @brief Check that month and day are within the month's range
     */
    [[nodiscard]] bool is_valid() const;
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}
inline bool operator<(const Date& a, const Date& b) {
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}
inline bool operator>(const Date& a, const Date& b) {
    return b < a;
}
inline bool operator<=(const Date& a, const Date& b) {
    return !(b < a);
}
inline bool operator>=(const Date& a, const Date& b) {
    return !(a < b);
}

/**
 * @brief Local date and time of an entry (no time zone, second resolution)
 */
struct DateTime {
    Date date;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

inline bool operator==(const DateTime& a, const DateTime& b) {
    return a.date == b.date && a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}
inline bool operator!=(const DateTime& a, const DateTime& b) {
    return !(a == b);
}
inline bool operator<(const DateTime& a, const DateTime& b) {
    if (a.date != b.date) {
        return a.date < b.date;
    }
    return std::tie(a.hour, a.minute, a.second) < std::tie(b.hour, b.minute, b.second);
}

/**
 * @brief Days since 1970-01-01 (negative before)
 */
[[nodiscard]] int days_from_epoch(const Date& date);

/**
 * @brief Inverse of days_from_epoch()
 */
[[nodiscard]] Date date_from_epoch_days(int days);

/**
 * @brief Add (or subtract, for negative values) whole days
 */
[[nodiscard]] Date add_days(const Date& date, int days);

/**
 * @brief Parse "YYYY-MM-DD"
 * @return Parsed date, or nullopt for malformed or out-of-range input
 */
[[nodiscard]] std::optional<Date> parse_date(std::string_view s);

/**
 * @brief Parse "YYYY-MM-DD HH:MM" or "YYYY-MM-DD HH:MM:SS" ('T' separator accepted)
 */
[[nodiscard]] std::optional<DateTime> parse_date_time(std::string_view s);

/// "YYYY-MM-DD"
std::string to_string(const Date& date);

/// "YYYY-MM-DD HH:MM:SS"
std::string to_string(const DateTime& date_time);

/**
 * @brief Today's date in local time
 */
Date today();

} // namespace sportslog
